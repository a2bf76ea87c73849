#include "file_utils.h"

#include <fstream>
#include <iterator>

#include "log.h"

namespace pn {
namespace file {

Result<std::string> readText(const Path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

bool writeText(const Path& path, std::string_view content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for writing: %s", path.string().c_str());
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isFile(const Path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool createDirectories(const Path& path) {
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        log::errorf("FileIO", "Failed to create directories: %s (%s)", path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return true;
}

std::string getStem(const Path& path) {
    return path.stem().string();
}

} // namespace file
} // namespace pn
