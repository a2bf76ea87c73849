#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace pn {
namespace str {

std::string trim(std::string_view s) {
    return trimRight(trimLeft(s));
}

std::string trimLeft(std::string_view s) {
    auto it = std::find_if(s.begin(), s.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(it, s.end());
}

std::string trimRight(std::string_view s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(s.begin(), it.base());
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    if (prefix.length() > s.length()) {
        return false;
    }
    return s.substr(0, prefix.length()) == prefix;
}

std::string replace(std::string_view s, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return std::string(s);
    }

    std::string result;
    result.reserve(s.length());

    size_t pos = 0;
    size_t prev = 0;

    while ((pos = s.find(from, prev)) != std::string_view::npos) {
        result.append(s.substr(prev, pos - prev));
        result.append(to);
        prev = pos + from.length();
    }

    result.append(s.substr(prev));
    return result;
}

std::string normalizeKey(std::string_view s) {
    std::string key = toLower(trim(s));
    key = replace(key, "-", "_");
    return replace(key, " ", "_");
}

bool parseInt(std::string_view s, int& out) {
    auto result = std::from_chars(s.data(), s.data() + s.size(), out);
    return result.ec == std::errc{} && result.ptr == s.data() + s.size();
}

bool parseFloat(std::string_view s, float& out) {
    char* end = nullptr;
    std::string str(s);
    out = std::strtof(str.c_str(), &end);
    return !str.empty() && end == str.c_str() + str.size();
}

}  // namespace str
}  // namespace pn
