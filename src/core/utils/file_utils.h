#pragma once

#include <string>
#include <string_view>

#include "../types.h"

namespace pn {
namespace file {

// Read entire file to string
Result<std::string> readText(const Path& path);

// Write string to file
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// File queries
bool exists(const Path& path);
bool isFile(const Path& path);

// Create parent directories as needed
[[nodiscard]] bool createDirectories(const Path& path);

// Get filename without extension
std::string getStem(const Path& path);

} // namespace file
} // namespace pn
