#pragma once

#include <string>
#include <string_view>

namespace pn {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Case conversion
std::string toLower(std::string_view s);

// Check prefix
bool startsWith(std::string_view s, std::string_view prefix);

// Replace all occurrences
std::string replace(std::string_view s, std::string_view from, std::string_view to);

// Lower-case, trimmed, with '-' and ' ' folded to '_' ("Cut-Optimized" -> "cut_optimized")
std::string normalizeKey(std::string_view s);

// Parse number from string
bool parseInt(std::string_view s, int& out);
bool parseFloat(std::string_view s, float& out);

} // namespace str
} // namespace pn
