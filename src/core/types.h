#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pn {

// Filesystem
namespace fs = std::filesystem;
using Path = fs::path;

// Integer types
using i32 = std::int32_t;
using i64 = std::int64_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Floating point
using f32 = float;
using f64 = double;

// Size type
using usize = std::size_t;

// Axis-aligned rectangle, lower-left corner plus size
struct Rect {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 width{0.0f};
    f32 height{0.0f};

    Rect() = default;
    Rect(f32 x_, f32 y_, f32 w_, f32 h_) : x(x_), y(y_), width(w_), height(h_) {}

    f32 right() const { return x + width; }
    f32 top() const { return y + height; }
    f32 area() const { return width * height; }

    bool contains(const Rect& other) const {
        return other.x >= x && other.y >= y && other.right() <= right() &&
               other.top() <= top();
    }

    Rect inflated(f32 amount) const {
        return {x - amount, y - amount, width + 2.0f * amount, height + 2.0f * amount};
    }
};

// Common result type
template <typename T>
using Result = std::optional<T>;

} // namespace pn
