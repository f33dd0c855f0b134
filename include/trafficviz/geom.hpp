#pragma once
#include <cstdint>
#include <numbers>

namespace trafficviz {

// Constant naming convention (kCamelCase)
inline constexpr double kPI       = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

// Point in either simulation space (meters) or screen space (pixels).
struct Vec2 {
  double x{};
  double y{};
};

inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2& a, const Vec2& b) { return !(a == b); }

// Axis-aligned screen rectangle (top-left origin).
struct Rect {
  double x{};
  double y{};
  double width{};
  double height{};

  // Grow (positive) or shrink (negative) by d pixels on each axis, keeping the center.
  Rect inflated(double dx, double dy) const {
    return Rect{x - dx * 0.5, y - dy * 0.5, width + dx, height + dy};
  }
};

struct Rgba {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};
  std::uint8_t a{255};
};

inline bool operator==(const Rgba& l, const Rgba& r) {
  return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
}
inline bool operator!=(const Rgba& l, const Rgba& r) { return !(l == r); }

} // namespace trafficviz
