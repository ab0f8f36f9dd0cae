#pragma once
#include <cmath>

namespace canopy {

// Simple 2D vector used for node, attractor and spawn coordinates.
// World units are arbitrary; the viewer maps them to pixels via zoom.
struct Vec2 {
  float x{0.0f};
  float y{0.0f};

  Vec2() = default;
  Vec2(float x_, float y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  Vec2 operator/(float s) const { return {x / s, y / s}; }

  // Exact equality. Use with care for computed floating-point values; it is
  // primarily intended for tests against positions built from exact steps.
  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  Vec2& operator+=(const Vec2& rhs) {
    x += rhs.x;
    y += rhs.y;
    return *this;
  }

  float length() const { return std::sqrt(x * x + y * y); }
  float length_squared() const { return x * x + y * y; }

  // Returns the zero vector for (near) zero-length input instead of dividing by zero.
  Vec2 normalized() const {
    const float len = length();
    if (len <= kNormalizeEpsilon) return {0.0f, 0.0f};
    return {x / len, y / len};
  }

  bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }

  static constexpr float kNormalizeEpsilon = 1e-6f;
};

inline float distance_squared(const Vec2& a, const Vec2& b) { return (a - b).length_squared(); }

} // namespace canopy
