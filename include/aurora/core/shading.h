#pragma once

// Small float vector types and GLSL-style helpers shared by every sky layer.
//
// The sky is a port of a fragment shader, so these follow shader semantics
// (smoothstep with explicit edges, mix, fract) rather than the double-precision
// helpers used elsewhere for configuration.

#include <algorithm>
#include <cmath>

namespace aurora {

struct Vec2 {
  float x{0.0f};
  float y{0.0f};

  Vec2() = default;
  Vec2(float x_, float y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  Vec2 operator*(const Vec2& rhs) const { return {x * rhs.x, y * rhs.y}; }

  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }
};

struct Vec3 {
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};

  Vec3() = default;
  Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
  explicit Vec3(float s) : x(s), y(s), z(s) {}

  Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
  Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
  Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
  Vec3 operator*(const Vec3& rhs) const { return {x * rhs.x, y * rhs.y, z * rhs.z}; }

  Vec3& operator+=(const Vec3& rhs) {
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    return *this;
  }

  bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
  bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }
};

// Linear RGB plus coverage.
struct Rgba {
  float r{0.0f};
  float g{0.0f};
  float b{0.0f};
  float a{0.0f};
};

// Largest float strictly below 1.
inline constexpr float kBelowOne = 0.99999994f;

inline float dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
inline float length(const Vec2& v) { return std::sqrt(dot(v, v)); }

inline Vec2 floor(const Vec2& v) { return {std::floor(v.x), std::floor(v.y)}; }

// x - floor(x), folded into [0,1). Tiny negative inputs round to exactly 1.0
// in float, which would break the [0,1) contract of the hashes.
inline float fract(float x) { return std::min(x - std::floor(x), kBelowOne); }
inline Vec2 fract(const Vec2& v) { return {fract(v.x), fract(v.y)}; }

inline float clamp(float x, float lo, float hi) { return std::min(std::max(x, lo), hi); }
inline float saturate(float x) { return clamp(x, 0.0f, 1.0f); }

inline float mix(float a, float b, float t) { return a + (b - a) * t; }
inline Vec3 mix(const Vec3& a, const Vec3& b, float t) { return a + (b - a) * t; }

inline float smoothstep(float edge0, float edge1, float x) {
  const float t = saturate((x - edge0) / (edge1 - edge0));
  return t * t * (3.0f - 2.0f * t);
}

} // namespace aurora
