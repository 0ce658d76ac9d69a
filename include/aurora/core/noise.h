#pragma once

// Deterministic hash / value-noise / fBm primitives.
//
// These are the building blocks of every sky layer. Design constraints:
//  - Deterministic: same input, same output, on every call and every thread.
//  - Pure: no state, so pixels can be evaluated in any order.
//  - Bounded: hash2 in [0,1), value_noise2 in [0,1], fbm in [0, 1 - 0.5^octaves].

#include <cmath>

#include "aurora/core/shading.h"

namespace aurora::noise {

// Upper bound on fbm octaves; keeps every loop trip count small and fixed.
inline constexpr int kMaxOctaves = 8;

// Signature of a 2D hash. Layers accept one so tests can substitute a double.
using Hash2Fn = float (*)(Vec2);

// sin-dot-fract hash of a 2D point.
//
// The product is formed in double precision: in float, sin(x) * 43758.5453 is
// quantized to 1/256 steps, which visibly biases thresholds near 1.
inline float hash2(Vec2 p) {
  const double d = static_cast<double>(p.x) * 127.1 + static_cast<double>(p.y) * 311.7;
  const double s = std::sin(d) * 43758.5453;
  const float f = static_cast<float>(s - std::floor(s));
  return std::min(f, kBelowOne);
}

// Smoothstep-weighted bilinear interpolation of hash2 on the integer lattice.
inline float value_noise2(Vec2 p) {
  const Vec2 i = floor(p);
  const Vec2 f = fract(p);
  const float ux = f.x * f.x * (3.0f - 2.0f * f.x);
  const float uy = f.y * f.y * (3.0f - 2.0f * f.y);

  const float a = hash2(i);
  const float b = hash2(i + Vec2(1.0f, 0.0f));
  const float c = hash2(i + Vec2(0.0f, 1.0f));
  const float d = hash2(i + Vec2(1.0f, 1.0f));

  const float v = mix(mix(a, b, ux), mix(c, d, ux), uy);
  return saturate(v);
}

// Fractal sum of value noise: amplitude starts at 0.5 and halves, frequency
// doubles. Octaves are clamped to [1, kMaxOctaves].
inline float fbm(Vec2 p, int octaves) {
  const int oct = std::max(1, std::min(octaves, kMaxOctaves));
  float sum = 0.0f;
  float amp = 0.5f;
  for (int i = 0; i < oct; ++i) {
    sum += amp * value_noise2(p);
    p = p * 2.0f;
    amp *= 0.5f;
  }
  return sum;
}

} // namespace aurora::noise
