#include <cmath>
#include <iostream>
#include <limits>

#include "aurora/core/color.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(float a, float b, float eps) { return std::fabs(a - b) <= eps; }

} // namespace

int test_color() {
  using aurora::Vec3;
  namespace color = aurora::color;

  // OKLab white and black.
  {
    const Vec3 w = color::oklab_to_linear_srgb(color::Lab(1.0f, 0.0f, 0.0f));
    AURORA_ASSERT(near(w.x, 1.0f, 1e-3f));
    AURORA_ASSERT(near(w.y, 1.0f, 1e-3f));
    AURORA_ASSERT(near(w.z, 1.0f, 1e-3f));

    const Vec3 k = color::oklab_to_linear_srgb(color::Lab(0.0f, 0.0f, 0.0f));
    AURORA_ASSERT(k.x == 0.0f && k.y == 0.0f && k.z == 0.0f);
  }

  // Forward/back conversion of an in-gamut colour.
  {
    const Vec3 rgb(0.2f, 0.6f, 0.35f);
    const Vec3 back = color::oklab_to_linear_srgb(color::linear_srgb_to_oklab(rgb));
    AURORA_ASSERT(near(back.x, rgb.x, 1e-3f));
    AURORA_ASSERT(near(back.y, rgb.y, 1e-3f));
    AURORA_ASSERT(near(back.z, rgb.z, 1e-3f));
  }

  // The default green anchor really is green.
  {
    const Vec3 g = color::oklab_to_linear_srgb(color::Lab(0.87f, -0.19f, 0.09f));
    AURORA_ASSERT(g.y > g.x);
    AURORA_ASSERT(g.y > g.z);
  }

  // sRGB encoding.
  AURORA_ASSERT(color::linear_to_srgb_u8(0.0f) == 0);
  AURORA_ASSERT(color::linear_to_srgb_u8(1.0f) == 255);
  AURORA_ASSERT(color::linear_to_srgb_u8(-3.0f) == 0);
  AURORA_ASSERT(color::linear_to_srgb_u8(42.0f) == 255);
  AURORA_ASSERT(color::linear_to_srgb_u8(std::numeric_limits<float>::infinity()) == 255);
  AURORA_ASSERT(color::linear_to_srgb_u8(std::numeric_limits<float>::quiet_NaN()) == 0);
  // Mid grey: linear 0.2140 encodes to about 128.
  {
    const int v = color::linear_to_srgb_u8(0.2140f);
    AURORA_ASSERT(v >= 127 && v <= 129);
  }

  // Decode/encode is stable on every code.
  for (int c = 0; c <= 255; ++c) {
    const Vec3 lin = color::srgb_u8_to_linear(c, c, c);
    AURORA_ASSERT(color::linear_to_srgb_u8(lin.x) == c);
  }

  return 0;
}
