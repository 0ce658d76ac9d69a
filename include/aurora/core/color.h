#pragma once

#include <cstdint>

#include "aurora/core/shading.h"

namespace aurora::color {

// OKLab coordinates: x = L, y = a, z = b.
using Lab = Vec3;

// OKLab -> linear sRGB: rebuild the LMS' basis, cube each channel, then apply
// the fixed LMS -> linear sRGB matrix. Unclamped.
Vec3 oklab_to_linear_srgb(const Lab& lab);

// Linear sRGB -> OKLab (cube-root round trip of the above).
Lab linear_srgb_to_oklab(const Vec3& rgb);

// sRGB transfer function of a single linear channel, clamped to [0,1].
float linear_to_srgb(float linear);

// Linear channel -> 8-bit sRGB code value.
std::uint8_t linear_to_srgb_u8(float linear);

// Convenience for palette anchors written as 0..255 sRGB triplets.
Vec3 srgb_u8_to_linear(int r, int g, int b);

} // namespace aurora::color
