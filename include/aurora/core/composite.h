#pragma once

#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Per-pixel outputs of every layer, ready to be combined.
struct LayerSample {
  Vec3 background; // gradient * vignette
  Vec3 nebula;
  Vec3 stars;
  Vec3 dust;
  Vec3 comets;
  Vec3 aurora_rgb;
  float aurora_intensity{0.0f};
};

// Vertical gradient from sky_bottom (y = 0) to sky_top (y = 1).
Vec3 sky_gradient(float y, const CompositeParams& p);

// 1 in the middle of the screen, 1 - vignette_strength in the corners.
float sky_vignette(Vec2 coord, const CompositeParams& p);

Vec3 sky_background(Vec2 coord, const CompositeParams& p);

// Coverage of the aurora over the sky: clamp(intensity * gain, 0, blend_cap).
float aurora_blend(float intensity, const CompositeParams& p);

// Alpha reported with every shaded pixel. Never below 0.1.
inline float sky_alpha(float aurora_intensity) { return saturate(aurora_intensity) * 0.9f + 0.1f; }

Rgba composite(const LayerSample& s, const CompositeParams& p);

} // namespace aurora
