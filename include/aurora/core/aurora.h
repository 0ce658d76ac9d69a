#pragma once

#include "aurora/core/color.h"
#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

struct AuroraSample {
  Vec3 rgb;              // linear RGB, unclamped
  float intensity{0.0f}; // in [0, 1]
};

// Scalar fields of one band before colouring. Useful for tests and the
// viewer's debug overlay.
struct AuroraBandFields {
  float noise{0.0f};       // large-scale fbm
  float displaced_x{0.0f}; // curtain-wave displaced x
  float flow{0.0f};        // [0,1]
  float height_mask{0.0f}; // [0,1]
  float base{0.0f};        // flow * height_mask * noise gate, [0,1]
  float intensity{0.0f};   // after detail layers, surges and rays, [0,1]
};

// smoothstep(0, 0.7, 1 - |y - center_y| * height_falloff): 1 on the band's
// centre row, fading towards the top and bottom.
float aurora_height_mask(float y, const AuroraBandParams& band);

// Slow periodic gate for whole-curtain surges, in [0,1].
float aurora_surge(float time, const AuroraExtrasParams& extras);

// Slow periodic gate for curtain rays, in [0,1]. phase is the band's ray_phase.
float aurora_ray_gate(float time, float phase, const AuroraExtrasParams& extras);

AuroraBandFields aurora_band_fields(Vec2 coord, float time, const AuroraBandParams& band,
                                    const AuroraExtrasParams& extras);

// OKLab colour of a band before intensity scaling:
//   mix(mix(A0, A1, t1), mix(A2, A3, t2), smoothstep(0, dist_range, |coord - centre|))
// At the screen centre this is exactly mix(A0, A1, t1).
color::Lab aurora_band_lab(Vec2 coord, float time, const AuroraBandParams& band);

// One band: intensity fields, OKLab colour scaled by intensity, glow.
AuroraSample aurora_band(Vec2 coord, float time, const AuroraBandParams& band, const AuroraExtrasParams& extras);

// All enabled bands combined. Colours add; intensities combine as a screen
// blend so the result stays in [0, 1].
AuroraSample aurora(Vec2 coord, float time, const AuroraParams& p);

} // namespace aurora
