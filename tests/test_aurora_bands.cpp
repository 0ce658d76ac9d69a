#include <cmath>
#include <iostream>

#include "aurora/core/aurora.h"
#include "aurora/core/color.h"
#include "aurora/core/sky_params.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(float a, float b, float eps) { return std::fabs(a - b) <= eps; }

aurora::AuroraExtrasParams no_extras() {
  aurora::AuroraExtrasParams ex;
  ex.fine_detail = false;
  ex.cross_detail = false;
  ex.wisps = false;
  ex.surges = false;
  ex.curtain_rays = false;
  return ex;
}

} // namespace

int test_aurora_bands() {
  using aurora::Vec2;
  using aurora::Vec3;

  const aurora::AuroraParams params;

  // Intensity stays in [0,1] everywhere, with every extension enabled and at
  // times that hit surges and rays.
  for (int ti = 0; ti < 12; ++ti) {
    const float t = 0.1f + 37.3f * static_cast<float>(ti);
    for (int y = 0; y < 24; ++y) {
      for (int x = 0; x < 24; ++x) {
        const Vec2 c((static_cast<float>(x) + 0.5f) / 24.0f, (static_cast<float>(y) + 0.5f) / 24.0f);
        const aurora::AuroraSample s = aurora::aurora(c, t, params);
        AURORA_ASSERT(s.intensity >= 0.0f && s.intensity <= 1.0f);
        AURORA_ASSERT(std::isfinite(s.rgb.x) && std::isfinite(s.rgb.y) && std::isfinite(s.rgb.z));
      }
    }
  }

  // Even with absurd strengths the clamp holds.
  {
    aurora::AuroraParams hot = params;
    hot.primary.detail_strength = 50.0f;
    hot.extras.surge_boost = 20.0f;
    hot.extras.ray_strength = 30.0f;
    for (int i = 0; i < 400; ++i) {
      const Vec2 c(static_cast<float>(i % 20) / 20.0f, static_cast<float>(i / 20) / 20.0f);
      const float v = aurora::aurora(c, 3.0f + static_cast<float>(i), hot).intensity;
      AURORA_ASSERT(v >= 0.0f && v <= 1.0f);
    }
  }

  // The height mask is exactly 1 on the band's centre row and 0 far from it.
  AURORA_ASSERT(aurora::aurora_height_mask(params.primary.center_y, params.primary) == 1.0f);
  AURORA_ASSERT(aurora::aurora_height_mask(params.primary.center_y + 0.6f, params.primary) == 0.0f);
  AURORA_ASSERT(aurora::aurora_height_mask(params.secondary.center_y, params.secondary) == 1.0f);

  // Centre scenario: at (0.5, 0.5) the colour is the pure blend of the first two
  // anchors, mix(A0, A1, t1), for any time.
  for (int i = 0; i < 8; ++i) {
    const float t = 1.0f + 9.7f * static_cast<float>(i);
    const aurora::AuroraBandParams& b = params.primary;
    const float t1 = 0.5f + 0.5f * std::sin(t * b.blend_speed1 + b.blend_phase);
    const aurora::color::Lab want = aurora::mix(b.anchors[0], b.anchors[1], t1);
    const aurora::color::Lab got = aurora::aurora_band_lab(Vec2(0.5f, 0.5f), t, b);
    AURORA_ASSERT(near(got.x, want.x, 1e-6f));
    AURORA_ASSERT(near(got.y, want.y, 1e-6f));
    AURORA_ASSERT(near(got.z, want.z, 1e-6f));
  }

  // At time 0 (primary blend_phase 0) t1 is exactly 0.5.
  {
    const aurora::AuroraBandParams& b = params.primary;
    const aurora::color::Lab want = aurora::mix(b.anchors[0], b.anchors[1], 0.5f);
    AURORA_ASSERT(aurora::aurora_band_lab(Vec2(0.5f, 0.5f), 0.0f, b) == want);
  }

  // Far from the centre the edge anchors dominate.
  {
    const aurora::AuroraBandParams& b = params.primary;
    const float t = 4.0f;
    const float t2 = 0.5f + 0.5f * std::sin(t * b.blend_speed2 + b.blend_phase + 1.7f);
    const aurora::color::Lab want = aurora::mix(b.anchors[2], b.anchors[3], t2);
    const aurora::color::Lab got = aurora::aurora_band_lab(Vec2(0.0f, 1.0f), t, b);
    AURORA_ASSERT(near(got.x, want.x, 1e-5f));
    AURORA_ASSERT(near(got.z, want.z, 1e-5f));
  }

  // Without extras, the centre-row intensity is bounded by flow times the noise gate.
  {
    const aurora::AuroraExtrasParams ex = no_extras();
    aurora::AuroraBandParams b = params.primary;
    b.detail_strength = 0.0f;
    for (int i = 0; i < 50; ++i) {
      const Vec2 c(static_cast<float>(i) / 50.0f, b.center_y);
      const aurora::AuroraBandFields f = aurora::aurora_band_fields(c, 7.0f, b, ex);
      AURORA_ASSERT(f.height_mask == 1.0f);
      AURORA_ASSERT(near(f.base, f.flow * aurora::smoothstep(b.noise_lo, b.noise_hi, f.noise), 1e-6f));
      AURORA_ASSERT(near(f.intensity, aurora::saturate(f.base * b.strength), 1e-6f));
    }
  }

  // Disabled bands contribute nothing; one band alone equals that band.
  {
    aurora::AuroraParams off = params;
    off.primary.enabled = false;
    off.secondary.enabled = false;
    const aurora::AuroraSample s = aurora::aurora(Vec2(0.5f, 0.5f), 10.0f, off);
    AURORA_ASSERT(s.intensity == 0.0f);
    AURORA_ASSERT(s.rgb.x == 0.0f && s.rgb.y == 0.0f && s.rgb.z == 0.0f);

    aurora::AuroraParams one = params;
    one.secondary.enabled = false;
    for (int i = 0; i < 40; ++i) {
      const Vec2 c(static_cast<float>(i) / 40.0f, 0.5f);
      const aurora::AuroraSample a = aurora::aurora(c, 10.0f, one);
      const aurora::AuroraSample p = aurora::aurora_band(c, 10.0f, one.primary, one.extras);
      AURORA_ASSERT(near(a.intensity, p.intensity, 1e-6f));
    }
  }

  // Two bands combine as a screen blend: never dimmer than either band alone.
  for (int i = 0; i < 60; ++i) {
    const Vec2 c(static_cast<float>(i % 10) / 10.0f + 0.05f, 0.45f + static_cast<float>(i / 10) * 0.05f);
    const float t = 6.0f;
    const float a = aurora::aurora_band(c, t, params.primary, params.extras).intensity;
    const float b = aurora::aurora_band(c, t, params.secondary, params.extras).intensity;
    const float both = aurora::aurora(c, t, params).intensity;
    AURORA_ASSERT(both + 1e-6f >= a);
    AURORA_ASSERT(both + 1e-6f >= b);
  }

  // The curtain is actually visible somewhere around its centre row.
  {
    float peak = 0.0f;
    for (int ti = 0; ti < 6; ++ti) {
      for (int x = 0; x < 200; ++x) {
        const Vec2 c(static_cast<float>(x) / 200.0f, params.primary.center_y);
        peak = std::fmax(peak, aurora::aurora(c, 2.0f + 5.0f * static_cast<float>(ti), params).intensity);
      }
    }
    AURORA_ASSERT(peak > 0.1f);
  }

  // Surges and rays are off when disabled and bounded when enabled.
  {
    const aurora::AuroraExtrasParams ex = no_extras();
    AURORA_ASSERT(aurora::aurora_surge(5.0f, ex) == 0.0f);
    AURORA_ASSERT(aurora::aurora_ray_gate(5.0f, 0.0f, ex) == 0.0f);
    for (int i = 0; i < 500; ++i) {
      const float s = aurora::aurora_surge(static_cast<float>(i), params.extras);
      const float r = aurora::aurora_ray_gate(static_cast<float>(i), 0.0f, params.extras);
      AURORA_ASSERT(s >= 0.0f && s <= 1.0f);
      AURORA_ASSERT(r >= 0.0f && r <= 1.0f);
    }
  }

  // Ray timing follows the band's ray_phase, not its colour blend phase.
  {
    const float half_turn = 3.14159265f;
    AURORA_ASSERT(aurora::aurora_ray_gate(0.0f, 0.0f, params.extras) > 0.0f);
    AURORA_ASSERT(aurora::aurora_ray_gate(0.0f, half_turn, params.extras) == 0.0f);

    aurora::AuroraBandParams recoloured = params.primary;
    recoloured.blend_phase = 1.9f;
    aurora::AuroraBandParams silenced = params.primary;
    silenced.ray_phase = half_turn;
    aurora::AuroraExtrasParams rayless = params.extras;
    rayless.curtain_rays = false;

    for (int i = 0; i < 64; ++i) {
      const Vec2 c(static_cast<float>(i % 16) / 16.0f + 0.03f, params.primary.center_y + static_cast<float>(i / 16) * 0.05f);
      const float base = aurora::aurora_band_fields(c, 0.0f, params.primary, params.extras).intensity;
      AURORA_ASSERT(aurora::aurora_band_fields(c, 0.0f, recoloured, params.extras).intensity == base);
      AURORA_ASSERT(aurora::aurora_band_fields(c, 0.0f, silenced, params.extras).intensity ==
                    aurora::aurora_band_fields(c, 0.0f, params.primary, rayless).intensity);
    }
  }

  return 0;
}
