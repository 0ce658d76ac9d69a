#include <cmath>
#include <iostream>

#include "aurora/core/composite.h"
#include "aurora/core/sky_params.h"
#include "aurora/core/sky_shader.h"
#include "aurora/core/stars.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool same(const aurora::Rgba& a, const aurora::Rgba& b) { return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a; }

} // namespace

int test_sky_shader() {
  using aurora::Vec2;
  using aurora::Vec3;

  const aurora::SkyParams params;

  // Deterministic and alpha always in [0.1, 1].
  for (int ti = 0; ti < 5; ++ti) {
    const float t = 0.5f + 13.0f * static_cast<float>(ti);
    for (int i = 0; i < 256; ++i) {
      const Vec2 c((static_cast<float>(i % 16) + 0.5f) / 16.0f, (static_cast<float>(i / 16) + 0.5f) / 16.0f);
      const aurora::Rgba a = aurora::shade_sky(c, t, params);
      const aurora::Rgba b = aurora::shade_sky(c, t, params);
      AURORA_ASSERT(same(a, b));
      AURORA_ASSERT(a.a >= 0.1f - 1e-7f && a.a <= 1.0f + 1e-6f);
      AURORA_ASSERT(std::isfinite(a.r) && std::isfinite(a.g) && std::isfinite(a.b));
    }
  }

  // Warm-up frame: background plus stars only, alpha exactly at the floor.
  for (int i = 0; i < 64; ++i) {
    const Vec2 c((static_cast<float>(i % 8) + 0.5f) / 8.0f, (static_cast<float>(i / 8) + 0.5f) / 8.0f);
    const float t = 0.05f;
    const aurora::Rgba px = aurora::shade_sky(c, t, params);
    const Vec3 want = aurora::sky_background(c, params.composite) + aurora::stars(c, t, params.stars);
    AURORA_ASSERT(px.r == want.x && px.g == want.y && px.b == want.z);
    AURORA_ASSERT(px.a == aurora::sky_alpha(0.0f));
  }

  // warmup_time = 0 disables the warm-up frame.
  {
    aurora::SkyParams p = params;
    p.warmup_time = 0.0f;
    const Vec2 c(0.5f, 0.5f);
    const aurora::Rgba px = aurora::shade_sky(c, 0.05f, p);
    const aurora::Rgba full = aurora::composite(aurora::sample_layers(c, 0.05f, p), p.composite);
    AURORA_ASSERT(same(px, full));
  }

  // time_scale multiplies host time.
  {
    aurora::SkyParams fast = params;
    fast.time_scale = 2.0f;
    for (int i = 0; i < 32; ++i) {
      const Vec2 c((static_cast<float>(i) + 0.5f) / 32.0f, 0.55f);
      AURORA_ASSERT(same(aurora::shade_sky(c, 3.0f, fast), aurora::shade_sky(c, 6.0f, params)));
    }
  }

  // With the aurora layer off, alpha sits at the floor everywhere.
  {
    aurora::SkyParams p = params;
    p.layers.aurora = false;
    for (int i = 0; i < 64; ++i) {
      const Vec2 c((static_cast<float>(i % 8) + 0.5f) / 8.0f, (static_cast<float>(i / 8) + 0.5f) / 8.0f);
      AURORA_ASSERT(aurora::shade_sky(c, 9.0f, p).a == aurora::sky_alpha(0.0f));
    }
  }

  // Layer toggles remove their contribution.
  {
    aurora::SkyParams p = params;
    p.layers.nebula = false;
    p.layers.dust = false;
    p.layers.shooting_stars = false;
    const aurora::LayerSample s = aurora::sample_layers(Vec2(0.3f, 0.7f), 9.0f, p);
    AURORA_ASSERT(s.nebula == Vec3(0.0f));
    AURORA_ASSERT(s.dust == Vec3(0.0f));
    AURORA_ASSERT(s.comets == Vec3(0.0f));
  }

  // The aurora lifts alpha above the floor somewhere on screen.
  {
    float max_a = 0.0f;
    for (int i = 0; i < 400; ++i) {
      const Vec2 c((static_cast<float>(i % 40) + 0.5f) / 40.0f, 0.3f + static_cast<float>(i / 40) * 0.04f);
      max_a = std::fmax(max_a, aurora::shade_sky(c, 12.0f, params).a);
    }
    AURORA_ASSERT(max_a > 0.2f);
  }

  return 0;
}
