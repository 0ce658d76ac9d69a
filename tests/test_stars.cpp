#include <iostream>
#include <random>

#include "aurora/core/noise.h"
#include "aurora/core/sky_params.h"
#include "aurora/core/stars.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

float zero_hash(aurora::Vec2) { return 0.0f; }

// Every cell holds a star, centred, at the largest size.
float full_hash(aurora::Vec2 p) {
  (void)p;
  return 0.5f;
}

bool is_black(const aurora::Vec3& c) { return c.x == 0.0f && c.y == 0.0f && c.z == 0.0f; }

} // namespace

int test_stars() {
  using aurora::Vec2;
  using aurora::Vec3;

  const aurora::StarFieldParams params;

  // Sparsity: with stars pinned to their cell centres, the share of lit cells
  // tracks 1 - threshold, and each lit cell is one whose offset hash clears
  // the threshold.
  {
    aurora::StarLayerParams layer = params.layers[1];
    layer.jitter = 0.0f;
    const float threshold = layer.threshold;

    std::mt19937 rng(20240611u);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    int lit = 0;
    const int samples = 40000;
    for (int i = 0; i < samples; ++i) {
      const Vec2 cell = aurora::floor(Vec2(unit(rng), unit(rng)) * layer.grid_scale);
      const Vec2 centre = (cell + Vec2(0.5f, 0.5f)) * (1.0f / layer.grid_scale);
      const bool star = !is_black(aurora::star_layer(centre, 1.5f, layer, params.palette));
      const bool expected = aurora::noise::hash2(cell + layer.seed_offset) > threshold;
      AURORA_ASSERT(star == expected);
      if (star) ++lit;
    }
    const double frac = static_cast<double>(lit) / static_cast<double>(samples);
    const double want = 1.0 - static_cast<double>(threshold);
    AURORA_ASSERT(frac > want * 0.5);
    AURORA_ASSERT(frac < want * 1.5);

    // A different seed offset picks a different set of cells at the same rate.
    aurora::StarLayerParams moved = layer;
    moved.seed_offset = layer.seed_offset + Vec2(211.0f, -57.0f);
    int differ = 0;
    for (int y = 0; y < 90; ++y) {
      for (int x = 0; x < 90; ++x) {
        const Vec2 centre((static_cast<float>(x) + 0.5f) / layer.grid_scale, (static_cast<float>(y) + 0.5f) / layer.grid_scale);
        const bool a = !is_black(aurora::star_layer(centre, 1.5f, layer, params.palette));
        const bool b = !is_black(aurora::star_layer(centre, 1.5f, moved, params.palette));
        if (a != b) ++differ;
      }
    }
    AURORA_ASSERT(differ > 0);
  }

  // A hash that never clears any threshold gives exactly black, at any time.
  for (int i = 0; i < 200; ++i) {
    const Vec2 c(static_cast<float>(i % 20) / 20.0f + 0.013f, static_cast<float>(i / 20) / 10.0f + 0.021f);
    AURORA_ASSERT(is_black(aurora::stars(c, 3.7f * static_cast<float>(i), params, &zero_hash)));
  }

  // With every cell populated, a cell centre is lit and cell corners beyond the
  // star radius are not (halo disabled).
  {
    aurora::StarFieldParams p;
    aurora::StarLayerParams& l = p.layers[1];
    l.threshold = 0.25f;
    l.halo = 0.0f;
    const Vec2 centre((10.5f) / l.grid_scale, (20.5f) / l.grid_scale);
    const Vec3 lit = aurora::star_layer(centre, 1.0f, l, p.palette, &full_hash);
    AURORA_ASSERT(lit.x > 0.0f && lit.y > 0.0f && lit.z > 0.0f);

    const Vec2 corner((10.02f) / l.grid_scale, (20.02f) / l.grid_scale);
    AURORA_ASSERT(is_black(aurora::star_layer(corner, 1.0f, l, p.palette, &full_hash)));
  }

  // Twinkle keeps brightness within [1 - amount, 1] of the peak.
  {
    aurora::StarFieldParams p;
    aurora::StarLayerParams& l = p.layers[1];
    l.threshold = 0.25f;
    const Vec2 centre(10.5f / l.grid_scale, 20.5f / l.grid_scale);
    float lo = 1e9f;
    float hi = 0.0f;
    for (int i = 0; i < 400; ++i) {
      const float g = aurora::star_layer(centre, 0.05f * static_cast<float>(i), l, p.palette, &full_hash).y;
      lo = g < lo ? g : lo;
      hi = g > hi ? g : hi;
    }
    AURORA_ASSERT(hi > 0.0f);
    AURORA_ASSERT(lo >= hi * (1.0f - l.twinkle_amount) - 1e-4f);
    AURORA_ASSERT(lo < hi);
  }

  // Spectral buckets.
  {
    const aurora::StarPalette& pal = params.palette;
    const Vec3 warm = aurora::star_color(0.1f, 0.0f, pal);
    const Vec3 blue = aurora::star_color(0.95f, 1.0f, pal);
    AURORA_ASSERT(warm.x > warm.z);
    AURORA_ASSERT(blue.z > blue.x);
  }

  // The real field is sparse: most pixels of a row are black, none negative.
  {
    int dark = 0;
    for (int x = 0; x < 1000; ++x) {
      const Vec3 c = aurora::stars(Vec2(static_cast<float>(x) / 1000.0f, 0.37f), 5.0f, params);
      AURORA_ASSERT(c.x >= 0.0f && c.y >= 0.0f && c.z >= 0.0f);
      if (is_black(c)) ++dark;
    }
    AURORA_ASSERT(dark > 800);
  }

  // Dust is faint and non-negative.
  for (int i = 0; i < 300; ++i) {
    const Vec3 d = aurora::star_dust(Vec2(static_cast<float>(i) * 0.0033f, 0.5f), 2.0f, params);
    AURORA_ASSERT(d.x >= 0.0f && d.x <= params.dust_strength * params.dust_tint.x + 1e-6f);
  }

  return 0;
}
