#pragma once

// Tunable constants of the night-sky effect.
//
// Defaults reproduce the canonical look (three star layers, nebula haze, three
// comets, two aurora bands with detail layers, surges and curtain rays). Every
// field can be overridden from a JSON document (see sky_params_json.h).

#include <array>
#include <string>
#include <vector>

#include "aurora/core/color.h"
#include "aurora/core/shading.h"

namespace aurora {

inline constexpr int kStarLayerCount = 3;
inline constexpr int kMaxComets = 8;

// One grid of candidate stars. Sizes are fractions of a grid cell.
struct StarLayerParams {
  float grid_scale{90.0f};  // cells per unit of screen
  float threshold{0.985f};  // a cell holds a star iff hash > threshold
  Vec2 seed_offset{0.0f, 0.0f};
  float jitter{0.5f};       // max offset of the star centre from the cell centre
  float size_min{0.12f};
  float size_max{0.25f};
  float brightness{0.8f};
  float halo{0.0f};         // soft glow around bright stars, 0 disables
  float twinkle_amount{0.35f};
  float twinkle_speed{2.1f};
};

// Spectral buckets. Anchors are linear RGB.
struct StarPalette {
  Vec3 warm{1.0f, 0.62f, 0.32f};
  Vec3 yellow{1.0f, 0.86f, 0.62f};
  Vec3 white{1.0f, 1.0f, 1.0f};
  Vec3 blue_white{0.62f, 0.76f, 1.0f};
  float warm_fraction{0.3f};
  float blue_fraction{0.25f};
};

std::array<StarLayerParams, kStarLayerCount> default_star_layers();

struct StarFieldParams {
  std::array<StarLayerParams, kStarLayerCount> layers = default_star_layers();
  StarPalette palette;

  // Faint speckle between the stars.
  float dust_scale{420.0f};
  float dust_threshold{0.82f};
  float dust_strength{0.045f};
  float dust_drift{0.004f};
  Vec3 dust_tint{0.75f, 0.8f, 1.0f};
};

struct NebulaParams {
  float scale{2.6f};
  Vec2 drift{0.010f, 0.004f};
  int octaves{5};
  float hue_scale{2.1f};
  float mask_scale{1.4f};
  float mask_lo{0.42f};
  float mask_hi{0.72f};
  Vec3 color_a{0.10f, 0.035f, 0.16f};
  Vec3 color_b{0.015f, 0.07f, 0.14f};
  float strength{0.55f};
};

// A single periodically triggered comet.
struct CometParams {
  float trigger_rate{0.31f};      // rad/s of the visibility trigger sinusoid
  float trigger_phase{0.0f};
  float trigger_threshold{0.72f}; // visible while sin(...) > threshold
  float rate{0.45f};              // flights per second while visible
  Vec2 start{0.15f, 0.95f};
  float angle{-0.55f};            // direction of travel, radians
  float travel{0.9f};             // distance covered per flight
  float length{0.14f};
  float width{0.0022f};
  Vec3 color{0.85f, 0.92f, 1.0f};
  float brightness{1.6f};
};

std::array<CometParams, kMaxComets> default_comets();

struct ShootingStarParams {
  int count{3};
  std::array<CometParams, kMaxComets> comets = default_comets();
};

// One aurora curtain.
struct AuroraBandParams {
  bool enabled{true};
  float strength{1.0f};

  // Large-scale structure: fbm over a vertically stretched, scrolling domain.
  Vec2 noise_scale{3.0f, 0.8f};
  Vec2 noise_offset{0.0f, 0.0f};
  float scroll_speed{0.05f};
  int octaves{5};

  // Curtain waves and directional flow.
  float wave_freq{6.0f};
  float wave_amp{0.08f};
  float wave_speed{0.3f};
  float flow_freq{8.0f};
  float flow_speed{0.6f};

  // Vertical placement.
  float center_y{0.5f};
  float height_falloff{2.0f};

  // smoothstep(noise_lo, noise_hi, n) suppresses the band in noise valleys.
  float noise_lo{0.25f};
  float noise_hi{0.7f};

  // High-frequency shimmer.
  Vec2 detail_scale{12.0f, 3.0f};
  float detail_speed{0.2f};
  float detail_strength{0.5f};

  // OKLab anchors: {A0, A1} blended by t1 near the centre,
  // {A2, A3} blended by t2 towards the edges.
  std::array<color::Lab, 4> anchors{{{0.87f, -0.19f, 0.09f},
                                     {0.81f, -0.13f, 0.0f},
                                     {0.61f, -0.03f, -0.20f},
                                     {0.60f, 0.13f, -0.22f}}};
  float blend_speed1{0.21f};
  float blend_speed2{0.13f};
  float blend_phase{0.0f};
  float dist_range{0.7f};

  float glow_dark{0.15f};
  float glow_strength{0.35f};

  // Offset of this band's curtain-ray cycle, added to extras.ray_phase.
  float ray_phase{0.0f};
};

AuroraBandParams default_secondary_band();

// Sub-layers layered onto each enabled band.
struct AuroraExtrasParams {
  bool fine_detail{true};
  float fine_scale{28.0f};
  float fine_strength{0.25f};

  bool cross_detail{true};
  float cross_freq{38.0f};
  float cross_speed{0.9f};
  float cross_strength{0.12f};

  bool wisps{true};
  float wisp_scale{5.0f};
  float wisp_strength{0.2f};

  // Rare brightening of the whole curtain.
  bool surges{true};
  float surge_rate{0.11f};
  float surge_threshold{0.82f};
  float surge_boost{0.6f};

  // Vertical rays rising from the curtain.
  bool curtain_rays{true};
  float ray_rate{0.07f};
  float ray_phase{1.3f};
  float ray_threshold{0.55f};
  float ray_density{46.0f};
  float ray_strength{0.35f};
};

struct AuroraParams {
  AuroraBandParams primary;
  AuroraBandParams secondary = default_secondary_band();
  AuroraExtrasParams extras;
};

struct CompositeParams {
  Vec3 sky_top{0.004f, 0.006f, 0.02f};
  Vec3 sky_bottom{0.015f, 0.03f, 0.06f};
  float vignette_strength{0.45f};
  float vignette_inner{0.35f};
  float vignette_outer{0.95f};

  // Aurora coverage: clamp(intensity * aurora_gain, 0, blend_cap).
  // blend_cap < 1 keeps stars visible through the densest curtain.
  float aurora_gain{1.4f};
  float blend_cap{0.85f};

  // Fraction of raw star light added back after the aurora blend.
  float star_reinject{0.3f};
};

struct LayerToggles {
  bool nebula{true};
  bool dust{true};
  bool shooting_stars{true};
  bool aurora{true};
};

struct SkyParams {
  // Host time is multiplied by this before use.
  float time_scale{1.0f};

  // Below this (scaled) time only the background and stars are drawn.
  // 0 disables the warm-up frame.
  float warmup_time{0.1f};

  LayerToggles layers;
  StarFieldParams stars;
  NebulaParams nebula;
  ShootingStarParams shooting_stars;
  AuroraParams aurora;
  CompositeParams composite;
};

// Returns a list of human-readable problems; empty means the parameters are
// usable. Checks ranges the shading code relies on (thresholds in [0,1),
// positive sizes, blend cap below 1, comet count bound, finite values).
std::vector<std::string> validate_sky_params(const SkyParams& p);

} // namespace aurora
