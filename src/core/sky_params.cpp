#include "aurora/core/sky_params.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "aurora/core/noise.h"

namespace aurora {

std::array<StarLayerParams, kStarLayerCount> default_star_layers() {
  std::array<StarLayerParams, kStarLayerCount> layers{};

  // Dense, dim background dust of stars.
  StarLayerParams& bg = layers[0];
  bg.grid_scale = 180.0f;
  bg.threshold = 0.97f;
  bg.seed_offset = Vec2(0.0f, 0.0f);
  bg.jitter = 0.4f;
  bg.size_min = 0.18f;
  bg.size_max = 0.32f;
  bg.brightness = 0.35f;
  bg.halo = 0.0f;
  bg.twinkle_amount = 0.15f;
  bg.twinkle_speed = 1.3f;

  // Primary layer.
  StarLayerParams& mid = layers[1];
  mid.grid_scale = 90.0f;
  mid.threshold = 0.985f;
  mid.seed_offset = Vec2(37.0f, 113.0f);
  mid.jitter = 0.5f;
  mid.size_min = 0.12f;
  mid.size_max = 0.25f;
  mid.brightness = 0.8f;
  mid.halo = 0.0f;
  mid.twinkle_amount = 0.35f;
  mid.twinkle_speed = 2.1f;

  // Sparse, bright foreground.
  StarLayerParams& fg = layers[2];
  fg.grid_scale = 40.0f;
  fg.threshold = 0.992f;
  fg.seed_offset = Vec2(251.0f, 19.0f);
  fg.jitter = 0.5f;
  fg.size_min = 0.08f;
  fg.size_max = 0.14f;
  fg.brightness = 1.4f;
  fg.halo = 0.12f;
  fg.twinkle_amount = 0.5f;
  fg.twinkle_speed = 2.9f;

  return layers;
}

std::array<CometParams, kMaxComets> default_comets() {
  std::array<CometParams, kMaxComets> comets{};

  CometParams& a = comets[0];
  a.trigger_rate = 0.31f;
  a.trigger_phase = 0.0f;
  a.trigger_threshold = 0.72f;
  a.rate = 0.45f;
  a.start = Vec2(0.15f, 0.95f);
  a.angle = -0.55f;
  a.travel = 0.9f;
  a.length = 0.14f;
  a.width = 0.0022f;
  a.color = Vec3(0.85f, 0.92f, 1.0f);
  a.brightness = 1.6f;

  CometParams& b = comets[1];
  b.trigger_rate = 0.23f;
  b.trigger_phase = 2.1f;
  b.trigger_threshold = 0.78f;
  b.rate = 0.38f;
  b.start = Vec2(0.85f, 0.9f);
  b.angle = -2.6f;
  b.travel = 0.8f;
  b.length = 0.11f;
  b.width = 0.0018f;
  b.color = Vec3(1.0f, 0.88f, 0.7f);
  b.brightness = 1.3f;

  CometParams& c = comets[2];
  c.trigger_rate = 0.17f;
  c.trigger_phase = 4.4f;
  c.trigger_threshold = 0.85f;
  c.rate = 0.6f;
  c.start = Vec2(0.4f, 1.0f);
  c.angle = -1.1f;
  c.travel = 0.7f;
  c.length = 0.18f;
  c.width = 0.0025f;
  c.color = Vec3(0.75f, 1.0f, 0.9f);
  c.brightness = 1.8f;

  // Spare slots inherit the first comet with shifted timing so enabling them
  // from a config does not stack every comet on the same trajectory.
  for (int i = 3; i < kMaxComets; ++i) {
    CometParams& s = comets[static_cast<std::size_t>(i)];
    s = a;
    s.trigger_phase = 0.9f * static_cast<float>(i);
    s.start = Vec2(0.1f + 0.11f * static_cast<float>(i), 0.97f);
    s.angle = -0.4f - 0.12f * static_cast<float>(i);
  }
  return comets;
}

AuroraBandParams default_secondary_band() {
  AuroraBandParams b;
  b.strength = 0.55f;
  b.noise_scale = Vec2(2.2f, 0.65f);
  b.noise_offset = Vec2(17.3f, 5.9f);
  b.scroll_speed = 0.035f;
  b.octaves = 4;
  b.wave_freq = 4.5f;
  b.wave_amp = 0.1f;
  b.wave_speed = 0.22f;
  b.flow_freq = 6.5f;
  b.flow_speed = 0.45f;
  b.center_y = 0.68f;
  b.height_falloff = 2.6f;
  b.noise_lo = 0.3f;
  b.noise_hi = 0.75f;
  b.detail_scale = Vec2(10.0f, 2.5f);
  b.detail_speed = 0.15f;
  b.detail_strength = 0.4f;
  // Red, pink, magenta, violet.
  b.anchors = {{{0.65f, 0.22f, 0.07f},
                {0.73f, 0.19f, -0.03f},
                {0.65f, 0.19f, -0.16f},
                {0.57f, 0.08f, -0.23f}}};
  b.blend_speed1 = 0.17f;
  b.blend_speed2 = 0.09f;
  b.blend_phase = 2.1f;
  b.dist_range = 0.8f;
  b.glow_dark = 0.1f;
  b.glow_strength = 0.25f;
  b.ray_phase = 2.1f;
  return b;
}

namespace {

class Checker {
 public:
  explicit Checker(std::vector<std::string>& out) : out_(out) {}

  void finite(const std::string& name, float v) {
    if (!std::isfinite(v)) add(name, "must be finite");
  }

  void positive(const std::string& name, float v) {
    if (!(std::isfinite(v) && v > 0.0f)) add(name, "must be > 0");
  }

  void non_negative(const std::string& name, float v) {
    if (!(std::isfinite(v) && v >= 0.0f)) add(name, "must be >= 0");
  }

  void unit_open(const std::string& name, float v) {
    if (!(std::isfinite(v) && v >= 0.0f && v < 1.0f)) add(name, "must be in [0, 1)");
  }

  void unit(const std::string& name, float v) {
    if (!(std::isfinite(v) && v >= 0.0f && v <= 1.0f)) add(name, "must be in [0, 1]");
  }

  void vec(const std::string& name, const Vec2& v) {
    finite(name + ".x", v.x);
    finite(name + ".y", v.y);
  }

  void vec(const std::string& name, const Vec3& v) {
    finite(name + ".x", v.x);
    finite(name + ".y", v.y);
    finite(name + ".z", v.z);
  }

  void ordered(const std::string& lo_name, float lo, const std::string& hi_name, float hi) {
    if (std::isfinite(lo) && std::isfinite(hi) && !(lo < hi)) {
      add(lo_name, "must be less than " + hi_name);
    }
  }

  void add(const std::string& name, const std::string& problem) { out_.push_back(name + " " + problem); }

 private:
  std::vector<std::string>& out_;
};

std::string indexed(const std::string& base, int i) {
  std::ostringstream ss;
  ss << base << "[" << i << "]";
  return ss.str();
}

void check_band(Checker& c, const std::string& n, const AuroraBandParams& b) {
  c.unit(n + ".strength", b.strength);
  c.positive(n + ".noise_scale.x", b.noise_scale.x);
  c.positive(n + ".noise_scale.y", b.noise_scale.y);
  c.vec(n + ".noise_offset", b.noise_offset);
  c.finite(n + ".scroll_speed", b.scroll_speed);
  if (b.octaves < 1 || b.octaves > noise::kMaxOctaves) c.add(n + ".octaves", "must be in [1, 8]");
  c.non_negative(n + ".wave_freq", b.wave_freq);
  c.non_negative(n + ".wave_amp", b.wave_amp);
  c.finite(n + ".wave_speed", b.wave_speed);
  c.non_negative(n + ".flow_freq", b.flow_freq);
  c.finite(n + ".flow_speed", b.flow_speed);
  c.finite(n + ".center_y", b.center_y);
  c.positive(n + ".height_falloff", b.height_falloff);
  c.ordered(n + ".noise_lo", b.noise_lo, n + ".noise_hi", b.noise_hi);
  c.vec(n + ".detail_scale", b.detail_scale);
  c.finite(n + ".detail_speed", b.detail_speed);
  c.non_negative(n + ".detail_strength", b.detail_strength);
  for (int i = 0; i < 4; ++i) c.vec(indexed(n + ".anchors", i), b.anchors[static_cast<std::size_t>(i)]);
  c.finite(n + ".blend_speed1", b.blend_speed1);
  c.finite(n + ".blend_speed2", b.blend_speed2);
  c.finite(n + ".blend_phase", b.blend_phase);
  c.positive(n + ".dist_range", b.dist_range);
  c.unit(n + ".glow_dark", b.glow_dark);
  c.non_negative(n + ".glow_strength", b.glow_strength);
  c.finite(n + ".ray_phase", b.ray_phase);
}

} // namespace

std::vector<std::string> validate_sky_params(const SkyParams& p) {
  std::vector<std::string> errors;
  Checker c(errors);

  c.finite("time_scale", p.time_scale);
  c.non_negative("warmup_time", p.warmup_time);

  for (int i = 0; i < kStarLayerCount; ++i) {
    const StarLayerParams& l = p.stars.layers[static_cast<std::size_t>(i)];
    const std::string n = indexed("stars.layers", i);
    c.positive(n + ".grid_scale", l.grid_scale);
    c.unit_open(n + ".threshold", l.threshold);
    c.vec(n + ".seed_offset", l.seed_offset);
    c.unit(n + ".jitter", l.jitter);
    c.positive(n + ".size_min", l.size_min);
    c.positive(n + ".size_max", l.size_max);
    if (l.size_max > 0.5f) c.add(n + ".size_max", "must be <= 0.5 (fraction of a cell)");
    if (l.size_min > l.size_max) c.add(n + ".size_min", "must not exceed size_max");
    c.non_negative(n + ".brightness", l.brightness);
    c.non_negative(n + ".halo", l.halo);
    c.unit(n + ".twinkle_amount", l.twinkle_amount);
    c.finite(n + ".twinkle_speed", l.twinkle_speed);
  }

  const StarPalette& pal = p.stars.palette;
  c.vec("stars.palette.warm", pal.warm);
  c.vec("stars.palette.yellow", pal.yellow);
  c.vec("stars.palette.white", pal.white);
  c.vec("stars.palette.blue_white", pal.blue_white);
  c.unit("stars.palette.warm_fraction", pal.warm_fraction);
  c.unit("stars.palette.blue_fraction", pal.blue_fraction);
  if (pal.warm_fraction + pal.blue_fraction > 1.0f) {
    c.add("stars.palette.warm_fraction", "plus blue_fraction must not exceed 1");
  }
  c.positive("stars.dust_scale", p.stars.dust_scale);
  c.unit_open("stars.dust_threshold", p.stars.dust_threshold);
  c.non_negative("stars.dust_strength", p.stars.dust_strength);
  c.finite("stars.dust_drift", p.stars.dust_drift);
  c.vec("stars.dust_tint", p.stars.dust_tint);

  const NebulaParams& neb = p.nebula;
  c.positive("nebula.scale", neb.scale);
  c.vec("nebula.drift", neb.drift);
  if (neb.octaves < 1 || neb.octaves > noise::kMaxOctaves) c.add("nebula.octaves", "must be in [1, 8]");
  c.positive("nebula.hue_scale", neb.hue_scale);
  c.positive("nebula.mask_scale", neb.mask_scale);
  c.ordered("nebula.mask_lo", neb.mask_lo, "nebula.mask_hi", neb.mask_hi);
  c.vec("nebula.color_a", neb.color_a);
  c.vec("nebula.color_b", neb.color_b);
  c.non_negative("nebula.strength", neb.strength);

  const ShootingStarParams& ss = p.shooting_stars;
  if (ss.count < 0 || ss.count > kMaxComets) {
    c.add("shooting_stars.count", "must be in [0, " + std::to_string(kMaxComets) + "]");
  }
  for (int i = 0; i < std::min(std::max(ss.count, 0), kMaxComets); ++i) {
    const CometParams& cm = ss.comets[static_cast<std::size_t>(i)];
    const std::string n = indexed("shooting_stars.comets", i);
    c.finite(n + ".trigger_rate", cm.trigger_rate);
    c.finite(n + ".trigger_phase", cm.trigger_phase);
    if (!(std::isfinite(cm.trigger_threshold) && cm.trigger_threshold > -1.0f && cm.trigger_threshold < 1.0f)) {
      c.add(n + ".trigger_threshold", "must be in (-1, 1)");
    }
    c.positive(n + ".rate", cm.rate);
    c.vec(n + ".start", cm.start);
    c.finite(n + ".angle", cm.angle);
    c.positive(n + ".travel", cm.travel);
    c.positive(n + ".length", cm.length);
    c.positive(n + ".width", cm.width);
    c.vec(n + ".color", cm.color);
    c.non_negative(n + ".brightness", cm.brightness);
  }

  check_band(c, "aurora.primary", p.aurora.primary);
  check_band(c, "aurora.secondary", p.aurora.secondary);

  const AuroraExtrasParams& ex = p.aurora.extras;
  c.positive("aurora.extras.fine_scale", ex.fine_scale);
  c.non_negative("aurora.extras.fine_strength", ex.fine_strength);
  c.non_negative("aurora.extras.cross_freq", ex.cross_freq);
  c.finite("aurora.extras.cross_speed", ex.cross_speed);
  c.non_negative("aurora.extras.cross_strength", ex.cross_strength);
  c.positive("aurora.extras.wisp_scale", ex.wisp_scale);
  c.non_negative("aurora.extras.wisp_strength", ex.wisp_strength);
  c.finite("aurora.extras.surge_rate", ex.surge_rate);
  c.unit_open("aurora.extras.surge_threshold", ex.surge_threshold);
  c.non_negative("aurora.extras.surge_boost", ex.surge_boost);
  c.finite("aurora.extras.ray_rate", ex.ray_rate);
  c.finite("aurora.extras.ray_phase", ex.ray_phase);
  c.unit_open("aurora.extras.ray_threshold", ex.ray_threshold);
  c.positive("aurora.extras.ray_density", ex.ray_density);
  c.non_negative("aurora.extras.ray_strength", ex.ray_strength);

  const CompositeParams& cp = p.composite;
  c.vec("composite.sky_top", cp.sky_top);
  c.vec("composite.sky_bottom", cp.sky_bottom);
  c.unit("composite.vignette_strength", cp.vignette_strength);
  c.ordered("composite.vignette_inner", cp.vignette_inner, "composite.vignette_outer", cp.vignette_outer);
  c.non_negative("composite.aurora_gain", cp.aurora_gain);
  c.unit_open("composite.blend_cap", cp.blend_cap);
  c.non_negative("composite.star_reinject", cp.star_reinject);

  return errors;
}

} // namespace aurora
