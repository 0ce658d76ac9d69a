#include "aurora/core/aurora.h"

#include <cmath>

#include "aurora/core/noise.h"

namespace aurora {

namespace {

const Vec2 kScreenCentre{0.5f, 0.5f};

// Fine, cross and wisp layers. Each is scaled by the band's base intensity so
// detail never lights up empty sky.
float detail_layers(Vec2 coord, float time, float displaced_x, float base, float noise_field, float height_mask,
                    const AuroraExtrasParams& ex) {
  float add = 0.0f;
  if (ex.fine_detail) {
    const float f = noise::value_noise2(Vec2(displaced_x * ex.fine_scale, coord.y * ex.fine_scale * 0.25f - time * 0.4f));
    add += base * (f - 0.5f) * ex.fine_strength;
  }
  if (ex.cross_detail) {
    const float c = 0.5f + 0.5f * std::sin(coord.y * ex.cross_freq + displaced_x * 7.0f - time * ex.cross_speed);
    add += base * c * ex.cross_strength;
  }
  if (ex.wisps) {
    const float w = noise::fbm(Vec2(displaced_x * ex.wisp_scale, coord.y * ex.wisp_scale * 3.0f - time * 0.15f), 4);
    add += smoothstep(0.55f, 0.8f, w) * height_mask * smoothstep(0.2f, 0.6f, noise_field) * ex.wisp_strength;
  }
  return add;
}

} // namespace

float aurora_height_mask(float y, const AuroraBandParams& band) {
  return smoothstep(0.0f, 0.7f, 1.0f - std::fabs(y - band.center_y) * band.height_falloff);
}

float aurora_surge(float time, const AuroraExtrasParams& extras) {
  if (!extras.surges) return 0.0f;
  return smoothstep(extras.surge_threshold, 1.0f, std::sin(time * extras.surge_rate + 0.7f));
}

float aurora_ray_gate(float time, float phase, const AuroraExtrasParams& extras) {
  if (!extras.curtain_rays) return 0.0f;
  return smoothstep(extras.ray_threshold, 1.0f, std::sin(time * extras.ray_rate + extras.ray_phase + phase));
}

AuroraBandFields aurora_band_fields(Vec2 coord, float time, const AuroraBandParams& band,
                                    const AuroraExtrasParams& extras) {
  AuroraBandFields f;

  // 1. Wavy large-scale structure.
  const Vec2 p(coord.x * band.noise_scale.x, coord.y * band.noise_scale.y + time * band.scroll_speed);
  f.noise = noise::fbm(p + band.noise_offset, band.octaves);

  // 2. Curtain motion: horizontal displacement modulated by the noise.
  f.displaced_x = coord.x + std::sin(coord.y * band.wave_freq + time * band.wave_speed + f.noise * 3.0f) *
                                band.wave_amp * f.noise;

  // 3. Directional flow.
  f.flow = 0.5f + 0.5f * std::sin(f.displaced_x * band.flow_freq + f.noise * 4.0f + time * band.flow_speed);

  // 4-5. Vertical placement and noise-valley suppression.
  f.height_mask = aurora_height_mask(coord.y, band);
  f.base = f.flow * f.height_mask * smoothstep(band.noise_lo, band.noise_hi, f.noise);

  // 6. Shimmer scaled by the primary intensity.
  const float detail = noise::fbm(
      Vec2(f.displaced_x * band.detail_scale.x, coord.y * band.detail_scale.y + time * band.detail_speed), 3);
  float intensity = f.base + detail * f.base * band.detail_strength;
  intensity += detail_layers(coord, time, f.displaced_x, f.base, f.noise, f.height_mask, extras);

  intensity *= 1.0f + aurora_surge(time, extras) * extras.surge_boost;

  const float ray_gate = aurora_ray_gate(time, band.ray_phase, extras);
  if (ray_gate > 0.0f) {
    const float r = noise::value_noise2(Vec2(f.displaced_x * extras.ray_density, time * 0.35f));
    const float ray = r * r * r * r;
    const float rise = smoothstep(band.center_y - 0.1f, band.center_y + 0.2f, coord.y) *
                       (1.0f - smoothstep(band.center_y + 0.2f, band.center_y + 0.45f, coord.y));
    intensity += ray * rise * ray_gate * extras.ray_strength * f.flow;
  }

  f.intensity = saturate(intensity * band.strength);
  return f;
}

color::Lab aurora_band_lab(Vec2 coord, float time, const AuroraBandParams& band) {
  const float t1 = 0.5f + 0.5f * std::sin(time * band.blend_speed1 + band.blend_phase);
  const float t2 = 0.5f + 0.5f * std::sin(time * band.blend_speed2 + band.blend_phase + 1.7f);
  const float dist_factor = smoothstep(0.0f, band.dist_range, length(coord - kScreenCentre));

  const color::Lab near = mix(band.anchors[0], band.anchors[1], t1);
  const color::Lab far = mix(band.anchors[2], band.anchors[3], t2);
  return mix(near, far, dist_factor);
}

AuroraSample aurora_band(Vec2 coord, float time, const AuroraBandParams& band, const AuroraExtrasParams& extras) {
  AuroraSample out;
  if (!band.enabled) return out;

  const AuroraBandFields f = aurora_band_fields(coord, time, band, extras);
  out.intensity = f.intensity;
  if (f.intensity <= 0.0f) return out;

  const color::Lab lab = aurora_band_lab(coord, time, band);
  const Vec3 pure = color::oklab_to_linear_srgb(lab);
  const Vec3 lit = color::oklab_to_linear_srgb(lab * f.intensity);
  const Vec3 glow = mix(pure * band.glow_dark, pure, f.intensity) * (f.intensity * band.glow_strength);

  out.rgb = lit + glow;
  return out;
}

AuroraSample aurora(Vec2 coord, float time, const AuroraParams& p) {
  const AuroraSample a = aurora_band(coord, time, p.primary, p.extras);
  const AuroraSample b = aurora_band(coord, time, p.secondary, p.extras);

  AuroraSample out;
  out.rgb = a.rgb + b.rgb;
  out.intensity = saturate(1.0f - (1.0f - a.intensity) * (1.0f - b.intensity));
  return out;
}

} // namespace aurora
