#include "aurora/core/nebula.h"

#include "aurora/core/noise.h"

namespace aurora {

Vec3 nebula(Vec2 coord, float time, const NebulaParams& p) {
  const Vec2 drift = p.drift * time;

  const float density = noise::fbm(coord * p.scale + drift, p.octaves);
  const float hue = noise::fbm(coord * p.hue_scale + Vec2(5.2f, 1.3f) - drift * 0.6f, 4);
  const float patch = noise::fbm(coord * p.mask_scale + Vec2(11.7f, 3.1f) + drift * 0.3f, 3);
  const float mask = smoothstep(p.mask_lo, p.mask_hi, patch);

  const Vec3 tint = mix(p.color_a, p.color_b, saturate(hue * 1.6f - 0.3f));
  return tint * (density * mask * p.strength);
}

} // namespace aurora
