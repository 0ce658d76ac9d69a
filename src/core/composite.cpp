#include "aurora/core/composite.h"

namespace aurora {

namespace {

// Distance from the centre to a corner.
constexpr float kCornerDistance = 0.70710678f;

} // namespace

Vec3 sky_gradient(float y, const CompositeParams& p) {
  return mix(p.sky_bottom, p.sky_top, saturate(y));
}

float sky_vignette(Vec2 coord, const CompositeParams& p) {
  const float d = length(coord - Vec2(0.5f, 0.5f)) / kCornerDistance;
  return 1.0f - p.vignette_strength * smoothstep(p.vignette_inner, p.vignette_outer, d);
}

Vec3 sky_background(Vec2 coord, const CompositeParams& p) {
  return sky_gradient(coord.y, p) * sky_vignette(coord, p);
}

float aurora_blend(float intensity, const CompositeParams& p) {
  return clamp(intensity * p.aurora_gain, 0.0f, p.blend_cap);
}

Rgba composite(const LayerSample& s, const CompositeParams& p) {
  const Vec3 sky = s.background + s.nebula + s.stars + s.dust + s.comets;
  const float blend = aurora_blend(s.aurora_intensity, p);

  // Stars are re-injected after the blend so they shine through the curtain.
  const Vec3 rgb = mix(sky, s.aurora_rgb, blend) + s.stars * p.star_reinject;

  Rgba out;
  out.r = rgb.x;
  out.g = rgb.y;
  out.b = rgb.z;
  out.a = sky_alpha(s.aurora_intensity);
  return out;
}

} // namespace aurora
