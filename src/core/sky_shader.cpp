#include "aurora/core/sky_shader.h"

#include "aurora/core/aurora.h"
#include "aurora/core/nebula.h"
#include "aurora/core/shooting_stars.h"
#include "aurora/core/stars.h"

namespace aurora {

LayerSample sample_layers(Vec2 coord, float time, const SkyParams& params) {
  const LayerToggles& on = params.layers;

  LayerSample s;
  s.background = sky_background(coord, params.composite);
  s.stars = stars(coord, time, params.stars);
  if (on.nebula) s.nebula = nebula(coord, time, params.nebula);
  if (on.dust) s.dust = star_dust(coord, time, params.stars);
  if (on.shooting_stars) s.comets = shooting_stars(coord, time, params.shooting_stars);
  if (on.aurora) {
    const AuroraSample a = aurora(coord, time, params.aurora);
    s.aurora_rgb = a.rgb;
    s.aurora_intensity = a.intensity;
  }
  return s;
}

Rgba shade_warmup(Vec2 coord, float time, const SkyParams& params) {
  const Vec3 rgb = sky_background(coord, params.composite) + stars(coord, time, params.stars);
  Rgba out;
  out.r = rgb.x;
  out.g = rgb.y;
  out.b = rgb.z;
  out.a = sky_alpha(0.0f);
  return out;
}

Rgba shade_sky(Vec2 coord, float time, const SkyParams& params) {
  const float t = time * params.time_scale;
  if (t < params.warmup_time) return shade_warmup(coord, t, params);
  return composite(sample_layers(coord, t, params), params.composite);
}

} // namespace aurora
