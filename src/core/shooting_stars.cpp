#include "aurora/core/shooting_stars.h"

#include <algorithm>
#include <cmath>

namespace aurora {

bool comet_visible(float time, const CometParams& comet) {
  return std::sin(time * comet.trigger_rate + comet.trigger_phase) > comet.trigger_threshold;
}

float comet_progress(float time, const CometParams& comet) {
  // The phase term desynchronizes comets that share a rate.
  return fract(time * comet.rate + comet.trigger_phase * 0.15915494f);
}

Vec3 comet_trail(Vec2 coord, float time, const CometParams& comet, CometGateFn gate) {
  if (!gate(time, comet)) return Vec3(0.0f);

  const float progress = comet_progress(time, comet);
  const Vec2 dir(std::cos(comet.angle), std::sin(comet.angle));
  const Vec2 head = comet.start + dir * (progress * comet.travel);

  // Project the pixel onto the flight line: `along` is signed distance ahead
  // of the head, `across` the distance from the line.
  const Vec2 rel = coord - head;
  const float along = dot(rel, dir);
  const float across = std::fabs(rel.x * dir.y - rel.y * dir.x);

  if (!(across < comet.width)) return Vec3(0.0f);
  if (along > 0.0f || along < -comet.length) return Vec3(0.0f);

  const float taper = 1.0f + along / comet.length; // 1 at the head, 0 at the tail
  const float core = 1.0f - smoothstep(0.0f, comet.width, across);
  const float fade = smoothstep(0.0f, 0.12f, progress) * (1.0f - smoothstep(0.75f, 1.0f, progress));

  return comet.color * (taper * taper * core * fade * comet.brightness);
}

Vec3 shooting_stars(Vec2 coord, float time, const ShootingStarParams& p, CometGateFn gate) {
  Vec3 sum(0.0f);
  const int n = std::clamp(p.count, 0, kMaxComets);
  for (int i = 0; i < n; ++i) sum += comet_trail(coord, time, p.comets[static_cast<std::size_t>(i)], gate);
  return sum;
}

} // namespace aurora
