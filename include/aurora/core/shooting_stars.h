#pragma once

#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Decides whether a comet is in its visible window at `time`.
using CometGateFn = bool (*)(float time, const CometParams& comet);

// Default gate: sin(time * trigger_rate + trigger_phase) > trigger_threshold.
bool comet_visible(float time, const CometParams& comet);

// Position of the comet within its current flight, in [0,1).
float comet_progress(float time, const CometParams& comet);

// Contribution of a single comet (zero when gated off or outside its trail).
Vec3 comet_trail(Vec2 coord, float time, const CometParams& comet, CometGateFn gate = &comet_visible);

// Sum of the first `count` comets. Every comet is a stateless function of
// time, so re-evaluating the same time reproduces the same frame.
Vec3 shooting_stars(Vec2 coord, float time, const ShootingStarParams& p, CometGateFn gate = &comet_visible);

} // namespace aurora
