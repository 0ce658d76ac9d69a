#pragma once

// The whole night sky for one pixel.
//
// shade_sky() is a pure function of (coord, time, params): no state survives
// between calls, so pixels may be evaluated in any order and on any thread.
// coord is in [0,1]^2 with x to the right and y up (y = 0 is the horizon).

#include "aurora/core/composite.h"
#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Evaluates every enabled layer without compositing. time is already scaled.
LayerSample sample_layers(Vec2 coord, float time, const SkyParams& params);

// Star-only frame used while the scaled time is below warmup_time.
Rgba shade_warmup(Vec2 coord, float time, const SkyParams& params);

// Host time in seconds; params.time_scale is applied here.
Rgba shade_sky(Vec2 coord, float time, const SkyParams& params);

} // namespace aurora
