#pragma once

#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Low-amplitude coloured haze. One fbm drives opacity, a second one the blend
// between the two dark anchors, and a smoothstep-thresholded mask keeps the
// haze to patches. Drifts slowly with time; purely additive.
Vec3 nebula(Vec2 coord, float time, const NebulaParams& p);

} // namespace aurora
