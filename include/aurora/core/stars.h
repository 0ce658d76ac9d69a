#pragma once

#include "aurora/core/noise.h"
#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Sum of all star layers at `coord`.
//
// Each layer partitions the plane into square cells; a cell holds a star iff
// hash(cell + seed_offset) > threshold. Every star property (offset, size,
// colour, twinkle phase) is a function of the cell id only, so the field is
// stable across frames and threads. Overlapping layers simply add.
Vec3 stars(Vec2 coord, float time, const StarFieldParams& p, noise::Hash2Fn hash = &noise::hash2);

// A single layer (exposed for tests and the viewer's layer preview).
Vec3 star_layer(Vec2 coord, float time, const StarLayerParams& layer, const StarPalette& palette,
                noise::Hash2Fn hash = &noise::hash2);

// Spectral bucket lookup: class_hash picks warm / white / blue-white,
// temperature blends within the bucket.
Vec3 star_color(float class_hash, float temperature, const StarPalette& palette);

// Faint high-frequency speckle between the stars.
Vec3 star_dust(Vec2 coord, float time, const StarFieldParams& p);

} // namespace aurora
