#include "aurora/core/stars.h"

#include <cmath>

namespace aurora {

namespace {

// Offsets decorrelating the per-star hashes from the existence hash.
const Vec2 kOffsetXSeed{17.31f, 3.97f};
const Vec2 kOffsetYSeed{5.13f, 29.77f};
const Vec2 kSizeSeed{41.9f, 11.3f};
const Vec2 kClassSeed{23.7f, 61.1f};
const Vec2 kTemperatureSeed{7.7f, 97.3f};
const Vec2 kPhaseSeed{88.1f, 14.9f};

constexpr float kTwoPi = 6.28318530718f;

} // namespace

Vec3 star_color(float class_hash, float temperature, const StarPalette& palette) {
  const float t = saturate(temperature);
  if (class_hash < palette.warm_fraction) return mix(palette.warm, palette.yellow, t);
  if (class_hash >= 1.0f - palette.blue_fraction) return mix(palette.white, palette.blue_white, t);
  return mix(palette.yellow, palette.white, 0.6f + 0.4f * t);
}

Vec3 star_layer(Vec2 coord, float time, const StarLayerParams& layer, const StarPalette& palette,
                noise::Hash2Fn hash) {
  const Vec2 g = coord * layer.grid_scale;
  const Vec2 cell = floor(g) + layer.seed_offset;
  const Vec2 local = fract(g);

  const float h = hash(cell);
  if (!(h > layer.threshold)) return Vec3(0.0f);

  const Vec2 centre(0.5f + (hash(cell + kOffsetXSeed) - 0.5f) * layer.jitter,
                    0.5f + (hash(cell + kOffsetYSeed) - 0.5f) * layer.jitter);
  const float size_h = hash(cell + kSizeSeed);
  const float size = mix(layer.size_min, layer.size_max, size_h);
  const float d = length(local - centre);

  float shape = 1.0f - smoothstep(0.0f, size, d);
  if (layer.halo > 0.0f) shape += layer.halo * (1.0f - smoothstep(0.0f, size * 3.0f, d));
  if (shape <= 0.0f) return Vec3(0.0f);

  // Rarer cells (hash further above the threshold) are brighter.
  const float rarity = (h - layer.threshold) / (1.0f - layer.threshold);
  const float brightness = layer.brightness * mix(0.45f, 1.0f, saturate(rarity));

  const float phase = hash(cell + kPhaseSeed) * kTwoPi;
  const float speed = layer.twinkle_speed * (0.6f + 0.8f * size_h);
  const float wave = 0.5f + 0.5f * std::sin(time * speed + phase);
  const float twinkle = mix(1.0f - layer.twinkle_amount, 1.0f, wave);

  const Vec3 tint = star_color(hash(cell + kClassSeed), hash(cell + kTemperatureSeed), palette);
  return tint * (shape * brightness * twinkle);
}

Vec3 stars(Vec2 coord, float time, const StarFieldParams& p, noise::Hash2Fn hash) {
  Vec3 sum(0.0f);
  for (const StarLayerParams& layer : p.layers) sum += star_layer(coord, time, layer, p.palette, hash);
  return sum;
}

Vec3 star_dust(Vec2 coord, float time, const StarFieldParams& p) {
  const Vec2 q = coord * p.dust_scale + Vec2(time * p.dust_drift, time * p.dust_drift * 0.3f) * p.dust_scale;
  const float n = noise::value_noise2(q);
  const float speck = smoothstep(p.dust_threshold, 1.0f, n);
  return p.dust_tint * (speck * p.dust_strength);
}

} // namespace aurora
