#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aurora/core/shading.h"
#include "aurora/core/sky_params.h"

namespace aurora {

// Linear RGBA pixels, row-major, row 0 at the top of the image.
struct Framebuffer {
  int width{0};
  int height{0};
  std::vector<Rgba> pixels;

  const Rgba& at(int x, int y) const { return pixels[static_cast<std::size_t>(y) * width + x]; }
};

struct RenderOptions {
  int width{640};
  int height{360};

  // Worker count. <= 0 picks std::thread::hardware_concurrency().
  int threads{0};
};

struct RenderStats {
  double render_ms{0.0};
  int threads_used{0};
  double mean_alpha{0.0};
  float max_alpha{0.0f};
  // Pixels whose alpha is above the 0.1 floor, i.e. touched by the aurora.
  std::int64_t aurora_pixels{0};
};

// Normalized centre of pixel (x, y); y is flipped so the bottom row is near 0.
Vec2 pixel_uv(int x, int y, int width, int height);

// Shades every pixel. Rows are split into contiguous bands, one per worker;
// each pixel is written exactly once so the result does not depend on the
// worker count. Throws std::runtime_error for non-positive sizes.
Framebuffer render_frame(const SkyParams& params, float time, const RenderOptions& opt,
                         RenderStats* stats = nullptr);

// Clamped, sRGB-encoded 8-bit RGBA (alpha stays linear).
std::vector<std::uint8_t> to_rgba8(const Framebuffer& fb);

// FNV-1a over the dimensions and every float channel.
std::uint64_t digest_framebuffer64(const Framebuffer& fb);

} // namespace aurora
