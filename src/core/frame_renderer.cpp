#include "aurora/core/frame_renderer.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

#include "aurora/core/color.h"
#include "aurora/core/sky_shader.h"
#include "aurora/util/digest.h"

namespace aurora {

namespace {

using Clock = std::chrono::high_resolution_clock;

double ms_since(const Clock::time_point& start) {
  const std::chrono::duration<double, std::milli> dt = Clock::now() - start;
  return dt.count();
}

int resolve_threads(int requested, int rows) {
  int n = requested;
  if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
  if (n <= 0) n = 1;
  return std::max(1, std::min(n, rows));
}

void shade_rows(Framebuffer& fb, const SkyParams& params, float time, int row_begin, int row_end) {
  for (int y = row_begin; y < row_end; ++y) {
    Rgba* row = fb.pixels.data() + static_cast<std::size_t>(y) * fb.width;
    for (int x = 0; x < fb.width; ++x) {
      row[x] = shade_sky(pixel_uv(x, y, fb.width, fb.height), time, params);
    }
  }
}

} // namespace

Vec2 pixel_uv(int x, int y, int width, int height) {
  const float u = (static_cast<float>(x) + 0.5f) / static_cast<float>(width);
  const float v = (static_cast<float>(y) + 0.5f) / static_cast<float>(height);
  return Vec2(u, 1.0f - v);
}

Framebuffer render_frame(const SkyParams& params, float time, const RenderOptions& opt, RenderStats* stats) {
  if (opt.width <= 0 || opt.height <= 0) {
    throw std::runtime_error("render_frame: invalid size " + std::to_string(opt.width) + "x" +
                             std::to_string(opt.height));
  }

  const auto start = Clock::now();

  Framebuffer fb;
  fb.width = opt.width;
  fb.height = opt.height;
  fb.pixels.resize(static_cast<std::size_t>(opt.width) * static_cast<std::size_t>(opt.height));

  const int workers = resolve_threads(opt.threads, opt.height);
  if (workers == 1) {
    shade_rows(fb, params, time, 0, fb.height);
  } else {
    std::vector<std::future<void>> jobs;
    jobs.reserve(static_cast<std::size_t>(workers));
    for (int i = 0; i < workers; ++i) {
      const int begin = static_cast<int>(static_cast<std::int64_t>(fb.height) * i / workers);
      const int end = static_cast<int>(static_cast<std::int64_t>(fb.height) * (i + 1) / workers);
      jobs.push_back(std::async(std::launch::async, [&fb, &params, time, begin, end]() {
        shade_rows(fb, params, time, begin, end);
      }));
    }
    // get() rethrows anything a worker threw.
    for (auto& j : jobs) j.get();
  }

  if (stats) {
    RenderStats s;
    s.render_ms = ms_since(start);
    s.threads_used = workers;
    double sum = 0.0;
    for (const Rgba& px : fb.pixels) {
      sum += px.a;
      s.max_alpha = std::max(s.max_alpha, px.a);
      if (px.a > 0.1f) ++s.aurora_pixels;
    }
    s.mean_alpha = sum / static_cast<double>(fb.pixels.size());
    *stats = s;
  }
  return fb;
}

std::vector<std::uint8_t> to_rgba8(const Framebuffer& fb) {
  std::vector<std::uint8_t> out;
  out.reserve(fb.pixels.size() * 4);
  for (const Rgba& px : fb.pixels) {
    out.push_back(color::linear_to_srgb_u8(px.r));
    out.push_back(color::linear_to_srgb_u8(px.g));
    out.push_back(color::linear_to_srgb_u8(px.b));
    const float a = std::isnan(px.a) ? 0.0f : saturate(px.a);
    out.push_back(static_cast<std::uint8_t>(a * 255.0f + 0.5f));
  }
  return out;
}

std::uint64_t digest_framebuffer64(const Framebuffer& fb) {
  Digest64 d;
  d.add_u32(static_cast<std::uint32_t>(fb.width));
  d.add_u32(static_cast<std::uint32_t>(fb.height));
  for (const Rgba& px : fb.pixels) {
    d.add_float(px.r);
    d.add_float(px.g);
    d.add_float(px.b);
    d.add_float(px.a);
  }
  return d.value();
}

} // namespace aurora
