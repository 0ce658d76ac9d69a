#pragma once

#include <cstdint>
#include <future>
#include <vector>

#include <SDL.h>

#include <imgui.h>

#include "aurora/core/frame_renderer.h"
#include "aurora/core/sky_params.h"

namespace aurora::ui {

// Renders the sky on a worker thread and streams finished frames into an SDL
// texture. At most one frame is in flight; the texture always holds the last
// completed frame, so a slow render never stalls the UI.
class SkyTexture {
 public:
  explicit SkyTexture(SDL_Renderer* renderer);
  ~SkyTexture();

  SkyTexture(const SkyTexture&) = delete;
  SkyTexture& operator=(const SkyTexture&) = delete;

  // Uploads a finished frame if one is ready and starts the next one.
  // params are copied, so the caller may edit them right away.
  void update(const SkyParams& params, float time, int width, int height, int threads);

  ImTextureID texture_id() const;
  int width() const { return tex_w_; }
  int height() const { return tex_h_; }

  const RenderStats& last_stats() const { return stats_; }
  std::uint64_t frames_completed() const { return frames_completed_; }

  // Blocks until the in-flight frame (if any) finishes.
  void wait();

 private:
  struct Result {
    Framebuffer fb;
    RenderStats stats;
  };

  void upload(const Framebuffer& fb);

  SDL_Renderer* renderer_{nullptr};
  SDL_Texture* texture_{nullptr};
  int tex_w_{0};
  int tex_h_{0};

  std::future<Result> pending_;
  RenderStats stats_{};
  std::uint64_t frames_completed_{0};
};

} // namespace aurora::ui
