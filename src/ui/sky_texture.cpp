#include "ui/sky_texture.h"

#include <chrono>
#include <string>

#include "aurora/util/log.h"
#include "ui/imgui_texture.h"

namespace aurora::ui {

SkyTexture::SkyTexture(SDL_Renderer* renderer) : renderer_(renderer) {}

SkyTexture::~SkyTexture() {
  wait();
  if (texture_) SDL_DestroyTexture(texture_);
}

void SkyTexture::wait() {
  if (!pending_.valid()) return;
  try {
    pending_.get();
  } catch (const std::exception& e) {
    log::warn(std::string("SkyTexture: discarded frame: ") + e.what());
  }
}

void SkyTexture::update(const SkyParams& params, float time, int width, int height, int threads) {
  if (pending_.valid()) {
    if (pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;
    try {
      Result r = pending_.get();
      upload(r.fb);
      stats_ = r.stats;
      ++frames_completed_;
    } catch (const std::exception& e) {
      log::warn(std::string("SkyTexture: render failed: ") + e.what());
    }
  }

  if (width <= 0 || height <= 0) return;

  RenderOptions opt;
  opt.width = width;
  opt.height = height;
  opt.threads = threads;
  pending_ = std::async(std::launch::async, [params, time, opt]() {
    Result r;
    r.fb = render_frame(params, time, opt, &r.stats);
    return r;
  });
}

void SkyTexture::upload(const Framebuffer& fb) {
  if (!renderer_) return;

  if (!texture_ || tex_w_ != fb.width || tex_h_ != fb.height) {
    if (texture_) SDL_DestroyTexture(texture_);
    texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, fb.width, fb.height);
    if (!texture_) {
      log::warn(std::string("SkyTexture: SDL_CreateTexture failed: ") + SDL_GetError());
      tex_w_ = tex_h_ = 0;
      return;
    }
    tex_w_ = fb.width;
    tex_h_ = fb.height;
    SDL_SetTextureBlendMode(texture_, SDL_BLENDMODE_NONE);
  }

  const std::vector<std::uint8_t> rgba = to_rgba8(fb);
  if (SDL_UpdateTexture(texture_, nullptr, rgba.data(), fb.width * 4) != 0) {
    log::warn(std::string("SkyTexture: SDL_UpdateTexture failed: ") + SDL_GetError());
  }
}

ImTextureID SkyTexture::texture_id() const { return imgui_texture_id_from_sdl_texture(texture_); }

} // namespace aurora::ui
