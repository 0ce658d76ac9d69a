#pragma once

#include <string>
#include <vector>

#include <SDL.h>

#include "aurora/core/sky_params.h"
#include "ui/sky_texture.h"

namespace aurora::ui {

struct ViewerOptions {
  std::string config_path{"aurora_sky.json"};
  // Preview resolution as a fraction of the window size.
  float preview_scale{0.5f};
  int threads{0};
};

class App {
 public:
  App(SDL_Renderer* renderer, SkyParams params, ViewerOptions opt);

  // Called once per frame.
  void frame();

  void on_event(const SDL_Event& e);

 private:
  void draw_sky();
  void draw_controls();
  void draw_band_controls(const char* label, AuroraBandParams& band);
  void draw_status();

  void revalidate();
  void load_config();
  void save_config();

  SDL_Renderer* renderer_{nullptr};
  SkyTexture sky_;

  SkyParams params_;
  ViewerOptions opt_;
  std::vector<std::string> problems_;

  double time_{12.0};
  float speed_{1.0f};
  bool paused_{false};
  bool show_controls_{true};
  Uint64 last_ticks_{0};

  char config_path_[256] = "aurora_sky.json";
  std::string status_;
};

} // namespace aurora::ui
