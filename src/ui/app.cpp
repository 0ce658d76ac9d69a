#include "ui/app.h"

#include <imgui.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>

#include "aurora/core/sky_params_json.h"
#include "aurora/util/log.h"

namespace aurora::ui {

namespace {

template <std::size_t N>
void set_cstr(char (&dst)[N], const std::string& src) {
  const std::size_t n = std::min<std::size_t>(src.size(), N - 1);
  if (n > 0) std::memcpy(dst, src.data(), n);
  dst[n] = '\0';
}

bool color_edit(const char* label, Vec3& c) {
  float rgb[3] = {c.x, c.y, c.z};
  if (!ImGui::ColorEdit3(label, rgb, ImGuiColorEditFlags_Float | ImGuiColorEditFlags_HDR)) return false;
  c = Vec3(rgb[0], rgb[1], rgb[2]);
  return true;
}

bool vec2_drag(const char* label, Vec2& v, float speed) {
  float xy[2] = {v.x, v.y};
  if (!ImGui::DragFloat2(label, xy, speed)) return false;
  v = Vec2(xy[0], xy[1]);
  return true;
}

} // namespace

App::App(SDL_Renderer* renderer, SkyParams params, ViewerOptions opt)
    : renderer_(renderer), sky_(renderer), params_(std::move(params)), opt_(std::move(opt)) {
  set_cstr(config_path_, opt_.config_path);
  last_ticks_ = SDL_GetPerformanceCounter();
  revalidate();
}

void App::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN) return;
  if (ImGui::GetIO().WantCaptureKeyboard) return;

  switch (e.key.keysym.sym) {
    case SDLK_SPACE: paused_ = !paused_; break;
    case SDLK_F1: show_controls_ = !show_controls_; break;
    case SDLK_r: time_ = 0.0; break;
    default: break;
  }
}

void App::frame() {
  const Uint64 now = SDL_GetPerformanceCounter();
  const double dt = static_cast<double>(now - last_ticks_) / static_cast<double>(SDL_GetPerformanceFrequency());
  last_ticks_ = now;
  if (!paused_) time_ += dt * speed_;

  draw_sky();
  if (show_controls_) draw_controls();
}

void App::draw_sky() {
  const ImVec2 size = ImGui::GetIO().DisplaySize;
  const float scale = std::clamp(opt_.preview_scale, 0.1f, 1.0f);
  const int w = std::max(1, static_cast<int>(size.x * scale));
  const int h = std::max(1, static_cast<int>(size.y * scale));

  // An invalid parameter set keeps showing the last good frame.
  if (problems_.empty()) sky_.update(params_, static_cast<float>(time_), w, h, opt_.threads);

  if (sky_.width() > 0) {
    ImGui::GetBackgroundDrawList()->AddImage(sky_.texture_id(), ImVec2(0.0f, 0.0f), size);
  }
}

void App::draw_band_controls(const char* label, AuroraBandParams& band) {
  if (!ImGui::TreeNode(label)) return;
  bool changed = false;
  changed |= ImGui::Checkbox("Enabled", &band.enabled);
  changed |= ImGui::SliderFloat("Strength", &band.strength, 0.0f, 1.0f);
  changed |= ImGui::SliderFloat("Centre height", &band.center_y, 0.0f, 1.0f);
  changed |= ImGui::SliderFloat("Height falloff", &band.height_falloff, 0.5f, 6.0f);
  changed |= vec2_drag("Noise scale", band.noise_scale, 0.01f);
  changed |= ImGui::SliderFloat("Scroll speed", &band.scroll_speed, 0.0f, 0.3f);
  changed |= ImGui::SliderInt("Octaves", &band.octaves, 1, 8);
  changed |= ImGui::SliderFloat("Wave amplitude", &band.wave_amp, 0.0f, 0.3f);
  changed |= ImGui::SliderFloat("Wave frequency", &band.wave_freq, 0.0f, 20.0f);
  changed |= ImGui::SliderFloat("Flow frequency", &band.flow_freq, 0.0f, 20.0f);
  changed |= ImGui::SliderFloat("Detail strength", &band.detail_strength, 0.0f, 1.5f);
  changed |= ImGui::SliderFloat("Glow", &band.glow_strength, 0.0f, 1.0f);
  ImGui::TextDisabled("OKLab anchors (L, a, b)");
  for (int i = 0; i < 4; ++i) {
    ImGui::PushID(i);
    float lab[3] = {band.anchors[i].x, band.anchors[i].y, band.anchors[i].z};
    if (ImGui::DragFloat3("##anchor", lab, 0.005f)) {
      band.anchors[i] = color::Lab(lab[0], lab[1], lab[2]);
      changed = true;
    }
    ImGui::PopID();
  }
  ImGui::TreePop();
  if (changed) revalidate();
}

void App::draw_controls() {
  ImGui::SetNextWindowPos(ImVec2(12.0f, 12.0f), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(380.0f, 560.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Sky", &show_controls_)) {
    ImGui::End();
    return;
  }

  bool changed = false;

  if (ImGui::CollapsingHeader("Playback", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::Checkbox("Paused (Space)", &paused_);
    ImGui::SliderFloat("Playback speed", &speed_, 0.0f, 8.0f);
    float t = static_cast<float>(time_);
    if (ImGui::DragFloat("Time", &t, 0.05f, 0.0f, 100000.0f, "%.2f s")) time_ = t;
    changed |= ImGui::SliderFloat("Time scale", &params_.time_scale, 0.0f, 4.0f);
    ImGui::SliderFloat("Preview scale", &opt_.preview_scale, 0.1f, 1.0f);
  }

  if (ImGui::CollapsingHeader("Layers", ImGuiTreeNodeFlags_DefaultOpen)) {
    changed |= ImGui::Checkbox("Nebula", &params_.layers.nebula);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Dust", &params_.layers.dust);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Comets", &params_.layers.shooting_stars);
    ImGui::SameLine();
    changed |= ImGui::Checkbox("Aurora", &params_.layers.aurora);
  }

  if (ImGui::CollapsingHeader("Stars")) {
    static const char* kLayerNames[kStarLayerCount] = {"Background", "Primary", "Foreground"};
    for (int i = 0; i < kStarLayerCount; ++i) {
      StarLayerParams& l = params_.stars.layers[static_cast<std::size_t>(i)];
      ImGui::PushID(i);
      if (ImGui::TreeNode(kLayerNames[i])) {
        changed |= ImGui::SliderFloat("Grid scale", &l.grid_scale, 10.0f, 400.0f);
        changed |= ImGui::SliderFloat("Threshold", &l.threshold, 0.9f, 0.999f, "%.4f");
        changed |= ImGui::SliderFloat("Brightness", &l.brightness, 0.0f, 3.0f);
        changed |= ImGui::SliderFloat("Twinkle", &l.twinkle_amount, 0.0f, 1.0f);
        changed |= ImGui::SliderFloat("Halo", &l.halo, 0.0f, 0.5f);
        ImGui::TreePop();
      }
      ImGui::PopID();
    }
    changed |= ImGui::SliderFloat("Dust strength", &params_.stars.dust_strength, 0.0f, 0.2f);
  }

  if (ImGui::CollapsingHeader("Nebula")) {
    changed |= ImGui::SliderFloat("Nebula strength", &params_.nebula.strength, 0.0f, 2.0f);
    changed |= ImGui::SliderFloat("Nebula scale", &params_.nebula.scale, 0.2f, 8.0f);
    changed |= color_edit("Colour A", params_.nebula.color_a);
    changed |= color_edit("Colour B", params_.nebula.color_b);
  }

  if (ImGui::CollapsingHeader("Shooting stars")) {
    changed |= ImGui::SliderInt("Count", &params_.shooting_stars.count, 0, kMaxComets);
  }

  if (ImGui::CollapsingHeader("Aurora", ImGuiTreeNodeFlags_DefaultOpen)) {
    draw_band_controls("Primary band", params_.aurora.primary);
    draw_band_controls("Secondary band", params_.aurora.secondary);
    AuroraExtrasParams& ex = params_.aurora.extras;
    if (ImGui::TreeNode("Extras")) {
      changed |= ImGui::Checkbox("Fine detail", &ex.fine_detail);
      changed |= ImGui::Checkbox("Cross ripples", &ex.cross_detail);
      changed |= ImGui::Checkbox("Wisps", &ex.wisps);
      changed |= ImGui::Checkbox("Surges", &ex.surges);
      changed |= ImGui::Checkbox("Curtain rays", &ex.curtain_rays);
      changed |= ImGui::SliderFloat("Ray strength", &ex.ray_strength, 0.0f, 1.0f);
      ImGui::TreePop();
    }
  }

  if (ImGui::CollapsingHeader("Compositing")) {
    CompositeParams& cp = params_.composite;
    changed |= color_edit("Sky top", cp.sky_top);
    changed |= color_edit("Sky bottom", cp.sky_bottom);
    changed |= ImGui::SliderFloat("Vignette", &cp.vignette_strength, 0.0f, 1.0f);
    changed |= ImGui::SliderFloat("Aurora gain", &cp.aurora_gain, 0.0f, 4.0f);
    changed |= ImGui::SliderFloat("Blend cap", &cp.blend_cap, 0.0f, 0.99f);
    changed |= ImGui::SliderFloat("Star re-inject", &cp.star_reinject, 0.0f, 1.0f);
  }

  if (changed) revalidate();

  ImGui::Separator();
  ImGui::InputText("Config", config_path_, sizeof(config_path_));
  if (ImGui::Button("Save")) save_config();
  ImGui::SameLine();
  if (ImGui::Button("Load")) load_config();
  ImGui::SameLine();
  if (ImGui::Button("Defaults")) {
    params_ = SkyParams{};
    revalidate();
    status_ = "Defaults restored";
  }

  draw_status();
  ImGui::End();
}

void App::draw_status() {
  const RenderStats& s = sky_.last_stats();
  ImGui::Text("t = %.2f s  |  %dx%d in %.1f ms (%d threads)", time_, sky_.width(), sky_.height(), s.render_ms,
              s.threads_used);
  ImGui::Text("Mean alpha %.3f, aurora pixels %lld", s.mean_alpha, static_cast<long long>(s.aurora_pixels));
  if (!status_.empty()) ImGui::TextWrapped("%s", status_.c_str());

  if (!problems_.empty()) {
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.45f, 0.4f, 1.0f));
    ImGui::TextWrapped("Invalid parameters (preview paused):");
    for (const auto& p : problems_) ImGui::BulletText("%s", p.c_str());
    ImGui::PopStyleColor();
  }
}

void App::revalidate() { problems_ = validate_sky_params(params_); }

void App::load_config() {
  try {
    SkyParams loaded = load_sky_params_from_file(config_path_);
    const auto problems = validate_sky_params(loaded);
    if (!problems.empty()) {
      status_ = "Rejected " + std::string(config_path_) + ": " + problems.front();
      log::warn(status_);
      return;
    }
    params_ = std::move(loaded);
    revalidate();
    status_ = "Loaded " + std::string(config_path_);
  } catch (const std::exception& e) {
    status_ = e.what();
    log::error(status_);
  }
}

void App::save_config() {
  if (!problems_.empty()) {
    status_ = "Fix the invalid parameters before saving";
    return;
  }
  try {
    save_sky_params_to_file(config_path_, params_);
    status_ = "Saved " + std::string(config_path_);
  } catch (const std::exception& e) {
    status_ = e.what();
    log::error(status_);
  }
}

} // namespace aurora::ui
