#include <SDL.h>

#include <iostream>
#include <string>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "aurora/core/sky_params_json.h"
#include "aurora/util/log.h"
#include "ui/app.h"

#ifndef AURORA_VERSION
#define AURORA_VERSION "unknown"
#endif

namespace {

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Aurora viewer v" << AURORA_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "aurora") << " [options]\n\n";
  std::cout << "  --config PATH   Sky parameters JSON (default: aurora_sky.json, created on save)\n";
  std::cout << "  --threads N     Render threads, 0 = all cores (default: 0)\n";
  std::cout << "  --log-level L   debug|info|warn|error|off (default: info)\n";
  std::cout << "  -h, --help      Show this help\n";
  std::cout << "  --version       Print version and exit\n\n";
  std::cout << "Keys: Space pause, F1 toggle controls, R restart time\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << AURORA_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    aurora::log::set_level(aurora::log::Level::Info);
    const std::string log_level = get_str_arg(argc, argv, "--log-level", "");
    if (!log_level.empty()) {
      aurora::log::Level lvl{};
      if (!aurora::log::parse_level(log_level, lvl)) {
        std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      aurora::log::set_level(lvl);
    }

    aurora::ui::ViewerOptions opt;
    opt.config_path = get_str_arg(argc, argv, "--config", opt.config_path);
    opt.threads = std::stoi(get_str_arg(argc, argv, "--threads", "0"));

    // An explicit --config must load; the default file is optional.
    aurora::SkyParams params;
    try {
      params = aurora::load_sky_params_from_file(opt.config_path);
    } catch (const std::exception& e) {
      if (has_kv_arg(argc, argv, "--config")) throw;
      aurora::log::info(std::string("Using default sky parameters (") + e.what() + ")");
    }
    const auto problems = aurora::validate_sky_params(params);
    if (!problems.empty()) {
      for (const auto& p : problems) aurora::log::error("Sky config: " + p);
      return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      aurora::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("Aurora", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720,
                                          SDL_WINDOW_RESIZABLE);
    if (!window) {
      aurora::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      SDL_Quit();
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      aurora::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      SDL_DestroyWindow(window);
      SDL_Quit();
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    {
      // Scoped so the sky texture is released before the renderer.
      aurora::ui::App app(renderer, std::move(params), opt);

      bool running = true;
      while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
          ImGui_ImplSDL2_ProcessEvent(&e);
          if (e.type == SDL_QUIT) running = false;
          if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
              e.window.windowID == SDL_GetWindowID(window))
            running = false;
          if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) running = false;
          app.on_event(e);
        }

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        app.frame();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
      }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    aurora::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
