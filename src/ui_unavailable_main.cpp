#include <iostream>
#include <string_view>

#ifndef AURORA_VERSION
#define AURORA_VERSION "unknown"
#endif

#ifndef AURORA_UI_UNAVAILABLE_REASON
#define AURORA_UI_UNAVAILABLE_REASON "SDL2 and/or Dear ImGui were not found when this build was configured."
#endif

namespace {

constexpr const char* kStatusCodeUiUnavailable = "AUR-UI-001";
constexpr const char* kStatusCodeUiRequiredUnavailable = "AUR-UI-002";
constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "aurora";
  std::cout << "Aurora viewer launcher v" << AURORA_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive viewer.\n";
  std::cout << "Reason: " << AURORA_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "Headless rendering is still available:\n";
  std::cout << "  aurora_cli --time 12 --out sky.ppm\n\n";
  std::cout << "Install SDL2 and Dear ImGui (with the sdl2 and sdlrenderer2 backends)\n";
  std::cout << "and reconfigure to build the viewer.\n";
  std::cout << "\nLauncher status codes:\n";
  std::cout << "  " << kStatusCodeUiUnavailable << " (exit " << kExitCodeOk
            << "): viewer unavailable; informational launch.\n";
  std::cout << "  " << kStatusCodeUiRequiredUnavailable << " (exit " << kExitCodeUiRequiredUnavailable
            << "): viewer explicitly required via --require-ui but unavailable.\n";
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << AURORA_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  if (has_flag(argc, argv, "--require-ui")) {
    std::cerr << "[" << kStatusCodeUiRequiredUnavailable << "] Aurora viewer is unavailable in this build.\n";
    std::cerr << "Reason: " << AURORA_UI_UNAVAILABLE_REASON << "\n";
    std::cerr << "Run with --help for details.\n";
    return kExitCodeUiRequiredUnavailable;
  }

  std::cerr << "[" << kStatusCodeUiUnavailable << "] Aurora viewer is unavailable in this build.\n";
  std::cerr << "Reason: " << AURORA_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Use aurora_cli for headless rendering; run with --help for details.\n";
  return kExitCodeOk;
}
