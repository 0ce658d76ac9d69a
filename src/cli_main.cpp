#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "aurora/core/frame_renderer.h"
#include "aurora/core/image_io.h"
#include "aurora/core/sky_params.h"
#include "aurora/core/sky_params_json.h"
#include "aurora/util/digest.h"
#include "aurora/util/log.h"

namespace {

#ifndef AURORA_VERSION
#define AURORA_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

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

// "{frame}" is replaced by the zero-padded frame index; without it the index
// is inserted before the extension.
std::string frame_path(const std::string& pattern, int frame) {
  char idx[16];
  std::snprintf(idx, sizeof(idx), "%04d", frame);

  const std::string token = "{frame}";
  const auto pos = pattern.find(token);
  if (pos != std::string::npos) {
    std::string out = pattern;
    out.replace(pos, token.size(), idx);
    return out;
  }

  const auto slash = pattern.find_last_of("/\\");
  auto dot = pattern.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) dot = pattern.size();
  return pattern.substr(0, dot) + "_" + idx + pattern.substr(dot);
}

void print_usage(const char* exe) {
  std::cout << "Aurora CLI v" << AURORA_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "aurora_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --width N          Image width in pixels (default: 640)\n";
  std::cout << "  --height N         Image height in pixels (default: 360)\n";
  std::cout << "  --time T           Time of the first frame in seconds (default: 12)\n";
  std::cout << "  --frames N         Number of frames to render (default: 1)\n";
  std::cout << "  --fps F            Frame rate for sequences (default: 30)\n";
  std::cout << "  --threads N        Worker threads, 0 = all cores (default: 0)\n";
  std::cout << "  --out PATH         Write frames to PATH (.ppm or .pam). Sequences use\n";
  std::cout << "                     {frame} in PATH or get _NNNN appended\n";
  std::cout << "  --config PATH      Load sky parameters from a JSON file\n";
  std::cout << "  --save-config PATH Write the effective sky parameters as JSON\n";
  std::cout << "  --dump-config      Print the effective sky parameters as JSON and exit\n";
  std::cout << "  --validate-config  Validate the sky parameters and exit\n";
  std::cout << "  --digest           Print a 64-bit digest of every rendered frame\n";
  std::cout << "  --stats            Print render timing and alpha statistics\n";
  std::cout << "  --log-level L      debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet            Suppress non-essential output\n";
  std::cout << "  -h, --help         Show this help\n";
  std::cout << "  --version          Print version and exit\n";
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

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (quiet && log_level.empty()) aurora::log::set_level(aurora::log::Level::Warn);

    aurora::RenderOptions opt;
    opt.width = get_int_arg(argc, argv, "--width", 640);
    opt.height = get_int_arg(argc, argv, "--height", 360);
    opt.threads = get_int_arg(argc, argv, "--threads", 0);
    const double start_time = get_double_arg(argc, argv, "--time", 12.0);
    const int frames = get_int_arg(argc, argv, "--frames", 1);
    const double fps = get_double_arg(argc, argv, "--fps", 30.0);
    const std::string out_path = get_str_arg(argc, argv, "--out", "");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string save_config_path = get_str_arg(argc, argv, "--save-config", "");
    const bool digest = has_flag(argc, argv, "--digest");
    const bool show_stats = has_flag(argc, argv, "--stats");

    if (opt.width <= 0 || opt.height <= 0) {
      std::cerr << "--width and --height must be positive\n\n";
      print_usage(argv[0]);
      return 2;
    }
    if (frames <= 0) {
      std::cerr << "--frames must be positive\n\n";
      print_usage(argv[0]);
      return 2;
    }
    if (!(fps > 0.0)) {
      std::cerr << "--fps must be positive\n\n";
      print_usage(argv[0]);
      return 2;
    }

    aurora::SkyParams params;
    if (!config_path.empty()) params = aurora::load_sky_params_from_file(config_path);

    const auto errors = aurora::validate_sky_params(params);
    if (has_flag(argc, argv, "--validate-config")) {
      if (!errors.empty()) {
        std::cerr << "Sky config validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Sky config OK\n";
      return 0;
    }
    if (!errors.empty()) {
      std::cerr << "Sky config is invalid:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    if (has_flag(argc, argv, "--dump-config")) {
      std::cout << aurora::serialize_sky_params(params);
      return 0;
    }
    if (!save_config_path.empty()) {
      aurora::save_sky_params_to_file(save_config_path, params);
      if (!quiet) std::cout << "Sky config written to " << save_config_path << "\n";
    }

    if (out_path.empty() && !digest && !show_stats) {
      if (save_config_path.empty()) {
        std::cerr << "Nothing to do: pass --out, --digest or --stats\n\n";
        print_usage(argv[0]);
        return 2;
      }
      return 0;
    }

    for (int f = 0; f < frames; ++f) {
      const float t = static_cast<float>(start_time + static_cast<double>(f) / fps);

      aurora::RenderStats stats;
      const aurora::Framebuffer fb = aurora::render_frame(params, t, opt, &stats);

      if (!out_path.empty()) {
        const std::string path = frames > 1 ? frame_path(out_path, f) : out_path;
        aurora::write_image(path, fb);
        if (!quiet) std::cout << "Wrote " << path << "\n";
      }
      if (digest) {
        std::cout << "frame " << f << " t=" << t << " digest " << aurora::digest64_to_hex(aurora::digest_framebuffer64(fb))
                  << "\n";
      }
      if (show_stats) {
        std::cout << "frame " << f << ": " << stats.render_ms << " ms on " << stats.threads_used
                  << " thread(s), mean alpha " << stats.mean_alpha << ", max alpha " << stats.max_alpha << ", aurora px "
                  << stats.aurora_pixels << "\n";
      }
    }

    return 0;
  } catch (const std::exception& e) {
    aurora::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
