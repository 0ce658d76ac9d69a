#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "aurora/core/frame_renderer.h"
#include "aurora/core/image_io.h"
#include "aurora/util/file_io.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_image_io() {
  namespace fs = std::filesystem;

  const std::vector<std::uint8_t> rgba = {
      10, 20, 30, 40,   50, 60, 70, 80,   90, 100, 110, 120,
      130, 140, 150, 160, 170, 180, 190, 200, 210, 220, 230, 240,
  };

  // PPM: header then RGB triplets, alpha dropped.
  {
    const std::string ppm = aurora::encode_ppm(rgba, 3, 2);
    const std::string header = "P6\n3 2\n255\n";
    AURORA_ASSERT(ppm.compare(0, header.size(), header) == 0);
    AURORA_ASSERT(ppm.size() == header.size() + 3 * 2 * 3);
    AURORA_ASSERT(static_cast<unsigned char>(ppm[header.size() + 0]) == 10);
    AURORA_ASSERT(static_cast<unsigned char>(ppm[header.size() + 3]) == 50);
    AURORA_ASSERT(static_cast<unsigned char>(ppm.back()) == 230);
  }

  // PAM keeps alpha.
  {
    const std::string pam = aurora::encode_pam(rgba, 3, 2);
    AURORA_ASSERT(pam.rfind("P7\nWIDTH 3\nHEIGHT 2\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n", 0) == 0);
    AURORA_ASSERT(static_cast<unsigned char>(pam.back()) == 240);
    AURORA_ASSERT(pam.size() == pam.find("ENDHDR\n") + 7 + rgba.size());
  }

  // Size mismatch is rejected.
  {
    bool threw = false;
    try {
      (void)aurora::encode_ppm(rgba, 4, 2);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AURORA_ASSERT(threw);
  }

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");
  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "aurora_test_image_io";
  dir /= std::to_string(static_cast<long long>(nonce));
  fs::create_directories(dir, ec);
  AURORA_ASSERT(!ec);

  aurora::Framebuffer fb;
  fb.width = 3;
  fb.height = 2;
  fb.pixels.assign(6, aurora::Rgba{1.0f, 0.0f, 0.0f, 1.0f});

  // Extension picks the format, case-insensitively.
  {
    const fs::path ppm = dir / "frame.PPM";
    aurora::write_image(ppm.string(), fb);
    const std::string data = aurora::read_text_file(ppm.string());
    AURORA_ASSERT(data.rfind("P6\n", 0) == 0);
    AURORA_ASSERT(static_cast<unsigned char>(data[data.size() - 3]) == 255);
    AURORA_ASSERT(static_cast<unsigned char>(data[data.size() - 2]) == 0);

    const fs::path pam = dir / "frame.pam";
    aurora::write_image(pam.string(), fb);
    AURORA_ASSERT(aurora::read_text_file(pam.string()).rfind("P7\n", 0) == 0);
  }

  // Anything else is an error and writes nothing.
  {
    const fs::path png = dir / "frame.png";
    bool threw = false;
    try {
      aurora::write_image(png.string(), fb);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("frame.png") != std::string::npos;
    }
    AURORA_ASSERT(threw);
    AURORA_ASSERT(!fs::exists(png));
  }

  fs::remove_all(dir, ec);
  return 0;
}
