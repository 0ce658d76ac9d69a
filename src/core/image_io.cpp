#include "aurora/core/image_io.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "aurora/util/file_io.h"

namespace aurora {

namespace {

void check_buffer(const std::vector<std::uint8_t>& rgba8, int width, int height) {
  if (width <= 0 || height <= 0) throw std::runtime_error("image: invalid size");
  const std::size_t need = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4;
  if (rgba8.size() != need) {
    throw std::runtime_error("image: expected " + std::to_string(need) + " bytes, got " +
                             std::to_string(rgba8.size()));
  }
}

std::string lower_extension(const std::string& path) {
  const auto slash = path.find_last_of("/\\");
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return {};
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace

std::string encode_ppm(const std::vector<std::uint8_t>& rgba8, int width, int height) {
  check_buffer(rgba8, width, height);

  std::string out = "P6\n" + std::to_string(width) + " " + std::to_string(height) + "\n255\n";
  out.reserve(out.size() + static_cast<std::size_t>(width) * height * 3);
  for (std::size_t i = 0; i < rgba8.size(); i += 4) {
    out.push_back(static_cast<char>(rgba8[i + 0]));
    out.push_back(static_cast<char>(rgba8[i + 1]));
    out.push_back(static_cast<char>(rgba8[i + 2]));
  }
  return out;
}

std::string encode_pam(const std::vector<std::uint8_t>& rgba8, int width, int height) {
  check_buffer(rgba8, width, height);

  std::string out = "P7\nWIDTH " + std::to_string(width) + "\nHEIGHT " + std::to_string(height) +
                    "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
  out.append(reinterpret_cast<const char*>(rgba8.data()), rgba8.size());
  return out;
}

void write_image(const std::string& path, const Framebuffer& fb) {
  const std::string ext = lower_extension(path);
  if (ext == ".ppm") {
    write_text_file(path, encode_ppm(to_rgba8(fb), fb.width, fb.height));
  } else if (ext == ".pam") {
    write_text_file(path, encode_pam(to_rgba8(fb), fb.width, fb.height));
  } else {
    throw std::runtime_error("Unsupported image extension for '" + path + "' (use .ppm or .pam)");
  }
}

} // namespace aurora
