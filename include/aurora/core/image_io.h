#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aurora/core/frame_renderer.h"

namespace aurora {

// Binary PPM (P6). Alpha is dropped.
std::string encode_ppm(const std::vector<std::uint8_t>& rgba8, int width, int height);

// Binary PAM (P7, TUPLTYPE RGB_ALPHA).
std::string encode_pam(const std::vector<std::uint8_t>& rgba8, int width, int height);

// Picks the encoder from the extension (.ppm or .pam, case-insensitive) and
// writes atomically. Throws std::runtime_error on any other extension.
void write_image(const std::string& path, const Framebuffer& fb);

} // namespace aurora
