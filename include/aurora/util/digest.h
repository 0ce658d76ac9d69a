#pragma once

#include <cstdint>
#include <cstring>
#include <string>

namespace aurora {

// FNV-1a 64-bit accumulator.
//
// Multi-byte values are fed little-endian so digests match across hosts.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  // -0.0 and every NaN payload hash like +0.0 and the canonical quiet NaN.
  void add_float(float v) {
    std::uint32_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));
    if ((u << 1) == 0) u = 0;
    if ((u & 0x7f800000u) == 0x7f800000u && (u & 0x007fffffu) != 0) u = 0x7fc00000u;
    add_u32(u);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace aurora
