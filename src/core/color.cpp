#include "aurora/core/color.h"

#include <cmath>

namespace aurora::color {

Vec3 oklab_to_linear_srgb(const Lab& lab) {
  const float l_ = lab.x + 0.3963377774f * lab.y + 0.2158037573f * lab.z;
  const float m_ = lab.x - 0.1055613458f * lab.y - 0.0638541728f * lab.z;
  const float s_ = lab.x - 0.0894841775f * lab.y - 1.2914855480f * lab.z;

  const float l = l_ * l_ * l_;
  const float m = m_ * m_ * m_;
  const float s = s_ * s_ * s_;

  return Vec3(+4.0767416621f * l - 3.3077115913f * m + 0.2309699292f * s,
              -1.2684380046f * l + 2.6097574011f * m - 0.3413193965f * s,
              -0.0041960863f * l - 0.7034186147f * m + 1.7076147010f * s);
}

Lab linear_srgb_to_oklab(const Vec3& rgb) {
  const float l = 0.4122214708f * rgb.x + 0.5363325363f * rgb.y + 0.0514459929f * rgb.z;
  const float m = 0.2119034982f * rgb.x + 0.6806995451f * rgb.y + 0.1073969566f * rgb.z;
  const float s = 0.0883024619f * rgb.x + 0.2817188376f * rgb.y + 0.6299787005f * rgb.z;

  const float l_ = std::cbrt(l);
  const float m_ = std::cbrt(m);
  const float s_ = std::cbrt(s);

  return Lab(0.2104542553f * l_ + 0.7936177850f * m_ - 0.0040720468f * s_,
             1.9779984951f * l_ - 2.4285922050f * m_ + 0.4505937099f * s_,
             0.0259040371f * l_ + 0.7827717662f * m_ - 0.8086757660f * s_);
}

float linear_to_srgb(float linear) {
  const float c = saturate(linear);
  if (c <= 0.0031308f) return 12.92f * c;
  return 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

std::uint8_t linear_to_srgb_u8(float linear) {
  if (std::isnan(linear)) return 0;
  const float v = linear_to_srgb(linear) * 255.0f + 0.5f;
  return static_cast<std::uint8_t>(clamp(v, 0.0f, 255.0f));
}

Vec3 srgb_u8_to_linear(int r, int g, int b) {
  const auto decode = [](int code) {
    const float c = clamp(static_cast<float>(code) / 255.0f, 0.0f, 1.0f);
    if (c <= 0.04045f) return c / 12.92f;
    return std::pow((c + 0.055f) / 1.055f, 2.4f);
  };
  return Vec3(decode(r), decode(g), decode(b));
}

} // namespace aurora::color
