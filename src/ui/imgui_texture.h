#pragma once

#include <cstdint>
#include <type_traits>

#include <imgui.h>

// ImTextureID is backend-defined: older Dear ImGui releases use `void*`,
// newer ones default to an integer (ImU64). These helpers hide the difference
// for the SDL_Renderer2 backend.

struct SDL_Texture;

namespace aurora::ui {

constexpr ImTextureID imgui_null_texture_id() {
  if constexpr (std::is_pointer_v<ImTextureID>) {
    return nullptr;
  } else {
    return static_cast<ImTextureID>(0);
  }
}

inline ImTextureID imgui_texture_id_from_sdl_texture(SDL_Texture* tex) {
  if (!tex) return imgui_null_texture_id();
  if constexpr (std::is_pointer_v<ImTextureID>) {
    return reinterpret_cast<ImTextureID>(tex);
  } else {
    return static_cast<ImTextureID>(reinterpret_cast<std::uintptr_t>(tex));
  }
}

} // namespace aurora::ui
