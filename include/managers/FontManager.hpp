/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FONT_MANAGER_HPP
#define FONT_MANAGER_HPP

#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

// Point of the text box placed at (x, y)
enum class TextAlign : uint8_t {
  TopLeft,
  TopRight,
  Center
};

/**
 * @brief SDL3_ttf fonts for the HUD and the textures rendered from them
 *
 * Fonts are registered under an id and drawn one line at a time. Rendered
 * lines are cached per (font, colour, text); the readouts change as the
 * tower pans, so the cache is flushed whenever it fills. clean() must run
 * while the renderer that owns the cached textures is still alive.
 */
class FontManager {
 public:
  ~FontManager() { clean(); }

  static FontManager& Instance() {
    static FontManager instance;
    return instance;
  }

  bool init();

  /**
   * @brief Opens a font file and registers it under fontID
   * @return false if SDL3_ttf cannot open the file
   */
  bool loadFont(const std::string& fontFile, const std::string& fontID, int pointSize);
  bool isFontLoaded(const std::string& fontID) const;

  void drawText(const std::string& text, const std::string& fontID,
                float x, float y, SDL_Color color, SDL_Renderer* renderer,
                TextAlign align = TextAlign::TopLeft);

  void clean();

 private:
  struct RenderedLine {
    std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)> texture{nullptr, SDL_DestroyTexture};
    float width{0.0f};
    float height{0.0f};
  };

  const RenderedLine* findOrRender(const std::string& text, const std::string& fontID,
                                   SDL_Color color, SDL_Renderer* renderer);

  static constexpr size_t MAX_CACHED_LINES{128};

  std::unordered_map<std::string, std::unique_ptr<TTF_Font, decltype(&TTF_CloseFont)>> m_fonts{};
  std::unordered_map<std::string, RenderedLine> m_lines{};
  bool m_ttfReady{false};

  FontManager() = default;
  FontManager(const FontManager&) = delete;
  FontManager& operator=(const FontManager&) = delete;
};

#endif  // FONT_MANAGER_HPP
