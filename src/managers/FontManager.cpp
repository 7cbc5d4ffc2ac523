/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/FontManager.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>

namespace {
  std::string lineKey(const std::string& text, const std::string& fontID, SDL_Color color) {
    return std::format("{}|{:02x}{:02x}{:02x}{:02x}|{}", fontID, color.r, color.g, color.b,
                       color.a, text);
  }
}

bool FontManager::init() {
  if (m_ttfReady) {
    return true;
  }
  if (!TTF_Init()) {
    FONT_CRITICAL(std::format("TTF_Init failed: {}", SDL_GetError()));
    return false;
  }
  m_ttfReady = true;
  FONT_INFO("SDL3_ttf ready");
  return true;
}

bool FontManager::loadFont(const std::string& fontFile, const std::string& fontID, int pointSize) {
  if (!m_ttfReady) {
    FONT_ERROR(std::format("Cannot load '{}' before init()", fontFile));
    return false;
  }

  std::unique_ptr<TTF_Font, decltype(&TTF_CloseFont)> font(
      TTF_OpenFont(fontFile.c_str(), static_cast<float>(pointSize)), TTF_CloseFont);
  if (!font) {
    FONT_ERROR(std::format("Cannot open '{}' at {}pt: {}", fontFile, pointSize, SDL_GetError()));
    return false;
  }

  TTF_SetFontHinting(font.get(), TTF_HINTING_LIGHT);
  TTF_SetFontKerning(font.get(), true);

  m_fonts.insert_or_assign(fontID, std::move(font));
  FONT_DEBUG(std::format("'{}' -> {} ({}pt)", fontID, fontFile, pointSize));
  return true;
}

bool FontManager::isFontLoaded(const std::string& fontID) const {
  return m_fonts.contains(fontID);
}

const FontManager::RenderedLine* FontManager::findOrRender(
    const std::string& text, const std::string& fontID,
    SDL_Color color, SDL_Renderer* renderer) {
  std::string key = lineKey(text, fontID, color);
  if (auto hit = m_lines.find(key); hit != m_lines.end()) {
    return &hit->second;
  }

  const auto font = m_fonts.find(fontID);
  if (font == m_fonts.end()) {
    FONT_ERROR(std::format("No font registered as '{}'", fontID));
    return nullptr;
  }

  std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)> surface(
      TTF_RenderText_Blended(font->second.get(), text.c_str(), text.size(), color),
      SDL_DestroySurface);
  if (!surface) {
    FONT_ERROR(std::format("TTF_RenderText_Blended failed: {}", SDL_GetError()));
    return nullptr;
  }

  RenderedLine line;
  line.texture.reset(SDL_CreateTextureFromSurface(renderer, surface.get()));
  if (!line.texture) {
    FONT_ERROR(std::format("Text texture upload failed: {}", SDL_GetError()));
    return nullptr;
  }
  line.width = static_cast<float>(surface->w);
  line.height = static_cast<float>(surface->h);

  if (m_lines.size() >= MAX_CACHED_LINES) {
    m_lines.clear();
  }
  return &m_lines.emplace(std::move(key), std::move(line)).first->second;
}

void FontManager::drawText(const std::string& text, const std::string& fontID,
                           float x, float y, SDL_Color color, SDL_Renderer* renderer,
                           TextAlign align) {
  if (text.empty() || !m_ttfReady) {
    return;
  }

  const RenderedLine* line = findOrRender(text, fontID, color, renderer);
  if (!line) {
    return;
  }

  if (align == TextAlign::TopRight) {
    x -= line->width;
  } else if (align == TextAlign::Center) {
    x -= line->width * 0.5f;
    y -= line->height * 0.5f;
  }

  // Whole pixels keep the glyphs sharp
  const SDL_FRect dst{std::round(x), std::round(y), line->width, line->height};
  SDL_RenderTexture(renderer, line->texture.get(), nullptr, &dst);
}

void FontManager::clean() {
  if (!m_ttfReady) {
    return;
  }
  m_lines.clear();
  m_fonts.clear();
  TTF_Quit();
  m_ttfReady = false;
  FONT_INFO("SDL3_ttf shut down");
}
