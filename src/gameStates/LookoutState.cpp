/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameStates/LookoutState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "entities/Fire.hpp"
#include "managers/FontManager.hpp"
#include "managers/InputManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>

namespace {

struct SkyColor {
  float r;
  float g;
  float b;
};

SkyColor skyColorFor(WeatherState weather) {
  switch (weather) {
    case WeatherState::Clear: return {112.0f, 164.0f, 220.0f};
    case WeatherState::Hot:   return {214.0f, 168.0f, 112.0f};
    case WeatherState::Windy: return {146.0f, 168.0f, 190.0f};
    case WeatherState::Rainy: return {88.0f, 98.0f, 114.0f};
  }
  return {112.0f, 164.0f, 220.0f};
}

// Alpha of the haze laid over the far ridge
Uint8 hazeAlphaFor(WeatherState weather) {
  switch (weather) {
    case WeatherState::Hot:   return 110;
    case WeatherState::Rainy: return 150;
    case WeatherState::Windy: return 60;
    case WeatherState::Clear: break;
  }
  return 80;
}

constexpr float RIDGE_COLUMN_WIDTH{4.0f};
constexpr float FLAME_WIDTH{10.0f};
constexpr float FLAME_HEIGHT{14.0f};
constexpr float SMOKE_HEIGHT{120.0f};
constexpr int SMOKE_PUFFS{8};
constexpr int RETICLE_SEGMENTS{32};
constexpr const char* HUD_FONT_ID{"hud"};

} // namespace

LookoutState::LookoutState(const Lookout::LookoutConfig& config, uint32_t seed)
    : m_config(config), m_seed(seed), m_ridgeline(config.world) {}

bool LookoutState::enter() {
  LOOKOUT_STATE_INFO(std::format("Entering lookout with seed {}", m_seed));

  mp_simulation = std::make_unique<LookoutSimulation>(m_config, m_seed);

  auto& fontMgr = FontManager::Instance();
  m_hasHudFont = fontMgr.isFontLoaded(HUD_FONT_ID) ||
                 fontMgr.loadFont(m_config.graphics.fontPath, HUD_FONT_ID, m_config.graphics.fontSize);
  if (!m_hasHudFont) {
    LOOKOUT_STATE_WARN("HUD font unavailable, falling back to SDL debug text");
  }

  // Fires only start on the visible ground of their own ridge
  mp_simulation->getFirePool().setTerrainPredicate(
      [this](const Vector2D& position, FireLayer layer) { return m_ridgeline.isGround(position, layer); });

  mp_simulation->getWeather().setChangeListener(
      [this](WeatherState previous, WeatherState current) { onWeatherChanged(previous, current); });

  const WeatherState weather = mp_simulation->getWeather().currentWeather();
  setSkyTarget(weather);
  m_skyR = m_skyTargetR;
  m_skyG = m_skyTargetG;
  m_skyB = m_skyTargetB;

  m_animTime = 0.0f;
  m_statusBuffer = std::format("{}. Raise the fire-finder with O.",
                               mp_simulation->getWeather().getCurrentWeatherDescription());
  m_statusTimer = STATUS_DISPLAY_TIME;

  InputManager::Instance().reset();
  return true;
}

void LookoutState::update(float deltaTime) {
  if (!mp_simulation) {
    return;
  }

  m_animTime += deltaTime;
  updateSky(deltaTime);

  if (m_statusTimer > 0.0f) {
    m_statusTimer -= deltaTime;
    if (m_statusTimer <= 0.0f) {
      m_statusBuffer.clear();
    }
  }

  const LookoutInput input = InputManager::Instance().consumeInput();
  const auto result = mp_simulation->step(deltaTime, input);
  if (!result) {
    return;
  }

  switch (result->outcome) {
    case ReportOutcome::FireDetected: {
      const auto& reports = mp_simulation->getReporter().getReports();
      m_statusBuffer = mp_simulation->getReporter().formatReportLine(reports.back());
      break;
    }
    case ReportOutcome::NoFireDetected:
      m_statusBuffer = "No fire under the crosshair";
      break;
    case ReportOutcome::InstrumentInactive:
      m_statusBuffer = "Raise the fire-finder (O) before reporting";
      break;
  }
  m_statusTimer = STATUS_DISPLAY_TIME;
}

void LookoutState::handleInput() {
  const auto& inputMgr = InputManager::Instance();

  if (inputMgr.wasActionPressed(LookoutAction::Quit)) {
    GameEngine::Instance().requestQuit();
  }
}

void LookoutState::render(SDL_Renderer* renderer) {
  if (!mp_simulation) {
    return;
  }

  const auto& gameEngine = GameEngine::Instance();
  m_viewWidth = static_cast<float>(gameEngine.getLogicalWidth());
  m_viewHeight = static_cast<float>(gameEngine.getLogicalHeight());

  renderSky(renderer);
  renderRidge(renderer, FireLayer::Far);
  renderFires(renderer, FireLayer::Far);
  renderHaze(renderer);
  renderRidge(renderer, FireLayer::Mid);
  renderFires(renderer, FireLayer::Mid);

  if (mp_simulation->getWatchtower().isInstrumentActive()) {
    renderInstrument(renderer);
  }
  renderHud(renderer);

  if (m_paused) {
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 120);
    const SDL_FRect dim{0.0f, 0.0f, m_viewWidth, m_viewHeight};
    SDL_RenderFillRect(renderer, &dim);
    drawHudText(renderer, "PAUSED", m_viewWidth * 0.5f, m_viewHeight * 0.5f,
                {255, 255, 255, 255}, TextAlign::Center);
  }
}

void LookoutState::onFocusChanged(bool focused) {
  m_paused = !focused;
  LOOKOUT_STATE_DEBUG(focused ? "Lookout back in focus" : "Lookout lost focus, simulation frozen");
}

void LookoutState::exit() {
  if (mp_simulation) {
    const auto& pool = mp_simulation->getFirePool();
    const auto& reporter = mp_simulation->getReporter();
    LOOKOUT_STATE_INFO(std::format(
        "Shift over after {:.1f}s: {} fires spotted, {} missed reports, {} burned out, {} spawned",
        mp_simulation->getElapsedTime(), reporter.getReportCount(), reporter.getMissCount(),
        pool.getTotalExpired(), pool.getTotalSpawned()));

    mp_simulation->getWeather().setChangeListener(nullptr);
    mp_simulation->getFirePool().setTerrainPredicate(nullptr);
    mp_simulation.reset();
  }
}

std::string_view LookoutState::getName() const {
  return "LookoutState";
}

void LookoutState::onWeatherChanged(WeatherState previous, WeatherState current) {
  LOOKOUT_STATE_DEBUG(std::format("Weather {} -> {}", weatherName(previous), weatherName(current)));
  setSkyTarget(current);

  if (previous != current && mp_simulation) {
    m_statusBuffer = std::string(mp_simulation->getWeather().getCurrentWeatherDescription());
    m_statusTimer = STATUS_DISPLAY_TIME;
  }
}

void LookoutState::setSkyTarget(WeatherState weather) {
  const SkyColor color = skyColorFor(weather);
  m_skyTargetR = color.r;
  m_skyTargetG = color.g;
  m_skyTargetB = color.b;
}

void LookoutState::updateSky(float deltaTime) {
  // Exponential smoothing toward the target tint
  const float lerpFactor = 1.0f - std::exp(-deltaTime * (3.0f / SKY_TRANSITION_DURATION));
  m_skyR += (m_skyTargetR - m_skyR) * lerpFactor;
  m_skyG += (m_skyTargetG - m_skyG) * lerpFactor;
  m_skyB += (m_skyTargetB - m_skyB) * lerpFactor;
}

float LookoutState::pixelsPerDegree() const {
  return m_viewWidth / mp_simulation->getWatchtower().getFieldOfView();
}

float LookoutState::worldToScreenX(float worldX) const {
  const float worldWidth = m_config.world.width;
  float delta = worldX - mp_simulation->getWatchtower().getAzimuth();
  if (m_config.world.wrapHorizontal) {
    // Shortest signed angle to the view centre
    delta = std::fmod(delta + worldWidth * 1.5f, worldWidth) - worldWidth * 0.5f;
  }
  return m_viewWidth * 0.5f + delta * pixelsPerDegree();
}

float LookoutState::worldToScreenY(float worldY) const {
  return worldY / m_config.world.height * m_viewHeight;
}

float LookoutState::screenToWorldX(float screenX) const {
  const float worldWidth = m_config.world.width;
  float worldX = mp_simulation->getWatchtower().getAzimuth() +
                 (screenX - m_viewWidth * 0.5f) / pixelsPerDegree();
  if (m_config.world.wrapHorizontal) {
    worldX = std::fmod(worldX, worldWidth);
    if (worldX < 0.0f) {
      worldX += worldWidth;
    }
  }
  return worldX;
}

void LookoutState::renderSky(SDL_Renderer* renderer) const {
  SDL_SetRenderDrawColor(renderer, static_cast<Uint8>(m_skyR), static_cast<Uint8>(m_skyG),
                         static_cast<Uint8>(m_skyB), 255);
  const SDL_FRect sky{0.0f, 0.0f, m_viewWidth, m_viewHeight};
  SDL_RenderFillRect(renderer, &sky);
}

void LookoutState::renderRidge(SDL_Renderer* renderer, FireLayer layer) const {
  if (layer == FireLayer::Far) {
    SDL_SetRenderDrawColor(renderer, 78, 96, 112, 255);
  } else {
    SDL_SetRenderDrawColor(renderer, 46, 70, 52, 255);
  }

  for (float sx = 0.0f; sx < m_viewWidth; sx += RIDGE_COLUMN_WIDTH) {
    const float worldX = screenToWorldX(sx + RIDGE_COLUMN_WIDTH * 0.5f);
    const float top = worldToScreenY(m_ridgeline.ridgeTop(worldX, layer));
    const SDL_FRect column{sx, top, RIDGE_COLUMN_WIDTH, m_viewHeight - top};
    SDL_RenderFillRect(renderer, &column);
  }
}

void LookoutState::renderHaze(SDL_Renderer* renderer) const {
  const WeatherState weather = mp_simulation->getWeather().currentWeather();
  SDL_SetRenderDrawColor(renderer, static_cast<Uint8>(m_skyR), static_cast<Uint8>(m_skyG),
                         static_cast<Uint8>(m_skyB), hazeAlphaFor(weather));
  const SDL_FRect haze{0.0f, 0.0f, m_viewWidth, m_viewHeight};
  SDL_RenderFillRect(renderer, &haze);
}

void LookoutState::renderFires(SDL_Renderer* renderer, FireLayer layer) const {
  const float margin = SMOKE_HEIGHT;
  for (const Fire& fire : mp_simulation->getFirePool().activeFires()) {
    if (fire.layer != layer) {
      continue;
    }
    const float sx = worldToScreenX(fire.position.getX());
    if (sx < -margin || sx > m_viewWidth + margin) {
      continue;
    }
    renderFire(renderer, fire);
  }
}

void LookoutState::renderFire(SDL_Renderer* renderer, const Fire& fire) const {
  const float scale = (fire.layer == FireLayer::Far) ? 0.5f : 1.0f;
  const float sx = worldToScreenX(fire.position.getX());
  const float sy = worldToScreenY(fire.position.getY());

  // Columns thin out as the fire burns down
  const float strength = 0.4f + 0.6f * fire.lifetimeFraction();
  const float drift = (mp_simulation->getWeather().currentWeather() == WeatherState::Windy) ? 1.6f : 0.4f;
  const float phase = static_cast<float>(fire.id) * 1.37f;

  for (int i = 0; i < SMOKE_PUFFS; ++i) {
    const float t = static_cast<float>(i) / SMOKE_PUFFS;
    const float rise = t * SMOKE_HEIGHT * scale * strength;
    const float sway = std::sin(m_animTime * 1.3f + phase + t * 4.0f) * 3.0f * scale;
    const float size = (8.0f + 14.0f * t) * scale;
    const Uint8 alpha = static_cast<Uint8>((1.0f - t) * 150.0f * strength);

    SDL_SetRenderDrawColor(renderer, 170, 170, 165, alpha);
    const SDL_FRect puff{sx - size * 0.5f + sway + rise * drift * 0.5f,
                         sy - FLAME_HEIGHT * scale - rise - size * 0.5f, size, size};
    SDL_RenderFillRect(renderer, &puff);
  }

  const float flicker = 0.85f + 0.15f * std::sin(m_animTime * 11.0f + phase);
  const float flameW = FLAME_WIDTH * scale;
  const float flameH = FLAME_HEIGHT * scale * flicker;

  SDL_SetRenderDrawColor(renderer, 230, 90, 30, 255);
  const SDL_FRect flame{sx - flameW * 0.5f, sy - flameH, flameW, flameH};
  SDL_RenderFillRect(renderer, &flame);

  SDL_SetRenderDrawColor(renderer, 255, 210, 90, 255);
  const SDL_FRect core{sx - flameW * 0.25f, sy - flameH * 0.6f, flameW * 0.5f, flameH * 0.6f};
  SDL_RenderFillRect(renderer, &core);
}

void LookoutState::renderInstrument(SDL_Renderer* renderer) const {
  const auto& watchtower = mp_simulation->getWatchtower();
  const AimState aim = watchtower.getAimState();
  const float cx = worldToScreenX(aim.crosshairPosition.getX());
  const float cy = worldToScreenY(aim.crosshairPosition.getY());

  // Sight frame darkens the outer edge of the view
  const float frame = m_viewWidth * 0.06f;
  SDL_SetRenderDrawColor(renderer, 20, 18, 14, 170);
  const std::array<SDL_FRect, 2> bars{{
      {0.0f, 0.0f, frame, m_viewHeight},
      {m_viewWidth - frame, 0.0f, frame, m_viewHeight},
  }};
  SDL_RenderFillRects(renderer, bars.data(), static_cast<int>(bars.size()));

  // Detection reticle
  const float radius = mp_simulation->getReporter().getDetectionRadius();
  const float rx = radius * pixelsPerDegree();
  const float ry = radius / m_config.world.height * m_viewHeight;
  std::array<SDL_FPoint, RETICLE_SEGMENTS + 1> ring{};
  for (int i = 0; i <= RETICLE_SEGMENTS; ++i) {
    const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) / RETICLE_SEGMENTS;
    ring[static_cast<size_t>(i)] = SDL_FPoint{cx + std::cos(angle) * rx, cy + std::sin(angle) * ry};
  }
  SDL_SetRenderDrawColor(renderer, 20, 20, 20, 230);
  SDL_RenderLines(renderer, ring.data(), static_cast<int>(ring.size()));

  SDL_RenderLine(renderer, cx - rx * 1.6f, cy, cx - rx * 0.4f, cy);
  SDL_RenderLine(renderer, cx + rx * 0.4f, cy, cx + rx * 1.6f, cy);
  SDL_RenderLine(renderer, cx, cy - ry * 1.6f, cx, cy - ry * 0.4f);
  SDL_RenderLine(renderer, cx, cy + ry * 0.4f, cx, cy + ry * 1.6f);

  const std::string readout = std::format("Target Azimuth: {:.0f}  Declination: {:.0f}",
                                          watchtower.getCrosshairAzimuth(),
                                          watchtower.getCrosshairDeclination());
  drawHudText(renderer, readout, frame + 12.0f, m_viewHeight - 30.0f, {255, 240, 200, 255});
}

void LookoutState::renderHud(SDL_Renderer* renderer) const {
  const auto& weather = mp_simulation->getWeather();
  const auto& watchtower = mp_simulation->getWatchtower();

  const std::string header = std::format("Heading {:.0f}  |  Weather: {}  |  Reported: {}",
                                         watchtower.getAzimuth(),
                                         weather.getCurrentWeatherString(),
                                         mp_simulation->getReporter().getReportCount());
  SDL_SetRenderDrawColor(renderer, 0, 0, 0, 140);
  const SDL_FRect strip{0.0f, 0.0f, m_viewWidth, 28.0f};
  SDL_RenderFillRect(renderer, &strip);

  drawHudText(renderer, header, 10.0f, 6.0f, {240, 240, 240, 255});

  const int shiftSeconds = static_cast<int>(mp_simulation->getElapsedTime());
  drawHudText(renderer, std::format("Shift {:02}:{:02}", shiftSeconds / 60, shiftSeconds % 60),
              m_viewWidth - 10.0f, 6.0f, {200, 200, 200, 255}, TextAlign::TopRight);

  if (!m_statusBuffer.empty()) {
    drawHudText(renderer, m_statusBuffer, 10.0f, 38.0f, {255, 220, 120, 255});
  }
}

void LookoutState::drawHudText(SDL_Renderer* renderer, const std::string& text, float x, float y,
                               SDL_Color color, TextAlign align) const {
  if (m_hasHudFont) {
    FontManager::Instance().drawText(text, HUD_FONT_ID, x, y, color, renderer, align);
    return;
  }

  // Debug font glyphs are fixed-size squares
  const float glyph = static_cast<float>(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE);
  const float width = glyph * static_cast<float>(text.size());
  if (align == TextAlign::Center) {
    x -= width * 0.5f;
    y -= glyph * 0.5f;
  } else {
    if (align == TextAlign::TopRight) {
      x -= width;
    }
    y += 4.0f;
  }
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
  SDL_RenderDebugText(renderer, x, y, text.c_str());
}
