/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOOKOUT_STATE_HPP
#define LOOKOUT_STATE_HPP

#include "core/LookoutConfig.hpp"
#include "core/LookoutSimulation.hpp"
#include "gameStates/GameState.hpp"
#include "managers/FontManager.hpp"
#include "world/Ridgeline.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct Fire;

class LookoutState : public GameState {
public:
  LookoutState(const Lookout::LookoutConfig& config, uint32_t seed);

  bool enter() override;
  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer) override;
  void handleInput() override;
  void exit() override;
  void onFocusChanged(bool focused) override;
  std::string_view getName() const override;

  const LookoutSimulation* getSimulation() const { return mp_simulation.get(); }

private:
  Lookout::LookoutConfig m_config;
  uint32_t m_seed;
  std::unique_ptr<LookoutSimulation> mp_simulation{nullptr};
  Ridgeline m_ridgeline;

  // Viewport in pixels, refreshed each render
  float m_viewWidth{1280.0f};
  float m_viewHeight{720.0f};

  // Seconds since enter(), drives flame flicker and smoke drift
  float m_animTime{0.0f};

  // Sky tint eases toward the colour of the current weather
  float m_skyR{0.0f};
  float m_skyG{0.0f};
  float m_skyB{0.0f};
  float m_skyTargetR{0.0f};
  float m_skyTargetG{0.0f};
  float m_skyTargetB{0.0f};
  static constexpr float SKY_TRANSITION_DURATION{4.0f};  // seconds

  // Feedback line under the HUD, cleared when the timer runs out
  std::string m_statusBuffer{};
  float m_statusTimer{0.0f};
  static constexpr float STATUS_DISPLAY_TIME{5.0f};

  bool m_hasHudFont{false};
  bool m_paused{false};

  void onWeatherChanged(WeatherState previous, WeatherState current);
  void setSkyTarget(WeatherState weather);
  void updateSky(float deltaTime);

  float worldToScreenX(float worldX) const;
  float worldToScreenY(float worldY) const;
  float screenToWorldX(float screenX) const;
  float pixelsPerDegree() const;

  void renderSky(SDL_Renderer* renderer) const;
  void renderRidge(SDL_Renderer* renderer, FireLayer layer) const;
  void renderHaze(SDL_Renderer* renderer) const;
  void renderFires(SDL_Renderer* renderer, FireLayer layer) const;
  void renderFire(SDL_Renderer* renderer, const Fire& fire) const;
  void renderInstrument(SDL_Renderer* renderer) const;
  void renderHud(SDL_Renderer* renderer) const;
  void drawHudText(SDL_Renderer* renderer, const std::string& text, float x, float y,
                   SDL_Color color, TextAlign align = TextAlign::TopLeft) const;
};

#endif // LOOKOUT_STATE_HPP
