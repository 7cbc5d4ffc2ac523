/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "gameStates/GameState.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string_view>
#include <utility>

class GameLoop;

/**
 * @brief SDL window, renderer and the one GameState on screen
 *
 * GameLoop calls handleEvents(), update() and render() each frame.
 * Focus changes pause the loop and are passed on to the state.
 */
class GameEngine {
 public:
  static GameEngine& Instance() {
    static GameEngine instance;
    return instance;
  }

  /**
   * @brief Brings up SDL video, the window, the renderer and SDL3_ttf
   * @param title Window title
   * @param width Window width in pixels (<= 0 selects 1280)
   * @param height Window height in pixels (<= 0 selects 720)
   * @param fullscreen Start in fullscreen mode
   * @param vsync Ask for hardware VSync; the loop paces itself if it is refused
   * @return false on any failure; call clean() afterwards regardless
   *
   * The loop must already be attached with setGameLoop().
   */
  bool init(std::string_view title, int width, int height, bool fullscreen, bool vsync = true);

  /**
   * @brief Exits the current state, then enters the new one
   * @return false if the new state's enter() fails (no state is active then)
   */
  bool setState(std::unique_ptr<GameState> state);

  void handleEvents();
  void update(float stepSeconds);
  void render();

  /**
   * @brief Exits the state and releases input, fonts, renderer, window and SDL in that order
   */
  void clean();

  void setGameLoop(std::shared_ptr<GameLoop> gameLoop) { m_gameLoop = std::move(gameLoop); }

  // Ends the loop after the current frame
  void requestQuit();

  int getLogicalWidth() const { return m_logicalWidth; }
  int getLogicalHeight() const { return m_logicalHeight; }

  void toggleFullscreen();

 private:
  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{nullptr, SDL_DestroyRenderer};
  std::unique_ptr<GameState> mp_currentState{nullptr};
  std::weak_ptr<GameLoop> m_gameLoop{};

  int m_logicalWidth{1280};
  int m_logicalHeight{720};
  bool m_isFullscreen{false};
  bool m_sdlInitialized{false};

  void configurePacing(bool vsyncRequested);
  void onFocusChanged(bool focused);
  void onWindowResize();

  GameEngine() = default;
  ~GameEngine() = default;
  GameEngine(const GameEngine&) = delete;
  GameEngine& operator=(const GameEngine&) = delete;
};

#endif  // GAME_ENGINE_HPP
