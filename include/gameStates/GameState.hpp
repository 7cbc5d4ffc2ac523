/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <string_view>

struct SDL_Renderer;

// A screen GameEngine can drive. enter() and exit() bracket its lifetime.
class GameState {
 public:
  virtual ~GameState() = default;

  virtual bool enter() = 0;
  virtual void exit() = 0;

  // Reads the frame's input edges; runs once per frame, before any step
  virtual void handleInput() = 0;
  virtual void update(float stepSeconds) = 0;
  virtual void render(SDL_Renderer* renderer) = 0;

  // Window focus changes; the engine has already frozen or resumed stepping
  virtual void onFocusChanged([[maybe_unused]] bool focused) {}

  virtual std::string_view getName() const = 0;
};

#endif  // GAME_STATE_HPP
