/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include "core/InputEdgeDetector.hpp"
#include "core/LookoutInput.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <boost/container/small_vector.hpp>

/**
 * @brief Turns SDL keyboard events into lookout actions
 *
 * GameEngine routes key events here. Once per frame updateEdges() folds the
 * keyboard into the InputEdgeDetector; the next simulation step collects
 * the result with consumeInput().
 *
 * Bindings: Left/A and Right/D pan, O or Tab raises the fire-finder, Space
 * reports, I/J/K/L nudge the crosshair, F1 cycles weather, Esc quits.
 * Mouse motion aims the crosshair while the fire-finder is raised.
 */
class InputManager {
 public:
  static InputManager& Instance() {
    static InputManager instance;
    return instance;
  }

  // Start of frame, before SDL events are polled
  void update();

  // Drops held keys and latched presses (focus lost, state entered)
  void reset();
  void clean();

  void onKeyDown(const SDL_Event& event);
  void onKeyUp(const SDL_Event& event);

  /**
   * @brief Latches the pointer as a fraction of the view
   * @param event Motion event already in render coordinates
   */
  void onMouseMove(const SDL_Event& event, float viewWidth, float viewHeight);

  /**
   * @brief Held state of every action this frame
   *
   * A key pressed and released between two frames still reads as held for
   * one frame, so a quick tap is never lost.
   */
  HeldActions getHeldActions() const;

  /**
   * @brief Feeds this frame to the edge detector and latches new presses
   *
   * Presses stay latched until consumeInput(), so a frame that takes no
   * simulation step keeps them and a frame that takes several reports once.
   */
  void updateEdges();

  // Held directions plus latched presses for one step; clears the latch
  LookoutInput consumeInput();

  bool wasActionPressed(LookoutAction action) const { return m_edgeDetector.wasPressed(action); }

 private:
  using KeyList = boost::container::small_vector<SDL_Scancode, 2>;

  std::array<KeyList, LOOKOUT_ACTION_COUNT> m_bindings{};
  boost::container::small_vector<SDL_Scancode, 8> m_tappedThisFrame{};
  const bool* mp_keyboard{nullptr};  // SDL-owned

  InputEdgeDetector m_edgeDetector{};
  LookoutInput m_latched{};

  InputManager();
  ~InputManager() = default;
  InputManager(const InputManager&) = delete;
  InputManager& operator=(const InputManager&) = delete;

  bool isBoundKeyActive(SDL_Scancode key) const;
};

#endif  // INPUT_MANAGER_HPP
