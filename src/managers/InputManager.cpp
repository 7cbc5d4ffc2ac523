/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <initializer_list>

InputManager::InputManager() {
  auto bind = [this](LookoutAction action, std::initializer_list<SDL_Scancode> keys) {
    m_bindings[static_cast<size_t>(action)].assign(keys.begin(), keys.end());
  };

  bind(LookoutAction::MoveLeft, {SDL_SCANCODE_LEFT, SDL_SCANCODE_A});
  bind(LookoutAction::MoveRight, {SDL_SCANCODE_RIGHT, SDL_SCANCODE_D});
  bind(LookoutAction::ToggleInstrument, {SDL_SCANCODE_O, SDL_SCANCODE_TAB});
  bind(LookoutAction::Report, {SDL_SCANCODE_SPACE});
  bind(LookoutAction::AimLeft, {SDL_SCANCODE_J});
  bind(LookoutAction::AimRight, {SDL_SCANCODE_L});
  bind(LookoutAction::AimUp, {SDL_SCANCODE_I});
  bind(LookoutAction::AimDown, {SDL_SCANCODE_K});
  bind(LookoutAction::CycleWeather, {SDL_SCANCODE_F1});
  bind(LookoutAction::Quit, {SDL_SCANCODE_ESCAPE});
}

void InputManager::update() {
  m_tappedThisFrame.clear();
}

void InputManager::reset() {
  m_tappedThisFrame.clear();
  mp_keyboard = nullptr;
  m_edgeDetector.reset();
  m_latched = LookoutInput{};
  INPUT_DEBUG("Held keys and latched presses dropped");
}

void InputManager::clean() {
  m_tappedThisFrame.clear();
  mp_keyboard = nullptr;
  m_edgeDetector.reset();
}

void InputManager::onKeyDown(const SDL_Event& event) {
  mp_keyboard = SDL_GetKeyboardState(nullptr);

  // Auto-repeat is not a new press
  if (event.key.repeat) {
    return;
  }
  const SDL_Scancode key = event.key.scancode;
  if (std::find(m_tappedThisFrame.begin(), m_tappedThisFrame.end(), key) == m_tappedThisFrame.end()) {
    m_tappedThisFrame.push_back(key);
  }
}

void InputManager::onKeyUp([[maybe_unused]] const SDL_Event& event) {
  mp_keyboard = SDL_GetKeyboardState(nullptr);
}

void InputManager::onMouseMove(const SDL_Event& event, float viewWidth, float viewHeight) {
  if (viewWidth <= 0.0f || viewHeight <= 0.0f) {
    return;
  }
  m_latched.pointerMoved = true;
  m_latched.pointerX = std::clamp(event.motion.x / viewWidth, 0.0f, 1.0f);
  m_latched.pointerY = std::clamp(event.motion.y / viewHeight, 0.0f, 1.0f);
}

bool InputManager::isBoundKeyActive(SDL_Scancode key) const {
  if (mp_keyboard && mp_keyboard[key]) {
    return true;
  }
  return std::find(m_tappedThisFrame.begin(), m_tappedThisFrame.end(), key) != m_tappedThisFrame.end();
}

HeldActions InputManager::getHeldActions() const {
  HeldActions held;
  for (size_t action = 0; action < LOOKOUT_ACTION_COUNT; ++action) {
    const KeyList& keys = m_bindings[action];
    held.set(action, std::any_of(keys.begin(), keys.end(),
                                 [this](SDL_Scancode key) { return isBoundKeyActive(key); }));
  }
  return held;
}

void InputManager::updateEdges() {
  m_edgeDetector.update(getHeldActions());

  const LookoutInput pressed = m_edgeDetector.buildInput();
  m_latched.toggleInstrument |= pressed.toggleInstrument;
  m_latched.reportAction |= pressed.reportAction;
  m_latched.cycleWeather |= pressed.cycleWeather;
}

LookoutInput InputManager::consumeInput() {
  LookoutInput input = m_edgeDetector.buildInput();
  input.toggleInstrument = m_latched.toggleInstrument;
  input.reportAction = m_latched.reportAction;
  input.cycleWeather = m_latched.cycleWeather;
  input.pointerMoved = m_latched.pointerMoved;
  input.pointerX = m_latched.pointerX;
  input.pointerY = m_latched.pointerY;
  m_latched = LookoutInput{};
  return input;
}
