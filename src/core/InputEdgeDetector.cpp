/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/InputEdgeDetector.hpp"

namespace {
size_t index(LookoutAction action) {
    return static_cast<size_t>(action);
}
}

void InputEdgeDetector::update(const HeldActions& held) {
    m_previous = m_current;
    m_current = held;
}

bool InputEdgeDetector::isHeld(LookoutAction action) const {
    return m_current.test(index(action));
}

bool InputEdgeDetector::wasPressed(LookoutAction action) const {
    return m_current.test(index(action)) && !m_previous.test(index(action));
}

bool InputEdgeDetector::wasReleased(LookoutAction action) const {
    return !m_current.test(index(action)) && m_previous.test(index(action));
}

LookoutInput InputEdgeDetector::buildInput() const {
    LookoutInput input;
    input.moveLeft = isHeld(LookoutAction::MoveLeft);
    input.moveRight = isHeld(LookoutAction::MoveRight);
    input.aimLeft = isHeld(LookoutAction::AimLeft);
    input.aimRight = isHeld(LookoutAction::AimRight);
    input.aimUp = isHeld(LookoutAction::AimUp);
    input.aimDown = isHeld(LookoutAction::AimDown);
    input.toggleInstrument = wasPressed(LookoutAction::ToggleInstrument);
    input.reportAction = wasPressed(LookoutAction::Report);
    input.cycleWeather = wasPressed(LookoutAction::CycleWeather);
    return input;
}

void InputEdgeDetector::reset() {
    m_previous.reset();
    m_current.reset();
}
