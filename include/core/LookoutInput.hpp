/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOOKOUT_INPUT_HPP
#define LOOKOUT_INPUT_HPP

#include <bitset>
#include <cstddef>
#include <cstdint>

// Logical game actions; InputManager maps physical keys onto these
enum class LookoutAction : uint8_t {
    MoveLeft,
    MoveRight,
    ToggleInstrument,
    Report,
    AimLeft,
    AimRight,
    AimUp,
    AimDown,
    CycleWeather,
    Quit,
    COUNT
};

inline constexpr size_t LOOKOUT_ACTION_COUNT{static_cast<size_t>(LookoutAction::COUNT)};

// Held state of every action for one frame
using HeldActions = std::bitset<LOOKOUT_ACTION_COUNT>;

/**
 * @brief Discrete per-frame input consumed by the simulation
 *
 * Movement and aim flags are level-triggered (true every frame the key is
 * held). toggleInstrument, reportAction and cycleWeather are edge-triggered
 * (true only on the frame the key goes down).
 *
 * pointerMoved marks a step that carries a new mouse position, given as a
 * fraction of the view in [0, 1] on each axis.
 */
struct LookoutInput {
    bool moveLeft{false};
    bool moveRight{false};
    bool toggleInstrument{false};
    bool reportAction{false};
    bool aimLeft{false};
    bool aimRight{false};
    bool aimUp{false};
    bool aimDown{false};
    bool cycleWeather{false};
    bool pointerMoved{false};
    float pointerX{0.5f};
    float pointerY{0.5f};
};

#endif // LOOKOUT_INPUT_HPP
