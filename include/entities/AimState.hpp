/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AIM_STATE_HPP
#define AIM_STATE_HPP

#include "utils/Vector2D.hpp"

// Snapshot of the fire-finder sight for one frame (world space)
struct AimState {
    Vector2D crosshairPosition{};
    bool instrumentActive{false};
};

#endif // AIM_STATE_HPP
