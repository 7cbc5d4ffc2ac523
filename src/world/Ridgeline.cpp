/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Ridgeline.hpp"
#include <cmath>
#include <numbers>

Ridgeline::Ridgeline(const Lookout::WorldBounds& bounds)
    : m_bounds(bounds)
{
}

float Ridgeline::ridgeTop(float azimuth, FireLayer layer) const {
    const float phase = 2.0f * std::numbers::pi_v<float> * azimuth / m_bounds.width;
    const float h = m_bounds.height;

    if (layer == FireLayer::Far) {
        return h * 0.37f
            + h * 0.06f * std::sin(3.0f * phase + 0.7f)
            + h * 0.03f * std::sin(7.0f * phase + 1.9f);
    }
    return h * 0.58f
        + h * 0.08f * std::sin(2.0f * phase + 2.3f)
        + h * 0.04f * std::sin(5.0f * phase)
        + h * 0.02f * std::sin(11.0f * phase + 0.4f);
}

bool Ridgeline::isGround(const Vector2D& position, FireLayer layer) const {
    const float x = position.getX();
    const float y = position.getY();
    if (x < 0.0f || x >= m_bounds.width || y < 0.0f || y >= m_bounds.height) {
        return false;
    }

    const float midTop = ridgeTop(x, FireLayer::Mid);
    if (layer == FireLayer::Far) {
        return y >= ridgeTop(x, FireLayer::Far) && y < midTop;
    }
    return y >= midTop;
}
