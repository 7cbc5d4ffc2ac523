/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Watchtower.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

Watchtower::Watchtower(const Lookout::ViewConfig& view, const Lookout::WorldBounds& bounds)
    : m_view(view)
    , m_bounds(bounds)
    , m_crosshairOffset(0.0f, view.aimHeight)
{
    m_azimuth = wrapAzimuth(view.startAzimuth);
    m_crosshairOffset = clampOffset(m_crosshairOffset);
}

void Watchtower::applyInput(const LookoutInput& input, float deltaTime) {
    if (input.toggleInstrument) {
        toggleInstrument();
    }

    const float pan = (input.moveRight ? 1.0f : 0.0f) - (input.moveLeft ? 1.0f : 0.0f);
    if (pan != 0.0f && deltaTime > 0.0f) {
        m_azimuth = wrapAzimuth(m_azimuth + pan * m_view.panSpeed * deltaTime);
    }

    // The sight can only be moved while it is up to the eye
    if (!m_instrumentActive) {
        return;
    }
    if (input.pointerMoved) {
        aimAtView(input.pointerX, input.pointerY);
    }
    if (deltaTime <= 0.0f) {
        return;
    }

    const float aimX = (input.aimRight ? 1.0f : 0.0f) - (input.aimLeft ? 1.0f : 0.0f);
    const float aimY = (input.aimDown ? 1.0f : 0.0f) - (input.aimUp ? 1.0f : 0.0f);
    if (aimX != 0.0f || aimY != 0.0f) {
        const float step = m_view.crosshairSpeed * deltaTime;
        setCrosshairOffset(m_crosshairOffset + Vector2D(aimX * step, aimY * step));
    }
}

void Watchtower::setAzimuth(float azimuth) {
    m_azimuth = wrapAzimuth(azimuth);
}

void Watchtower::setInstrumentActive(bool active) {
    if (m_instrumentActive == active) {
        return;
    }
    m_instrumentActive = active;
    PLAYER_DEBUG(active ? "Fire-finder raised" : "Fire-finder lowered");
}

void Watchtower::setCrosshairOffset(const Vector2D& offset) {
    m_crosshairOffset = clampOffset(offset);
}

void Watchtower::aimAtView(float viewX, float viewY) {
    setCrosshairOffset(Vector2D((viewX - 0.5f) * m_view.fieldOfView, viewY * m_bounds.height));
}

AimState Watchtower::getAimState() const {
    AimState aim;
    aim.crosshairPosition = Vector2D(getCrosshairAzimuth(), m_crosshairOffset.getY());
    aim.instrumentActive = m_instrumentActive;
    return aim;
}

float Watchtower::getCrosshairAzimuth() const {
    return wrapAzimuth(m_azimuth + m_crosshairOffset.getX());
}

float Watchtower::getCrosshairDeclination() const {
    return m_bounds.height * 0.5f - m_crosshairOffset.getY();
}

float Watchtower::wrapAzimuth(float azimuth) const {
    if (!m_bounds.wrapHorizontal) {
        return std::clamp(azimuth, 0.0f, m_bounds.width);
    }
    float wrapped = std::fmod(azimuth, m_bounds.width);
    if (wrapped < 0.0f) {
        wrapped += m_bounds.width;
    }
    // fmod of a tiny negative value can round up to exactly width
    return wrapped >= m_bounds.width ? 0.0f : wrapped;
}

Vector2D Watchtower::clampOffset(const Vector2D& offset) const {
    const float halfFov = m_view.fieldOfView * 0.5f;
    return Vector2D(std::clamp(offset.getX(), -halfFov, halfFov),
                    std::clamp(offset.getY(), 0.0f, m_bounds.height));
}
