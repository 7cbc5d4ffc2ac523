/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WATCHTOWER_HPP
#define WATCHTOWER_HPP

#include "core/LookoutConfig.hpp"
#include "core/LookoutInput.hpp"
#include "entities/AimState.hpp"
#include "utils/Vector2D.hpp"

/**
 * @brief The player's lookout: view direction plus the fire-finder sight
 *
 * The view is centred on an azimuth that pans while the move keys are held
 * and wraps around the panorama. The crosshair sits at an offset from the
 * view centre; the offset can only be nudged while the instrument is open
 * and is clamped to the instrument's field of view.
 */
class Watchtower {
public:
    Watchtower(const Lookout::ViewConfig& view, const Lookout::WorldBounds& bounds);

    /**
     * @brief Apply one frame of input
     * @param input Held pan/aim flags and edge-triggered instrument toggle
     * @param deltaTime Seconds since the previous frame
     */
    void applyInput(const LookoutInput& input, float deltaTime);

    // View centre in degrees, always inside [0, world width)
    float getAzimuth() const { return m_azimuth; }
    void setAzimuth(float azimuth);

    bool isInstrumentActive() const { return m_instrumentActive; }
    void setInstrumentActive(bool active);
    void toggleInstrument() { setInstrumentActive(!m_instrumentActive); }

    // Crosshair relative to the view centre: x in degrees, y absolute world height
    const Vector2D& getCrosshairOffset() const { return m_crosshairOffset; }
    void setCrosshairOffset(const Vector2D& offset);

    /**
     * @brief Put the crosshair under a point of the view
     * @param viewX 0 = left edge, 1 = right edge of the field of view
     * @param viewY 0 = top, 1 = bottom of the world
     */
    void aimAtView(float viewX, float viewY);

    /**
     * @brief Aim state handed to FireReportController
     */
    AimState getAimState() const;

    // Instrument readout: bearing of the crosshair and its angle above the horizon line
    float getCrosshairAzimuth() const;
    float getCrosshairDeclination() const;

    float getFieldOfView() const { return m_view.fieldOfView; }

private:
    float wrapAzimuth(float azimuth) const;
    Vector2D clampOffset(const Vector2D& offset) const;

    Lookout::ViewConfig m_view;
    Lookout::WorldBounds m_bounds;

    float m_azimuth{0.0f};
    bool m_instrumentActive{false};
    Vector2D m_crosshairOffset{};
};

#endif // WATCHTOWER_HPP
