/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RIDGELINE_HPP
#define RIDGELINE_HPP

#include "core/LookoutConfig.hpp"
#include "entities/Fire.hpp"
#include "utils/Vector2D.hpp"

/**
 * Ridgeline describes the two mountain silhouettes of the panorama.
 *
 * Both profiles are sums of sines whose periods divide the world width, so
 * the skyline joins seamlessly where the azimuth wraps. y grows downward,
 * so "below the ridge" means y >= ridgeTop().
 */
class Ridgeline {
public:
    explicit Ridgeline(const Lookout::WorldBounds& bounds);

    // Top of the given ridge at an azimuth (world y)
    float ridgeTop(float azimuth, FireLayer layer) const;

    /**
     * @brief Whether a fire on the given layer can burn at this position
     *
     * Far ground is the band between the far skyline and the mid skyline,
     * the part of the far ridge left visible. Mid ground is everything on
     * or below the mid skyline.
     * @return false outside the world
     */
    bool isGround(const Vector2D& position, FireLayer layer) const;

    const Lookout::WorldBounds& getBounds() const { return m_bounds; }

private:
    Lookout::WorldBounds m_bounds;
};

#endif // RIDGELINE_HPP
