/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

// Point on the panorama: x is the azimuth in degrees, y the world row (0 at the top)
class Vector2D {
public:
    Vector2D() = default;
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }

    Vector2D operator+(const Vector2D& other) const {
        return Vector2D(m_x + other.m_x, m_y + other.m_y);
    }

    // Exact; fires sit on whole-unit lattice points
    bool operator==(const Vector2D& other) const = default;

    /**
     * @brief Squared distance with x measured the short way round
     * @param wrapWidth Panorama width; <= 0 means x does not wrap
     */
    static float wrappedDistanceSquared(const Vector2D& a, const Vector2D& b, float wrapWidth) {
        float dx = std::fabs(a.m_x - b.m_x);
        if (wrapWidth > 0.0f) {
            dx = std::fmod(dx, wrapWidth);
            dx = std::fmin(dx, wrapWidth - dx);
        }
        const float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
