/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIRE_HPP
#define FIRE_HPP

#include "utils/Vector2D.hpp"
#include "world/WeatherTypes.hpp"
#include <cstdint>
#include <ostream>

using FireId = uint64_t;

inline constexpr FireId INVALID_FIRE_ID{0};

// Which ridgeline the fire burns on; far fires draw at half scale behind haze
enum class FireLayer : uint8_t {
    Mid,
    Far
};

inline std::ostream& operator<<(std::ostream& os, FireLayer layer) {
    return os << (layer == FireLayer::Far ? "Far" : "Mid");
}

/**
 * @brief One active ignition point, owned by FirePool
 *
 * remainingLifetime is fixed at spawn from the weather at that moment and
 * only ever counts down.
 */
struct Fire {
    FireId id{INVALID_FIRE_ID};
    Vector2D position{};
    float remainingLifetime{0.0f};
    float initialLifetime{0.0f};
    FireLayer layer{FireLayer::Mid};
    WeatherState spawnWeather{WeatherState::Clear};

    bool isExpired() const { return remainingLifetime <= 0.0f; }

    // 1.0 when freshly lit, 0.0 when about to burn out
    float lifetimeFraction() const {
        return initialLifetime > 0.0f ? remainingLifetime / initialLifetime : 0.0f;
    }
};

#endif // FIRE_HPP
