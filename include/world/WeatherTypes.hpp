/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WEATHER_TYPES_HPP
#define WEATHER_TYPES_HPP

/**
 * @file WeatherTypes.hpp
 * @brief Weather states and the scale table that drives fire spawning
 *
 * Each WeatherState maps to a pair of multipliers:
 * - spawnIntervalScale: applied to the base spawn interval (lower = more fires)
 * - lifetimeScale: applied to the base fire lifetime at spawn time
 */

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

enum class WeatherState {
    Clear,
    Hot,
    Windy,
    Rainy
};

inline constexpr size_t WEATHER_STATE_COUNT{4};

inline constexpr std::array<WeatherState, WEATHER_STATE_COUNT> ALL_WEATHER_STATES{
    WeatherState::Clear, WeatherState::Hot, WeatherState::Windy, WeatherState::Rainy};

/**
 * @brief Display name for a weather state (zero allocation)
 * @return "Clear", "Hot", "Windy" or "Rainy"
 */
constexpr std::string_view weatherName(WeatherState state) {
    switch (state) {
        case WeatherState::Clear: return "Clear";
        case WeatherState::Hot:   return "Hot";
        case WeatherState::Windy: return "Windy";
        case WeatherState::Rainy: return "Rainy";
    }
    return "Unknown";
}

/**
 * @brief Parse a weather name as written in the config file
 * @return The matching state, or std::nullopt for unknown names
 */
inline std::optional<WeatherState> weatherFromName(std::string_view name) {
    for (WeatherState state : ALL_WEATHER_STATES) {
        if (weatherName(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}

// Stream operator for WeatherState enum to support Boost.Test output
inline std::ostream& operator<<(std::ostream& os, WeatherState state) {
    return os << weatherName(state);
}

struct WeatherScales {
    float spawnIntervalScale{1.0f};
    float lifetimeScale{1.0f};
};

/**
 * @brief Fixed lookup table keyed by WeatherState
 *
 * Defaults: rain slows ignitions and lets fires smoulder longer, heat and
 * wind shorten the gap between fires and burn them out sooner.
 */
class WeatherTable {
public:
    WeatherTable() {
        set(WeatherState::Clear, {1.0f, 1.0f});
        set(WeatherState::Hot, {0.6f, 0.7f});
        set(WeatherState::Windy, {0.75f, 0.8f});
        set(WeatherState::Rainy, {2.5f, 1.6f});
    }

    const WeatherScales& get(WeatherState state) const {
        return m_scales[static_cast<size_t>(state)];
    }

    void set(WeatherState state, const WeatherScales& scales) {
        m_scales[static_cast<size_t>(state)] = scales;
    }

private:
    std::array<WeatherScales, WEATHER_STATE_COUNT> m_scales{};
};

#endif // WEATHER_TYPES_HPP
