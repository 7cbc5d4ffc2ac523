/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include <format>

WeatherController::WeatherController(const WeatherTable& table,
                                     const Lookout::WeatherTiming& timing,
                                     std::mt19937& rng)
    : m_table(table)
    , m_timing(timing)
    , m_rng(rng)
{
    // Session-start weather; no listener is attached yet
    m_currentWeather = rollWeather();
    m_timeUntilChange = changesPeriodically() ? rollDuration() : 0.0f;

    WEATHER_INFO(std::format("Session weather: {} (spawn x{}, lifetime x{})",
                             weatherName(m_currentWeather), spawnScale(), lifetimeScale()));
}

void WeatherController::tick(float elapsed)
{
    if (!changesPeriodically() || elapsed <= 0.0f) {
        return;
    }

    m_timeUntilChange -= elapsed;
    if (m_timeUntilChange > 0.0f) {
        return;
    }

    applyWeather(rollWeather());
    m_timeUntilChange = rollDuration();
}

void WeatherController::setWeather(WeatherState state)
{
    applyWeather(state);
    m_timeUntilChange = changesPeriodically() ? rollDuration() : 0.0f;
}

WeatherState WeatherController::rollWeather()
{
    std::uniform_int_distribution<size_t> dist(0, WEATHER_STATE_COUNT - 1);
    return ALL_WEATHER_STATES[dist(m_rng)];
}

float WeatherController::rollDuration()
{
    if (m_timing.maxDuration <= m_timing.minDuration) {
        return m_timing.minDuration;
    }
    std::uniform_real_distribution<float> dist(m_timing.minDuration, m_timing.maxDuration);
    return dist(m_rng);
}

void WeatherController::applyWeather(WeatherState next)
{
    const WeatherState previous = m_currentWeather;
    m_currentWeather = next;
    ++m_changeCount;

    WEATHER_INFO(std::format("Weather {} -> {} (spawn x{}, lifetime x{})",
                             weatherName(previous), weatherName(next),
                             spawnScale(), lifetimeScale()));

    if (m_changeListener) {
        m_changeListener(previous, next);
    }
}

std::string_view WeatherController::getCurrentWeatherString() const
{
    return weatherName(m_currentWeather);
}

std::string_view WeatherController::getCurrentWeatherDescription() const
{
    switch (m_currentWeather) {
        case WeatherState::Clear: return "Clear skies, long sight lines";
        case WeatherState::Hot:   return "Heat shimmer over the ridges";
        case WeatherState::Windy: return "Gusts are fanning the timber";
        case WeatherState::Rainy: return "Showers damping the valley";
    }
    return "Clear skies, long sight lines";
}
