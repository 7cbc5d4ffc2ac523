/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WEATHER_CONTROLLER_HPP
#define WEATHER_CONTROLLER_HPP

/**
 * @file WeatherController.hpp
 * @brief Owns the active WeatherState and the scales it applies to fires
 *
 * The controller rolls a weather state at session start and, when a
 * non-zero duration is configured, rolls again every time the duration
 * countdown runs out. Each roll is uniform over the four states and
 * independent of the previous one (the same state may be rolled again).
 *
 * Ownership: LookoutSimulation owns the controller. The random generator is
 * shared with FirePool so a fixed seed reproduces the whole session.
 *
 * Per-frame flow:
 *   LookoutSimulation::step() -> WeatherController::tick(dt)
 *     -> countdown expires -> new state rolled -> change listener notified
 *   FirePool::tick(dt, weather) reads spawnScale()/lifetimeScale()
 */

#include "core/LookoutConfig.hpp"
#include "world/WeatherTypes.hpp"
#include <cstdint>
#include <functional>
#include <random>
#include <string_view>

class WeatherController
{
public:
    /**
     * @brief Callback fired on every weather roll (self-transitions included)
     * @param previous State before the roll
     * @param current State after the roll
     */
    using ChangeListener = std::function<void(WeatherState previous, WeatherState current)>;

    /**
     * @brief Create the controller and roll the session-start weather
     * @param table Scale table keyed by WeatherState
     * @param timing Duration range for periodic changes (min 0 disables them)
     * @param rng Shared simulation generator, must outlive the controller
     */
    WeatherController(const WeatherTable& table, const Lookout::WeatherTiming& timing,
                      std::mt19937& rng);
    ~WeatherController() = default;

    // Non-copyable (holds a reference to the shared generator)
    WeatherController(const WeatherController&) = delete;
    WeatherController& operator=(const WeatherController&) = delete;

    /**
     * @brief Advance the weather countdown
     * @param elapsed Seconds since the previous tick
     *
     * At most one transition happens per tick; a long pause does not chain
     * several rolls together.
     */
    void tick(float elapsed);

    /**
     * @brief Get the active weather state
     */
    [[nodiscard]] WeatherState currentWeather() const { return m_currentWeather; }

    /**
     * @brief Get current weather as string (zero allocation)
     * @return String view: "Clear", "Hot", "Windy" or "Rainy"
     */
    [[nodiscard]] std::string_view getCurrentWeatherString() const;

    /**
     * @brief Get descriptive weather message for the HUD (zero allocation)
     */
    [[nodiscard]] std::string_view getCurrentWeatherDescription() const;

    /**
     * @brief Multiplier applied to the base spawn interval for the active state
     */
    [[nodiscard]] float spawnScale() const { return m_table.get(m_currentWeather).spawnIntervalScale; }

    /**
     * @brief Multiplier applied to a new fire's base lifetime for the active state
     */
    [[nodiscard]] float lifetimeScale() const { return m_table.get(m_currentWeather).lifetimeScale; }

    /**
     * @brief Force a weather state (debug key, scripted scenarios, tests)
     *
     * Resets the countdown and notifies the listener like a natural change.
     */
    void setWeather(WeatherState state);

    void setChangeListener(ChangeListener listener) { m_changeListener = std::move(listener); }

    [[nodiscard]] float timeUntilChange() const { return m_timeUntilChange; }
    [[nodiscard]] bool changesPeriodically() const { return m_timing.minDuration > 0.0f; }
    [[nodiscard]] uint32_t getChangeCount() const { return m_changeCount; }
    [[nodiscard]] const WeatherTable& getTable() const { return m_table; }

private:
    WeatherState rollWeather();
    float rollDuration();
    void applyWeather(WeatherState next);

    WeatherTable m_table;
    Lookout::WeatherTiming m_timing;
    std::mt19937& m_rng;

    WeatherState m_currentWeather{WeatherState::Clear};
    float m_timeUntilChange{0.0f};
    uint32_t m_changeCount{0};
    ChangeListener m_changeListener{};
};

#endif // WEATHER_CONTROLLER_HPP
