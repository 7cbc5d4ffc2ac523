/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOOKOUT_SIMULATION_HPP
#define LOOKOUT_SIMULATION_HPP

#include "controllers/world/FireReportController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/LookoutConfig.hpp"
#include "core/LookoutInput.hpp"
#include "entities/Watchtower.hpp"
#include "managers/FirePool.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <random>

/**
 * LookoutSimulation is the per-frame body of the game, free of any SDL
 * dependency so it can be driven from tests.
 *
 * step() order (single-threaded):
 *   1. WeatherController::tick(dt)
 *   2. FirePool::tick(dt, weather)
 *   3. Watchtower::applyInput(input, dt)
 *   4. FireReportController::report() once if input.reportAction
 *
 * All randomness comes from one std::mt19937 seeded at construction, so two
 * simulations with the same seed, inputs and frame times behave identically.
 */
class LookoutSimulation {
public:
    /**
     * @param config Session tuning (already validated)
     * @param seed Generator seed for weather rolls and fire placement
     * @param reportOut Sink for the session weather announcement and report lines
     */
    LookoutSimulation(const Lookout::LookoutConfig& config, uint32_t seed,
                      std::ostream& reportOut = std::cout);

    LookoutSimulation(const LookoutSimulation&) = delete;
    LookoutSimulation& operator=(const LookoutSimulation&) = delete;

    /**
     * @brief Advance the simulation by one frame
     * @param deltaTime Seconds since the previous frame
     * @param input Input for this frame (edge flags already resolved)
     * @return The report result if input.reportAction was set
     */
    std::optional<ReportResult> step(float deltaTime, const LookoutInput& input);

    // Step to the next weather state in table order (debug key)
    void cycleWeather();

    WeatherController& getWeather() { return m_weather; }
    const WeatherController& getWeather() const { return m_weather; }
    FirePool& getFirePool() { return m_firePool; }
    const FirePool& getFirePool() const { return m_firePool; }
    Watchtower& getWatchtower() { return m_watchtower; }
    const Watchtower& getWatchtower() const { return m_watchtower; }
    FireReportController& getReporter() { return m_reporter; }
    const FireReportController& getReporter() const { return m_reporter; }

    const Lookout::LookoutConfig& getConfig() const { return m_config; }
    uint32_t getSeed() const { return m_seed; }
    double getElapsedTime() const { return m_elapsedTime; }
    uint64_t getFrameCount() const { return m_frameCount; }

private:
    // Declaration order matters: the generator must exist before its users
    Lookout::LookoutConfig m_config;
    uint32_t m_seed;
    std::mt19937 m_rng;
    WeatherController m_weather;
    FirePool m_firePool;
    Watchtower m_watchtower;
    FireReportController m_reporter;

    double m_elapsedTime{0.0};
    uint64_t m_frameCount{0};
};

#endif // LOOKOUT_SIMULATION_HPP
