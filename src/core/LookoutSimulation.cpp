/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/LookoutSimulation.hpp"
#include "core/Logger.hpp"
#include <format>

LookoutSimulation::LookoutSimulation(const Lookout::LookoutConfig& config, uint32_t seed,
                                     std::ostream& reportOut)
    : m_config(config)
    , m_seed(seed)
    , m_rng(seed)
    , m_weather(m_config.weatherTable, m_config.weatherTiming, m_rng)
    , m_firePool(m_config.fires, m_config.world, m_rng)
    , m_watchtower(m_config.view, m_config.world)
    , m_reporter(m_weather, m_config.detection, m_config.world, reportOut)
{
    // Announced in every build, like the report lines
    reportOut << "Current weather: " << m_weather.currentWeather() << '\n';
    reportOut.flush();

    SIMULATION_INFO(std::format("Lookout simulation ready (seed {}, world {}x{}, base interval {}s)",
                                seed, m_config.world.width, m_config.world.height,
                                m_config.fires.baseInterval));
}

std::optional<ReportResult> LookoutSimulation::step(float deltaTime, const LookoutInput& input) {
    if (deltaTime < 0.0f) {
        SIMULATION_WARN(std::format("Negative frame time {} clamped to zero", deltaTime));
        deltaTime = 0.0f;
    }

    m_elapsedTime += deltaTime;
    ++m_frameCount;

    m_weather.tick(deltaTime);
    m_firePool.tick(deltaTime, m_weather);

    if (input.cycleWeather) {
        cycleWeather();
    }
    m_watchtower.applyInput(input, deltaTime);

    if (!input.reportAction) {
        return std::nullopt;
    }

    m_reporter.setSimulationTime(static_cast<float>(m_elapsedTime));
    return m_reporter.report(m_watchtower.getAimState(), m_firePool);
}

void LookoutSimulation::cycleWeather() {
    const size_t next = (static_cast<size_t>(m_weather.currentWeather()) + 1) % WEATHER_STATE_COUNT;
    m_weather.setWeather(ALL_WEATHER_STATES[next]);
}
