/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/FireReportController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "managers/FirePool.hpp"
#include <cmath>
#include <format>

FireReportController::FireReportController(const WeatherController& weather,
                                           const Lookout::DetectionConfig& detection,
                                           const Lookout::WorldBounds& bounds,
                                           std::ostream& out)
    : m_weather(weather)
    , m_detection(detection)
    , m_bounds(bounds)
    , m_out(out)
{
    m_reports.reserve(16);
}

ReportResult FireReportController::report(const AimState& aim, FirePool& pool)
{
    ReportResult result;
    result.weather = m_weather.currentWeather();

    if (!aim.instrumentActive) {
        result.outcome = ReportOutcome::InstrumentInactive;
        REPORT_DEBUG("Report ignored, fire-finder is lowered");
        return result;
    }

    const Fire* target = findTarget(aim, pool);
    if (!target) {
        ++m_missCount;
        result.outcome = ReportOutcome::NoFireDetected;
        REPORT_DEBUG(std::format("Nothing burning near ({}, {})",
                                 aim.crosshairPosition.getX(), aim.crosshairPosition.getY()));
        return result;
    }

    // Copy out before extinguish() invalidates the pointer
    result.outcome = ReportOutcome::FireDetected;
    result.fireId = target->id;
    result.position = target->position;
    pool.extinguish(result.fireId);

    FireReport entry;
    entry.fireId = result.fireId;
    entry.position = result.position;
    entry.azimuth = result.position.getX();
    entry.declination = m_bounds.height * 0.5f - result.position.getY();
    entry.weather = result.weather;
    entry.simulationTime = m_simulationTime;
    m_reports.push_back(entry);

    m_out << formatReportLine(entry) << '\n';
    m_out.flush();

    REPORT_INFO(std::format("Fire {} confirmed, {} reported this session",
                            entry.fireId, m_reports.size()));
    return result;
}

std::string FireReportController::formatReportLine(const FireReport& report) const
{
    return std::format("Fire reported at Azimuth {}°, Declination {}° (x={}, y={}) - Weather: {}",
                       static_cast<int>(std::lround(report.azimuth)),
                       static_cast<int>(std::lround(report.declination)),
                       report.position.getX(), report.position.getY(),
                       weatherName(report.weather));
}

const Fire* FireReportController::findTarget(const AimState& aim, const FirePool& pool) const
{
    const float radiusSq = m_detection.radius * m_detection.radius;
    const float wrapWidth = m_bounds.wrapHorizontal ? m_bounds.width : 0.0f;

    const Fire* best = nullptr;
    float bestDistSq = 0.0f;
    for (const Fire& fire : pool.activeFires()) {
        const float distSq = Vector2D::wrappedDistanceSquared(aim.crosshairPosition,
                                                              fire.position, wrapWidth);
        if (distSq > radiusSq) {
            continue;
        }
        if (!best || distSq < bestDistSq || (distSq == bestDistSq && fire.id < best->id)) {
            best = &fire;
            bestDistSq = distSq;
        }
    }
    return best;
}
