/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FIRE_REPORT_CONTROLLER_HPP
#define FIRE_REPORT_CONTROLLER_HPP

/**
 * @file FireReportController.hpp
 * @brief Resolves the report action against the live fires
 *
 * Rules:
 * - Instrument lowered: InstrumentInactive, nothing else happens.
 * - Otherwise every fire within the detection radius of the crosshair is a
 *   candidate; the nearest wins, ties go to the lowest id.
 * - The winner is extinguished through FirePool::extinguish() and one
 *   report line is written to the output stream.
 *
 * Misses and an inactive instrument are ordinary results, never errors.
 */

#include "core/LookoutConfig.hpp"
#include "entities/AimState.hpp"
#include "entities/Fire.hpp"
#include "utils/Vector2D.hpp"
#include "world/WeatherTypes.hpp"
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

class FirePool;
class WeatherController;

enum class ReportOutcome : uint8_t {
    InstrumentInactive,
    NoFireDetected,
    FireDetected
};

// Stream operator for ReportOutcome to support Boost.Test output
inline std::ostream& operator<<(std::ostream& os, ReportOutcome outcome) {
    switch (outcome) {
        case ReportOutcome::InstrumentInactive: return os << "InstrumentInactive";
        case ReportOutcome::NoFireDetected:     return os << "NoFireDetected";
        case ReportOutcome::FireDetected:       return os << "FireDetected";
    }
    return os << "Unknown";
}

/**
 * @brief Result of one report action
 *
 * fireId and position are only meaningful for FireDetected.
 */
struct ReportResult {
    ReportOutcome outcome{ReportOutcome::NoFireDetected};
    FireId fireId{INVALID_FIRE_ID};
    Vector2D position{};
    WeatherState weather{WeatherState::Clear};

    bool detected() const { return outcome == ReportOutcome::FireDetected; }

    bool operator==(const ReportResult& other) const {
        return outcome == other.outcome && fireId == other.fireId &&
               position == other.position && weather == other.weather;
    }
    bool operator!=(const ReportResult& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const ReportResult& result) {
    os << result.outcome;
    if (result.detected()) {
        os << "(" << result.fireId << " at " << result.position.getX() << ", " << result.position.getY() << ")";
    }
    return os;
}

// Log entry for a confirmed report
struct FireReport {
    FireId fireId{INVALID_FIRE_ID};
    Vector2D position{};
    float azimuth{0.0f};
    float declination{0.0f};
    WeatherState weather{WeatherState::Clear};
    float simulationTime{0.0f};
};

class FireReportController
{
public:
    /**
     * @param weather Source of the weather stamped on each report
     * @param detection Detection radius around the crosshair
     * @param bounds World size (horizontal wrap and declination readout)
     * @param out Sink for report lines (standard output in the game)
     */
    FireReportController(const WeatherController& weather,
                         const Lookout::DetectionConfig& detection,
                         const Lookout::WorldBounds& bounds,
                         std::ostream& out = std::cout);

    FireReportController(const FireReportController&) = delete;
    FireReportController& operator=(const FireReportController&) = delete;

    /**
     * @brief Resolve a report action
     * @param aim Crosshair and instrument state for this frame
     * @param pool Live fires; the detected fire is removed from it
     * @return InstrumentInactive, NoFireDetected or FireDetected(id)
     */
    ReportResult report(const AimState& aim, FirePool& pool);

    /**
     * @brief Format the console line for a detected fire
     */
    std::string formatReportLine(const FireReport& report) const;

    const std::vector<FireReport>& getReports() const { return m_reports; }
    size_t getReportCount() const { return m_reports.size(); }
    uint32_t getMissCount() const { return m_missCount; }

    // Timestamp applied to subsequent reports
    void setSimulationTime(float seconds) { m_simulationTime = seconds; }

    float getDetectionRadius() const { return m_detection.radius; }

private:
    const Fire* findTarget(const AimState& aim, const FirePool& pool) const;

    const WeatherController& m_weather;
    Lookout::DetectionConfig m_detection;
    Lookout::WorldBounds m_bounds;
    std::ostream& m_out;

    std::vector<FireReport> m_reports{};
    uint32_t m_missCount{0};
    float m_simulationTime{0.0f};
};

#endif // FIRE_REPORT_CONTROLLER_HPP
