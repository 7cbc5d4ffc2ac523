/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Lookout {

enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1,  // ERROR and DEBUG collide with platform macros
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

/**
 * printf logger shared by every subsystem through the per-system macros
 * below. Debug builds print every level; release builds keep CRITICAL and
 * ERROR only and compile the rest away. CRITICAL and ERROR go to stderr.
 *
 * Quiet mode mutes everything; the test suites switch it on so Boost.Test
 * output stays readable.
 */
class Logger {
public:
  static void SetBenchmarkMode(bool enabled) {
    s_quiet.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_quiet.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char* system, const char* message) {
    if (s_quiet.load(std::memory_order_relaxed)) {
      return;
    }
    FILE* out = (level <= LogLevel::ERROR_LEVEL) ? stderr : stdout;
    std::fprintf(out, "Fire Lookout - [%s] %s: %s\n", system, levelName(level), message);
    std::fflush(out);
  }

private:
  static const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    }
    return "UNKNOWN";
  }

  static inline std::atomic<bool> s_quiet{false};
};

#define LOOKOUT_CRITICAL(system, msg)                                          \
  Lookout::Logger::Log(Lookout::LogLevel::CRITICAL, system, msg)
#define LOOKOUT_ERROR(system, msg)                                             \
  Lookout::Logger::Log(Lookout::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define LOOKOUT_WARN(system, msg)                                              \
  Lookout::Logger::Log(Lookout::LogLevel::WARNING, system, msg)
#define LOOKOUT_INFO(system, msg)                                              \
  Lookout::Logger::Log(Lookout::LogLevel::INFO, system, msg)
#define LOOKOUT_DEBUG(system, msg)                                             \
  Lookout::Logger::Log(Lookout::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define LOOKOUT_WARN(system, msg) ((void)0)
#define LOOKOUT_INFO(system, msg) ((void)0)
#define LOOKOUT_DEBUG(system, msg) ((void)0)
#endif

// Core Systems
#define GAMELOOP_CRITICAL(msg) LOOKOUT_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) LOOKOUT_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) LOOKOUT_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) LOOKOUT_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) LOOKOUT_DEBUG("GameLoop", msg)

#define GAMEENGINE_CRITICAL(msg) LOOKOUT_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) LOOKOUT_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) LOOKOUT_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) LOOKOUT_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) LOOKOUT_DEBUG("GameEngine", msg)

#define CONFIG_CRITICAL(msg) LOOKOUT_CRITICAL("LookoutConfig", msg)
#define CONFIG_ERROR(msg) LOOKOUT_ERROR("LookoutConfig", msg)
#define CONFIG_WARN(msg) LOOKOUT_WARN("LookoutConfig", msg)
#define CONFIG_INFO(msg) LOOKOUT_INFO("LookoutConfig", msg)
#define CONFIG_DEBUG(msg) LOOKOUT_DEBUG("LookoutConfig", msg)

// Manager Systems
#define INPUT_CRITICAL(msg) LOOKOUT_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) LOOKOUT_ERROR("InputManager", msg)
#define INPUT_WARN(msg) LOOKOUT_WARN("InputManager", msg)
#define INPUT_INFO(msg) LOOKOUT_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) LOOKOUT_DEBUG("InputManager", msg)

#define FONT_CRITICAL(msg) LOOKOUT_CRITICAL("FontManager", msg)
#define FONT_ERROR(msg) LOOKOUT_ERROR("FontManager", msg)
#define FONT_WARN(msg) LOOKOUT_WARN("FontManager", msg)
#define FONT_INFO(msg) LOOKOUT_INFO("FontManager", msg)
#define FONT_DEBUG(msg) LOOKOUT_DEBUG("FontManager", msg)

#define FIREPOOL_CRITICAL(msg) LOOKOUT_CRITICAL("FirePool", msg)
#define FIREPOOL_ERROR(msg) LOOKOUT_ERROR("FirePool", msg)
#define FIREPOOL_WARN(msg) LOOKOUT_WARN("FirePool", msg)
#define FIREPOOL_INFO(msg) LOOKOUT_INFO("FirePool", msg)
#define FIREPOOL_DEBUG(msg) LOOKOUT_DEBUG("FirePool", msg)

// Controllers
#define WEATHER_CRITICAL(msg) LOOKOUT_CRITICAL("WeatherController", msg)
#define WEATHER_ERROR(msg) LOOKOUT_ERROR("WeatherController", msg)
#define WEATHER_WARN(msg) LOOKOUT_WARN("WeatherController", msg)
#define WEATHER_INFO(msg) LOOKOUT_INFO("WeatherController", msg)
#define WEATHER_DEBUG(msg) LOOKOUT_DEBUG("WeatherController", msg)

#define REPORT_CRITICAL(msg) LOOKOUT_CRITICAL("FireReportController", msg)
#define REPORT_ERROR(msg) LOOKOUT_ERROR("FireReportController", msg)
#define REPORT_WARN(msg) LOOKOUT_WARN("FireReportController", msg)
#define REPORT_INFO(msg) LOOKOUT_INFO("FireReportController", msg)
#define REPORT_DEBUG(msg) LOOKOUT_DEBUG("FireReportController", msg)

// Entity and State Systems
#define PLAYER_CRITICAL(msg) LOOKOUT_CRITICAL("Watchtower", msg)
#define PLAYER_ERROR(msg) LOOKOUT_ERROR("Watchtower", msg)
#define PLAYER_WARN(msg) LOOKOUT_WARN("Watchtower", msg)
#define PLAYER_INFO(msg) LOOKOUT_INFO("Watchtower", msg)
#define PLAYER_DEBUG(msg) LOOKOUT_DEBUG("Watchtower", msg)

#define LOOKOUT_STATE_CRITICAL(msg) LOOKOUT_CRITICAL("LookoutState", msg)
#define LOOKOUT_STATE_ERROR(msg) LOOKOUT_ERROR("LookoutState", msg)
#define LOOKOUT_STATE_WARN(msg) LOOKOUT_WARN("LookoutState", msg)
#define LOOKOUT_STATE_INFO(msg) LOOKOUT_INFO("LookoutState", msg)
#define LOOKOUT_STATE_DEBUG(msg) LOOKOUT_DEBUG("LookoutState", msg)

#define SIMULATION_CRITICAL(msg) LOOKOUT_CRITICAL("LookoutSimulation", msg)
#define SIMULATION_ERROR(msg) LOOKOUT_ERROR("LookoutSimulation", msg)
#define SIMULATION_WARN(msg) LOOKOUT_WARN("LookoutSimulation", msg)
#define SIMULATION_INFO(msg) LOOKOUT_INFO("LookoutSimulation", msg)
#define SIMULATION_DEBUG(msg) LOOKOUT_DEBUG("LookoutSimulation", msg)

// Quiet mode convenience macros (tests and benchmarks)
#define LOOKOUT_ENABLE_BENCHMARK_MODE() Lookout::Logger::SetBenchmarkMode(true)
#define LOOKOUT_DISABLE_BENCHMARK_MODE()                                       \
  Lookout::Logger::SetBenchmarkMode(false)

} // namespace Lookout

#endif // LOGGER_HPP
