/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE LookoutConfigTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/LookoutConfig.hpp"
#include "utils/JsonReader.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace Lookout;

namespace {

struct QuietLogs {
    QuietLogs() { LOOKOUT_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogs() { LOOKOUT_DISABLE_BENCHMARK_MODE(); }
};

LookoutConfig parseConfig(const std::string& json) {
    JsonReader reader;
    BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());
    return LookoutConfig::fromJson(reader.getRoot());
}

} // namespace

BOOST_GLOBAL_FIXTURE(QuietLogs);

// ============================================================================
// DEFAULTS AND OVERRIDES
// ============================================================================

BOOST_AUTO_TEST_SUITE(LoadingTests)

BOOST_AUTO_TEST_CASE(TestEmptyDocumentKeepsDefaults) {
    const LookoutConfig config = parseConfig("{}");

    BOOST_CHECK_EQUAL(config.world.width, 360.0f);
    BOOST_CHECK_EQUAL(config.world.height, 90.0f);
    BOOST_CHECK(config.world.wrapHorizontal);
    BOOST_CHECK_EQUAL(config.fires.baseInterval, 6.0f);
    BOOST_CHECK_EQUAL(config.fires.baseLifetime, 30.0f);
    BOOST_CHECK_EQUAL(config.fires.maxPlacementAttempts, 20);
    BOOST_CHECK_EQUAL(config.detection.radius, 6.0f);
    BOOST_CHECK_EQUAL(config.weatherTiming.minDuration, 60.0f);
    BOOST_CHECK_EQUAL(config.weatherTiming.maxDuration, 120.0f);
    BOOST_CHECK_EQUAL(config.weatherTable.get(WeatherState::Rainy).spawnIntervalScale, 2.5f);
    BOOST_CHECK(config.graphics.vsync);
    BOOST_CHECK_CLOSE(config.graphics.targetFPS, 60.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.graphics.fontPath, "res/fonts/DejaVuSansMono.ttf");
    BOOST_CHECK_EQUAL(config.graphics.fontSize, 16);
}

BOOST_AUTO_TEST_CASE(TestOverrides) {
    const LookoutConfig config = parseConfig(R"({
        "world": { "width": 400, "height": 200, "wrap": false },
        "fires": { "base_interval": 10, "base_lifetime": 5, "far_layer_chance": 0 },
        "weather": { "min_duration": 0, "max_duration": 0 },
        "detection": { "radius": 3.5 },
        "view": { "field_of_view": 90, "start_azimuth": 180 },
        "graphics": { "font_path": "fonts/other.ttf", "font_size": 20, "target_fps": 144 }
    })");

    BOOST_CHECK_EQUAL(config.world.width, 400.0f);
    BOOST_CHECK_EQUAL(config.world.height, 200.0f);
    BOOST_CHECK(!config.world.wrapHorizontal);
    BOOST_CHECK_EQUAL(config.fires.baseInterval, 10.0f);
    BOOST_CHECK_EQUAL(config.fires.baseLifetime, 5.0f);
    BOOST_CHECK_EQUAL(config.fires.farLayerChance, 0.0f);
    BOOST_CHECK_EQUAL(config.weatherTiming.minDuration, 0.0f);
    BOOST_CHECK_EQUAL(config.detection.radius, 3.5f);
    BOOST_CHECK_EQUAL(config.view.fieldOfView, 90.0f);
    BOOST_CHECK_EQUAL(config.view.startAzimuth, 180.0f);
    BOOST_CHECK_EQUAL(config.graphics.fontPath, "fonts/other.ttf");
    BOOST_CHECK_EQUAL(config.graphics.fontSize, 20);
    BOOST_CHECK_CLOSE(config.graphics.targetFPS, 144.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestWeatherTableOverride) {
    const LookoutConfig config = parseConfig(R"({
        "weather": { "table": {
            "Clear": { "spawn": 1.0, "lifetime": 1.0 },
            "Hot":   { "spawn": 0.5, "lifetime": 0.5 },
            "Windy": { "spawn": 0.8, "lifetime": 0.9 },
            "Rainy": { "spawn": 3.0, "lifetime": 2.0 }
        } }
    })");

    BOOST_CHECK_EQUAL(config.weatherTable.get(WeatherState::Hot).spawnIntervalScale, 0.5f);
    BOOST_CHECK_EQUAL(config.weatherTable.get(WeatherState::Rainy).lifetimeScale, 2.0f);
}

BOOST_AUTO_TEST_CASE(TestShippedConfigFile) {
    // Tests run from the source tree
    const LookoutConfig config = LookoutConfig::loadFromFile("res/lookout.json");
    const LookoutConfig defaults;

    BOOST_CHECK_EQUAL(config.fires.baseInterval, defaults.fires.baseInterval);
    BOOST_CHECK_EQUAL(config.detection.radius, defaults.detection.radius);
    for (WeatherState state : ALL_WEATHER_STATES) {
        BOOST_CHECK_EQUAL(config.weatherTable.get(state).spawnIntervalScale,
                          defaults.weatherTable.get(state).spawnIntervalScale);
        BOOST_CHECK_EQUAL(config.weatherTable.get(state).lifetimeScale,
                          defaults.weatherTable.get(state).lifetimeScale);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FAIL-FAST CASES
// ============================================================================

BOOST_AUTO_TEST_SUITE(ValidationTests)

BOOST_AUTO_TEST_CASE(TestRootMustBeObject) {
    BOOST_CHECK_THROW(parseConfig("[1, 2]"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestSectionMustBeObject) {
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": 5 })"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestWrongValueTypes) {
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "base_interval": "fast" } })"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "world": { "wrap": 1 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "max_placement_attempts": 2.5 } })"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeValues) {
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "base_interval": 0 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "base_lifetime": -1 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "interval_jitter": 1.0 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "max_placement_attempts": 0 } })"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "fires": { "far_layer_chance": 1.5 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "detection": { "radius": 0 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "world": { "width": -360 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "view": { "field_of_view": 400 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "view": { "aim_height": 95 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "graphics": { "window_width": 0 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "graphics": { "font_size": 2 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "graphics": { "target_fps": 0 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "graphics": { "font_path": 12 } })"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestWorldExtentBounded) {
    BOOST_CHECK_THROW(parseConfig(R"({ "world": { "width": 1e12 } })"), std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "world": { "height": 1e12 } })"), std::invalid_argument);
    // Beyond float range
    BOOST_CHECK_THROW(parseConfig(R"({ "world": { "width": 1e39 } })"), std::invalid_argument);

    auto config = parseConfig(R"({ "world": { "width": 1000000, "height": 1000000 } })");
    BOOST_CHECK_EQUAL(config.world.width, 1.0e6f);
    BOOST_CHECK_EQUAL(config.world.height, 1.0e6f);
}

BOOST_AUTO_TEST_CASE(TestWeatherDurationsOrdered) {
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "min_duration": 90, "max_duration": 30 } })"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "min_duration": -1 } })"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestWeatherTableMustBeComplete) {
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "table": {
            "Clear": { "spawn": 1.0, "lifetime": 1.0 },
            "Hot":   { "spawn": 0.6, "lifetime": 0.7 },
            "Windy": { "spawn": 0.75, "lifetime": 0.8 }
        } } })"), std::invalid_argument);

    // Entry without a lifetime scale
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "table": {
            "Clear": { "spawn": 1.0 },
            "Hot":   { "spawn": 0.6, "lifetime": 0.7 },
            "Windy": { "spawn": 0.75, "lifetime": 0.8 },
            "Rainy": { "spawn": 2.5, "lifetime": 1.6 }
        } } })"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestUnknownWeatherNameRejected) {
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "table": {
            "Clear": { "spawn": 1.0, "lifetime": 1.0 },
            "Hot":   { "spawn": 0.6, "lifetime": 0.7 },
            "Windy": { "spawn": 0.75, "lifetime": 0.8 },
            "Rainy": { "spawn": 2.5, "lifetime": 1.6 },
            "Snowy": { "spawn": 4.0, "lifetime": 2.0 }
        } } })"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveScaleRejected) {
    BOOST_CHECK_THROW(parseConfig(R"({ "weather": { "table": {
            "Clear": { "spawn": 0.0, "lifetime": 1.0 },
            "Hot":   { "spawn": 0.6, "lifetime": 0.7 },
            "Windy": { "spawn": 0.75, "lifetime": 0.8 },
            "Rainy": { "spawn": 2.5, "lifetime": 1.6 }
        } } })"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestErrorMessageNamesKey) {
    try {
        parseConfig(R"({ "detection": { "radius": "wide" } })");
        BOOST_FAIL("Expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        BOOST_CHECK(std::string(e.what()).find("detection.radius") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(TestMissingFileThrows) {
    BOOST_CHECK_THROW(LookoutConfig::loadFromFile("does_not_exist.json"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(TestMalformedFileThrows) {
    const std::string filename = "lookout_config_malformed_test.json";
    {
        std::ofstream file(filename);
        file << "{ \"fires\": { \"base_interval\": 6.0, } }";
    }

    BOOST_CHECK_THROW(LookoutConfig::loadFromFile(filename), std::runtime_error);
    std::remove(filename.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
