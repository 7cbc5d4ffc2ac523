/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/LookoutConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Lookout {

namespace {

// Largest world extent; lattice coordinates must stay well inside int range
constexpr float MAX_WORLD_EXTENT{1.0e6f};

[[noreturn]] void fail(const std::string& message) {
    throw std::invalid_argument("Invalid lookout config: " + message);
}

std::string typeName(const JsonValue& value) {
    std::ostringstream oss;
    oss << value.getType();
    return oss.str();
}

// Returns the named section, or nullptr when absent. Present-but-wrong-type is an error.
const JsonObject* section(const JsonValue& root, const std::string& name) {
    if (!root.hasKey(name)) {
        return nullptr;
    }
    const JsonObject* obj = root[name].tryAsObject();
    if (!obj) {
        fail(std::format("'{}' must be an object, got {}", name, typeName(root[name])));
    }
    return obj;
}

void readFloat(const JsonObject& obj, const std::string& sectionName,
               const std::string& key, float& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    auto number = it->second.tryAsNumber();
    if (!number || !std::isfinite(*number)) {
        fail(std::format("'{}.{}' must be a finite number, got {}", sectionName, key,
                         typeName(it->second)));
    }
    if (std::fabs(*number) > std::numeric_limits<float>::max()) {
        fail(std::format("'{}.{}' is out of range, got {}", sectionName, key, *number));
    }
    out = static_cast<float>(*number);
}

void readInt(const JsonObject& obj, const std::string& sectionName,
             const std::string& key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    auto number = it->second.tryAsInt();
    if (!number) {
        fail(std::format("'{}.{}' must be an integer, got {}", sectionName, key,
                         typeName(it->second)));
    }
    out = *number;
}

void readBool(const JsonObject& obj, const std::string& sectionName,
              const std::string& key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    auto flag = it->second.tryAsBool();
    if (!flag) {
        fail(std::format("'{}.{}' must be true or false, got {}", sectionName, key,
                         typeName(it->second)));
    }
    out = *flag;
}

void readString(const JsonObject& obj, const std::string& sectionName,
                const std::string& key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    const std::string* text = it->second.tryAsString();
    if (!text) {
        fail(std::format("'{}.{}' must be a string, got {}", sectionName, key,
                         typeName(it->second)));
    }
    out = *text;
}

void readWeatherTable(const JsonValue& tableValue, WeatherTable& table) {
    const JsonObject* tableObj = tableValue.tryAsObject();
    if (!tableObj) {
        fail("'weather.table' must be an object keyed by weather name");
    }

    for (const auto& [name, entry] : *tableObj) {
        if (!weatherFromName(name)) {
            fail(std::format("'weather.table' has unknown weather '{}'", name));
        }
    }

    for (WeatherState state : ALL_WEATHER_STATES) {
        const std::string name{weatherName(state)};
        auto it = tableObj->find(name);
        if (it == tableObj->end()) {
            fail(std::format("'weather.table' is missing an entry for {}", name));
        }
        const JsonObject* entry = it->second.tryAsObject();
        if (!entry) {
            fail(std::format("'weather.table.{}' must be an object", name));
        }
        const std::string entryName = "weather.table." + name;
        if (entry->find("spawn") == entry->end() || entry->find("lifetime") == entry->end()) {
            fail(std::format("'{}' needs both 'spawn' and 'lifetime'", entryName));
        }

        WeatherScales scales;
        readFloat(*entry, entryName, "spawn", scales.spawnIntervalScale);
        readFloat(*entry, entryName, "lifetime", scales.lifetimeScale);
        table.set(state, scales);
    }
}

} // anonymous namespace

LookoutConfig LookoutConfig::fromJson(const JsonValue& root) {
    if (!root.isObject()) {
        fail("root must be a JSON object");
    }

    LookoutConfig config;

    if (const JsonObject* graphics = section(root, "graphics")) {
        readInt(*graphics, "graphics", "window_width", config.graphics.windowWidth);
        readInt(*graphics, "graphics", "window_height", config.graphics.windowHeight);
        readBool(*graphics, "graphics", "fullscreen", config.graphics.fullscreen);
        readBool(*graphics, "graphics", "vsync", config.graphics.vsync);
        readFloat(*graphics, "graphics", "target_fps", config.graphics.targetFPS);
        readString(*graphics, "graphics", "font_path", config.graphics.fontPath);
        readInt(*graphics, "graphics", "font_size", config.graphics.fontSize);
    }

    if (const JsonObject* world = section(root, "world")) {
        readFloat(*world, "world", "width", config.world.width);
        readFloat(*world, "world", "height", config.world.height);
        readBool(*world, "world", "wrap", config.world.wrapHorizontal);
    }

    if (const JsonObject* fires = section(root, "fires")) {
        readFloat(*fires, "fires", "base_interval", config.fires.baseInterval);
        readFloat(*fires, "fires", "interval_jitter", config.fires.intervalJitter);
        readFloat(*fires, "fires", "base_lifetime", config.fires.baseLifetime);
        readFloat(*fires, "fires", "lifetime_jitter", config.fires.lifetimeJitter);
        readInt(*fires, "fires", "max_placement_attempts", config.fires.maxPlacementAttempts);
        readFloat(*fires, "fires", "far_layer_chance", config.fires.farLayerChance);
    }

    if (const JsonObject* weather = section(root, "weather")) {
        readFloat(*weather, "weather", "min_duration", config.weatherTiming.minDuration);
        readFloat(*weather, "weather", "max_duration", config.weatherTiming.maxDuration);
        auto it = weather->find("table");
        if (it != weather->end()) {
            readWeatherTable(it->second, config.weatherTable);
        }
    }

    if (const JsonObject* detection = section(root, "detection")) {
        readFloat(*detection, "detection", "radius", config.detection.radius);
    }

    if (const JsonObject* view = section(root, "view")) {
        readFloat(*view, "view", "field_of_view", config.view.fieldOfView);
        readFloat(*view, "view", "pan_speed", config.view.panSpeed);
        readFloat(*view, "view", "aim_height", config.view.aimHeight);
        readFloat(*view, "view", "crosshair_speed", config.view.crosshairSpeed);
        readFloat(*view, "view", "start_azimuth", config.view.startAzimuth);
    }

    config.validate();
    return config;
}

LookoutConfig LookoutConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        throw std::runtime_error(std::format("Failed to load lookout config '{}': {}",
                                             filepath, reader.getLastError()));
    }

    LookoutConfig config = fromJson(reader.getRoot());
    CONFIG_INFO(std::format("Loaded lookout config from {}", filepath));
    return config;
}

void LookoutConfig::validate() const {
    if (graphics.windowWidth <= 0 || graphics.windowHeight <= 0) {
        fail(std::format("window size must be positive, got {}x{}",
                         graphics.windowWidth, graphics.windowHeight));
    }
    if (graphics.targetFPS < 10.0f || graphics.targetFPS > 480.0f) {
        fail(std::format("'graphics.target_fps' must be in [10, 480], got {}", graphics.targetFPS));
    }
    if (graphics.fontSize < 6 || graphics.fontSize > 96) {
        fail(std::format("'graphics.font_size' must be in [6, 96], got {}", graphics.fontSize));
    }
    if (!(world.width > 0.0f && world.width <= MAX_WORLD_EXTENT) ||
        !(world.height > 0.0f && world.height <= MAX_WORLD_EXTENT)) {
        fail(std::format("world bounds must be in (0, {}], got {}x{}",
                         MAX_WORLD_EXTENT, world.width, world.height));
    }
    if (fires.baseInterval <= 0.0f) {
        fail(std::format("'fires.base_interval' must be positive, got {}", fires.baseInterval));
    }
    if (fires.baseLifetime <= 0.0f) {
        fail(std::format("'fires.base_lifetime' must be positive, got {}", fires.baseLifetime));
    }
    if (fires.intervalJitter < 0.0f || fires.intervalJitter >= 1.0f) {
        fail(std::format("'fires.interval_jitter' must be in [0, 1), got {}", fires.intervalJitter));
    }
    if (fires.lifetimeJitter < 0.0f || fires.lifetimeJitter >= 1.0f) {
        fail(std::format("'fires.lifetime_jitter' must be in [0, 1), got {}", fires.lifetimeJitter));
    }
    if (fires.maxPlacementAttempts < 1) {
        fail(std::format("'fires.max_placement_attempts' must be at least 1, got {}",
                         fires.maxPlacementAttempts));
    }
    if (fires.farLayerChance < 0.0f || fires.farLayerChance > 1.0f) {
        fail(std::format("'fires.far_layer_chance' must be in [0, 1], got {}", fires.farLayerChance));
    }
    if (weatherTiming.minDuration < 0.0f || weatherTiming.maxDuration < weatherTiming.minDuration) {
        fail(std::format("weather durations must satisfy 0 <= min <= max, got min {} max {}",
                         weatherTiming.minDuration, weatherTiming.maxDuration));
    }
    for (WeatherState state : ALL_WEATHER_STATES) {
        const WeatherScales& scales = weatherTable.get(state);
        if (!(scales.spawnIntervalScale > 0.0f) || !(scales.lifetimeScale > 0.0f)) {
            fail(std::format("scales for {} must be positive, got spawn {} lifetime {}",
                             weatherName(state), scales.spawnIntervalScale,
                             scales.lifetimeScale));
        }
    }
    if (detection.radius <= 0.0f) {
        fail(std::format("'detection.radius' must be positive, got {}", detection.radius));
    }
    if (view.fieldOfView <= 0.0f || view.fieldOfView > world.width) {
        fail(std::format("'view.field_of_view' must be in (0, {}], got {}",
                         world.width, view.fieldOfView));
    }
    if (view.panSpeed < 0.0f || view.crosshairSpeed < 0.0f) {
        fail("view speeds must not be negative");
    }
    if (view.aimHeight < 0.0f || view.aimHeight > world.height) {
        fail(std::format("'view.aim_height' must be within [0, {}], got {}",
                         world.height, view.aimHeight));
    }
}

} // namespace Lookout
