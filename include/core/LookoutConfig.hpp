/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOOKOUT_CONFIG_HPP
#define LOOKOUT_CONFIG_HPP

#include "world/WeatherTypes.hpp"
#include <string>

namespace Lookout {

class JsonValue;

/**
 * @brief Playable world in world units
 *
 * x is the azimuth in degrees (the panorama wraps at width), y runs from the
 * top of the view (0) down to height.
 */
struct WorldBounds {
    float width{360.0f};
    float height{90.0f};
    bool wrapHorizontal{true};
};

struct FireSpawnConfig {
    float baseInterval{6.0f};      // seconds between spawns in Clear weather
    float intervalJitter{0.0f};    // +/- fraction applied per spawn window
    float baseLifetime{30.0f};     // seconds a fire burns in Clear weather
    float lifetimeJitter{0.0f};    // +/- fraction applied per fire
    int maxPlacementAttempts{20};  // resample budget for a free position
    float farLayerChance{0.5f};    // probability a fire sits on the far ridge
};

struct WeatherTiming {
    float minDuration{60.0f};  // 0 keeps the session-start weather forever
    float maxDuration{120.0f};
};

struct DetectionConfig {
    float radius{6.0f};
};

struct ViewConfig {
    float fieldOfView{150.0f};
    float panSpeed{60.0f};        // degrees per second while held
    float aimHeight{45.0f};       // crosshair y at rest
    float crosshairSpeed{40.0f};  // world units per second while nudged
    float startAzimuth{0.0f};
};

struct GraphicsConfig {
    int windowWidth{1280};
    int windowHeight{720};
    bool fullscreen{false};
    bool vsync{true};
    float targetFPS{60.0f};  // frame pacing when VSync is off or unverified
    std::string fontPath{"res/fonts/DejaVuSansMono.ttf"};  // HUD font
    int fontSize{16};
};

/**
 * @brief All tuning for a lookout session, loaded from res/lookout.json
 *
 * Missing keys keep their defaults. A key that is present but malformed
 * (wrong type, out of range, unknown weather name) is a hard error:
 * fromJson()/loadFromFile() throw std::invalid_argument naming the key.
 *
 * Usage:
 *   auto config = Lookout::LookoutConfig::loadFromFile("res/lookout.json");
 *   LookoutSimulation sim(config, seed);
 */
struct LookoutConfig {
    GraphicsConfig graphics{};
    WorldBounds world{};
    FireSpawnConfig fires{};
    WeatherTiming weatherTiming{};
    WeatherTable weatherTable{};
    DetectionConfig detection{};
    ViewConfig view{};

    /**
     * @brief Build a config from a parsed JSON document
     * @throws std::invalid_argument on malformed or out-of-range values
     */
    static LookoutConfig fromJson(const JsonValue& root);

    /**
     * @brief Read and parse a JSON config file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument on malformed or out-of-range values
     */
    static LookoutConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Check cross-field invariants (also run by fromJson)
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;
};

} // namespace Lookout

#endif // LOOKOUT_CONFIG_HPP
