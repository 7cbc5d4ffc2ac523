/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIRE_POOL_HPP
#define FIRE_POOL_HPP

#include "core/LookoutConfig.hpp"
#include "entities/Fire.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>

class WeatherController;

/**
 * @brief Owns every active fire: ageing, expiry, timed spawning, extinguishing
 *
 * Spawn timer rules:
 * - The timer accumulates elapsed time and is compared against
 *   baseInterval * weather.spawnScale() (times a per-window jitter factor
 *   when interval jitter is configured).
 * - At most one fire spawns per tick. On spawn the timer resets to zero
 *   rather than being decremented, so a long pause never bursts out a
 *   backlog of fires.
 *
 * Storage keeps spawn order; removals preserve the relative order of the
 * remaining fires so iteration inside a frame is stable.
 */
class FirePool {
public:
    /**
     * @brief Spawn position filter (true = ground of that layer a fire can burn on)
     */
    using TerrainPredicate = std::function<bool(const Vector2D& position, FireLayer layer)>;

    FirePool(const Lookout::FireSpawnConfig& config, const Lookout::WorldBounds& bounds,
             std::mt19937& rng);
    ~FirePool() = default;

    // Non-copyable (holds a reference to the shared generator)
    FirePool(const FirePool&) = delete;
    FirePool& operator=(const FirePool&) = delete;

    /**
     * @brief Age, expire and spawn fires for one frame
     * @param elapsed Seconds since the previous tick
     * @param weather Source of the spawn interval and lifetime scales
     */
    void tick(float elapsed, const WeatherController& weather);

    /**
     * @brief Light a fire at an exact spot, bypassing the spawn timer
     *
     * Lifetime follows the same weather and jitter rules as a timed spawn.
     * Used for scripted scenarios; the terrain predicate is not consulted.
     * @return Id of the new fire
     */
    FireId ignite(const Vector2D& position, FireLayer layer, const WeatherController& weather);

    /**
     * @brief Read-only view of live fires in spawn order
     */
    const std::vector<Fire>& activeFires() const { return m_fires; }

    /**
     * @brief Remove a fire immediately
     * @param id Fire to remove
     * @return true if it was live, false if already expired or extinguished
     */
    bool extinguish(FireId id);

    /**
     * @brief Find a live fire by id
     * @return Pointer into the pool (valid until the next mutation) or nullptr
     */
    const Fire* findFire(FireId id) const;

    size_t size() const { return m_fires.size(); }
    bool empty() const { return m_fires.empty(); }

    /**
     * @brief Drop every fire and restart the spawn timer (ids keep counting)
     */
    void clear();

    void setTerrainPredicate(TerrainPredicate predicate) { m_terrainPredicate = std::move(predicate); }

    /**
     * @brief Seconds accumulated toward the next spawn
     */
    float getSpawnTimer() const { return m_spawnTimer; }

    uint64_t getTotalSpawned() const { return m_totalSpawned; }
    uint64_t getTotalExpired() const { return m_totalExpired; }
    uint64_t getSaturationFallbacks() const { return m_saturationFallbacks; }
    uint64_t getFailedSpawns() const { return m_failedSpawns; }

    const Lookout::FireSpawnConfig& getConfig() const { return m_config; }
    const Lookout::WorldBounds& getBounds() const { return m_bounds; }

private:
    void ageFires(float elapsed);
    void spawnFire(const WeatherController& weather);
    std::optional<Vector2D> choosePosition(FireLayer layer);
    bool isOccupied(const Vector2D& position) const;
    float jitterFactor(float jitter);
    float currentThreshold(const WeatherController& weather) const;

    Lookout::FireSpawnConfig m_config;
    Lookout::WorldBounds m_bounds;
    std::mt19937& m_rng;
    TerrainPredicate m_terrainPredicate{};

    std::vector<Fire> m_fires{};
    FireId m_nextId{1};
    float m_spawnTimer{0.0f};
    float m_intervalJitterFactor{1.0f};  // rolled once per spawn window

    uint64_t m_totalSpawned{0};
    uint64_t m_totalExpired{0};
    uint64_t m_saturationFallbacks{0};
    uint64_t m_failedSpawns{0};
};

#endif // FIRE_POOL_HPP
