/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/FirePool.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

FirePool::FirePool(const Lookout::FireSpawnConfig& config, const Lookout::WorldBounds& bounds,
                   std::mt19937& rng)
    : m_config(config)
    , m_bounds(bounds)
    , m_rng(rng)
{
    m_fires.reserve(32);
    m_intervalJitterFactor = jitterFactor(m_config.intervalJitter);
}

void FirePool::tick(float elapsed, const WeatherController& weather) {
    if (elapsed <= 0.0f) {
        return;
    }

    ageFires(elapsed);

    m_spawnTimer += elapsed;
    if (m_spawnTimer >= currentThreshold(weather)) {
        spawnFire(weather);
        m_spawnTimer = 0.0f;
        m_intervalJitterFactor = jitterFactor(m_config.intervalJitter);
    }
}

bool FirePool::extinguish(FireId id) {
    auto it = std::find_if(m_fires.begin(), m_fires.end(),
                           [id](const Fire& fire) { return fire.id == id; });
    if (it == m_fires.end()) {
        // Expired or already reported this frame - expected, not an error
        FIREPOOL_DEBUG(std::format("Extinguish ignored, fire {} is not active", id));
        return false;
    }

    m_fires.erase(it);
    FIREPOOL_DEBUG(std::format("Fire {} extinguished, {} still burning", id, m_fires.size()));
    return true;
}

const Fire* FirePool::findFire(FireId id) const {
    auto it = std::find_if(m_fires.begin(), m_fires.end(),
                           [id](const Fire& fire) { return fire.id == id; });
    return it != m_fires.end() ? &(*it) : nullptr;
}

void FirePool::clear() {
    m_fires.clear();
    m_spawnTimer = 0.0f;
}

void FirePool::ageFires(float elapsed) {
    for (Fire& fire : m_fires) {
        fire.remainingLifetime -= elapsed;
    }

    const size_t before = m_fires.size();
    m_fires.erase(std::remove_if(m_fires.begin(), m_fires.end(),
                                 [](const Fire& fire) { return fire.isExpired(); }),
                  m_fires.end());

    const size_t expired = before - m_fires.size();
    if (expired > 0) {
        m_totalExpired += expired;
        FIREPOOL_DEBUG(std::format("{} fire(s) burned out unreported", expired));
    }
}

void FirePool::spawnFire(const WeatherController& weather) {
    // Layer first: each ridge has its own band of ground
    std::bernoulli_distribution farLayer(m_config.farLayerChance);
    const FireLayer layer = farLayer(m_rng) ? FireLayer::Far : FireLayer::Mid;

    std::optional<Vector2D> position = choosePosition(layer);
    if (!position) {
        ++m_failedSpawns;
        FIREPOOL_WARN(std::format("Could not find burnable {} terrain after {} attempts",
                                  layer == FireLayer::Far ? "far" : "mid",
                                  m_config.maxPlacementAttempts));
        return;
    }

    ignite(*position, layer, weather);
}

FireId FirePool::ignite(const Vector2D& position, FireLayer layer, const WeatherController& weather) {
    Fire fire;
    fire.id = m_nextId++;
    fire.position = position;
    fire.initialLifetime = m_config.baseLifetime * weather.lifetimeScale() *
                           jitterFactor(m_config.lifetimeJitter);
    fire.remainingLifetime = fire.initialLifetime;
    fire.layer = layer;
    fire.spawnWeather = weather.currentWeather();

    m_fires.push_back(fire);
    ++m_totalSpawned;

    FIREPOOL_DEBUG(std::format("Fire {} ignited at ({}, {}) on {} ridge, burns {:.1f}s ({})",
                               fire.id, fire.position.getX(), fire.position.getY(),
                               fire.layer == FireLayer::Far ? "far" : "mid",
                               fire.initialLifetime, weatherName(fire.spawnWeather)));
    return fire.id;
}

std::optional<Vector2D> FirePool::choosePosition(FireLayer layer) {
    const int maxX = std::max(0, static_cast<int>(std::ceil(m_bounds.width)) - 1);
    const int maxY = std::max(0, static_cast<int>(std::ceil(m_bounds.height)) - 1);
    std::uniform_int_distribution<int> xDist(0, maxX);
    std::uniform_int_distribution<int> yDist(0, maxY);

    std::optional<Vector2D> occupiedCandidate;
    for (int attempt = 0; attempt < m_config.maxPlacementAttempts; ++attempt) {
        const int x = xDist(m_rng);
        const int y = yDist(m_rng);
        Vector2D candidate(static_cast<float>(x), static_cast<float>(y));

        if (m_terrainPredicate && !m_terrainPredicate(candidate, layer)) {
            continue;
        }
        if (!isOccupied(candidate)) {
            return candidate;
        }
        occupiedCandidate = candidate;
    }

    if (occupiedCandidate) {
        // Map saturated: accept an overlapping spot rather than skip the spawn
        ++m_saturationFallbacks;
        FIREPOOL_WARN(std::format("Spawn area saturated, stacking fire at ({}, {})",
                                  occupiedCandidate->getX(), occupiedCandidate->getY()));
    }
    return occupiedCandidate;
}

bool FirePool::isOccupied(const Vector2D& position) const {
    return std::any_of(m_fires.begin(), m_fires.end(),
                       [&position](const Fire& fire) { return fire.position == position; });
}

float FirePool::jitterFactor(float jitter) {
    if (jitter <= 0.0f) {
        return 1.0f;
    }
    std::uniform_real_distribution<float> dist(1.0f - jitter, 1.0f + jitter);
    return dist(m_rng);
}

float FirePool::currentThreshold(const WeatherController& weather) const {
    return m_config.baseInterval * weather.spawnScale() * m_intervalJitterFactor;
}
