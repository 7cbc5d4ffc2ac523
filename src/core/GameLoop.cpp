/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <exception>
#include <format>

GameLoop::GameLoop(float targetFPS, float fixedTimestep)
    : m_timestep(targetFPS, fixedTimestep)
{
}

bool GameLoop::run() {
    if (m_running) {
        GAMELOOP_WARN("run() called while the loop is already running");
        return false;
    }

    m_running = true;
    m_stopRequested = false;
    m_timestep.restart();

    bool ok = true;
    try {
        while (!m_stopRequested) {
            runFrame();
        }
    } catch (const std::exception& e) {
        GAMELOOP_CRITICAL(std::format("Frame aborted: {}", e.what()));
        ok = false;
    }
    m_running = false;

    GAMELOOP_INFO(std::format("{} steps simulated, {:.1f} FPS at exit, {:.2f}s of stalls dropped",
                              m_stepCount, m_timestep.getSmoothedFPS(),
                              m_timestep.getDroppedSeconds()));
    return ok;
}

void GameLoop::setPaused(bool paused) {
    if (m_paused == paused) {
        return;
    }
    m_paused = paused;
    m_timestep.restart();
    GAMELOOP_DEBUG(paused ? "Simulation paused" : "Simulation resumed");
}

void GameLoop::runFrame() {
    m_timestep.beginFrame();

    // SDL only delivers events on the main thread
    if (m_onEvents) {
        m_onEvents();
    }
    if (m_stopRequested) {
        return;
    }

    while (!m_paused && m_timestep.consumeStep()) {
        if (m_onStep) {
            m_onStep(m_timestep.getStepSeconds());
        }
        ++m_stepCount;
    }

    if (m_onRender) {
        m_onRender();
    }

    sleepOutFrame();
}

void GameLoop::sleepOutFrame() const {
    const auto remaining = m_timestep.getFrameTimeRemaining();
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}
