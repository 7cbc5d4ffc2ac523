/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <cstdint>
#include <functional>
#include <utility>

/**
 * GameLoop runs the lookout on the main thread, one frame at a time:
 * events, then as many fixed simulation steps as real time has banked,
 * then one render.
 *
 * While paused, events and rendering continue and no steps are taken.
 */
class GameLoop {
public:
    using EventHandler = std::function<void()>;
    using StepHandler = std::function<void(float stepSeconds)>;
    using RenderHandler = std::function<void()>;

    explicit GameLoop(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    void setEventHandler(EventHandler handler) { m_onEvents = std::move(handler); }
    void setStepHandler(StepHandler handler) { m_onStep = std::move(handler); }
    void setRenderHandler(RenderHandler handler) { m_onRender = std::move(handler); }

    /**
     * Runs frames until stop() is requested.
     * @return false if a handler threw or the loop was already running
     */
    bool run();

    /**
     * Ends the loop once the current frame's event pass returns.
     */
    void stop() { m_stopRequested = true; }

    /**
     * Freezes the simulation. Unpausing restarts frame timing so the time
     * spent paused is not replayed.
     */
    void setPaused(bool paused);
    bool isPaused() const { return m_paused; }

    void setPacing(FramePacing pacing) { m_timestep.setPacing(pacing); }
    float getTargetFPS() const { return m_timestep.getTargetFPS(); }

private:
    TimestepManager m_timestep;

    EventHandler m_onEvents;
    StepHandler m_onStep;
    RenderHandler m_onRender;

    bool m_running{false};
    bool m_paused{false};
    bool m_stopRequested{false};
    uint64_t m_stepCount{0};

    void runFrame();
    void sleepOutFrame() const;
};

#endif // GAME_LOOP_HPP
