/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * How a frame is held to the target rate.
 */
enum class FramePacing {
    Hardware,  // SDL_RenderPresent() blocks on VSync
    Software   // GameLoop sleeps out the rest of the frame
};

/**
 * TimestepManager hands out fixed simulation steps from real frame time.
 *
 * Fire and weather timers only ever see the fixed step, so a session
 * replays the same way on any display. Frame time collects in an
 * accumulator; one frame may carry at most MAX_FRAME_SECONDS of it; the
 * rest is counted in getDroppedSeconds() and never simulated.
 *
 * Both pacings bank the measured frame time, so simulated time tracks the
 * wall clock whatever the frame rate. Under software pacing the caller
 * sleeps for getFrameTimeRemaining() to hold the target rate.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Frame rate held by software pacing
     * @param fixedTimestep Seconds of simulated time per step
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    /**
     * Samples the clock and banks the elapsed time. Call once per frame.
     */
    void beginFrame();

    /**
     * Banks one frame's worth of real time: at most MAX_FRAME_SECONDS is
     * kept, the excess is counted as dropped.
     */
    void bankFrameTime(double frameSeconds);

    /**
     * Takes one step out of the accumulator if a whole step is banked.
     * Loop on it to catch up after a slow frame.
     */
    bool consumeStep();

    float getStepSeconds() const { return m_fixedTimestep; }

    /**
     * Time left until the target frame time under software pacing; zero
     * under hardware pacing or once the frame has overrun.
     */
    std::chrono::nanoseconds getFrameTimeRemaining() const;

    void setPacing(FramePacing pacing) { m_pacing = pacing; }
    FramePacing getPacing() const { return m_pacing; }

    float getTargetFPS() const { return m_targetFPS; }
    float getSmoothedFPS() const { return m_smoothedFPS; }
    double getDroppedSeconds() const { return m_droppedSeconds; }

    /**
     * Forgets banked time and the last clock sample. The next beginFrame()
     * starts a fresh measurement, so time spent paused is never simulated.
     */
    void restart();

    static constexpr double MAX_FRAME_SECONDS{0.25};

private:
    using Clock = std::chrono::steady_clock;

    static constexpr float FPS_SMOOTHING{0.03f};

    float m_targetFPS;
    float m_fixedTimestep;
    Clock::duration m_targetFrameDuration;

    Clock::time_point m_frameBegin{};
    bool m_haveSample{false};

    double m_accumulator{0.0};
    double m_droppedSeconds{0.0};
    float m_smoothedFPS{0.0f};

    FramePacing m_pacing{FramePacing::Hardware};

    void sampleFPS(double frameSeconds);
};

#endif // TIMESTEP_MANAGER_HPP
