/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f/60.0f)
    , m_targetFrameDuration(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(1.0 / m_targetFPS)))
{
}

void TimestepManager::beginFrame() {
    const auto now = Clock::now();
    const auto previous = m_frameBegin;
    m_frameBegin = now;

    // First frame after construction or restart() only sets the baseline
    if (!m_haveSample) {
        m_haveSample = true;
        return;
    }

    bankFrameTime(std::chrono::duration<double>(now - previous).count());
}

void TimestepManager::bankFrameTime(double frameSeconds) {
    if (frameSeconds <= 0.0) {
        return;
    }
    sampleFPS(frameSeconds);

    const double banked = std::min(frameSeconds, MAX_FRAME_SECONDS);
    m_droppedSeconds += frameSeconds - banked;
    m_accumulator += banked;
}

bool TimestepManager::consumeStep() {
    if (m_accumulator < m_fixedTimestep) {
        return false;
    }
    m_accumulator -= m_fixedTimestep;
    return true;
}

std::chrono::nanoseconds TimestepManager::getFrameTimeRemaining() const {
    if (m_pacing != FramePacing::Software || !m_haveSample) {
        return std::chrono::nanoseconds::zero();
    }

    const auto remaining = (m_frameBegin + m_targetFrameDuration) - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return std::chrono::nanoseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(remaining);
}

void TimestepManager::restart() {
    m_haveSample = false;
    m_accumulator = 0.0;
}

void TimestepManager::sampleFPS(double frameSeconds) {
    const float instant = std::clamp(static_cast<float>(1.0 / frameSeconds), 0.1f, 1000.0f);
    m_smoothedFPS = (m_smoothedFPS <= 0.0f)
        ? instant
        : m_smoothedFPS + FPS_SMOOTHING * (instant - m_smoothedFPS);
}
