/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace Stormfire {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
{
    auto now = Clock::now();
    m_epoch = now;
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::startFrame() {
    auto now = Clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = now;
        return;
    }

    double deltaTime = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaTime * 1000.0);
    m_lastDeltaSeconds = deltaTime;

    // Clamp so a stall (debugger, window drag) does not explode into steps
    m_accumulator += std::min(deltaTime, MAX_FRAME_DELTA);

    updateFPS();
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() const {
    if (!m_softwareFrameLimiting) {
        return;
    }

    auto targetEnd = m_frameStart + std::chrono::nanoseconds(
        static_cast<int64_t>(m_targetFrameTime * 1e9));
    auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
        targetEnd - Clock::now());
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

double TimestepManager::getElapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - m_epoch).count();
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep > 0.0f) {
        m_fixedTimestep = timestep;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_lastDeltaSeconds = 0.0;

    auto now = Clock::now();
    m_epoch = now;
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::updateFPS() {
    if (m_lastDeltaSeconds > 0.0) {
        float instantFPS = std::clamp(static_cast<float>(1.0 / m_lastDeltaSeconds), 0.1f, 1000.0f);
        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

} // namespace Stormfire
