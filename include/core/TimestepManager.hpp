/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace Stormfire {

/**
 * Fixed-step simulation clock for the demo host.
 *
 * Effect systems advance by getUpdateDeltaTime() on every shouldUpdate()
 * that returns true. Frame deltas are clamped so a long stall cannot queue
 * a burst of catch-up steps. getElapsedSeconds() is the wall clock handed to
 * ground fire damage checks.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Frame rate the software limiter aims for when VSync is off
     * @param fixedTimestep Simulation step in seconds
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    void startFrame();

    /**
     * Returns true while a fixed step is owed. May return true more than
     * once per frame to catch up.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call at the end of each frame. Sleeps off the rest of the frame when
     * software frame limiting is enabled.
     */
    void endFrame() const;

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    /// Seconds since construction or the last reset()
    double getElapsedSeconds() const;

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);

    /// Enabled by the host when VSync is unavailable or turned off
    void setSoftwareFrameLimiting(bool enabled) { m_softwareFrameLimiting = enabled; }
    bool isUsingSoftwareFrameLimiting() const { return m_softwareFrameLimiting; }

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    Clock::time_point m_epoch;
    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_FRAME_DELTA = 0.25; // seconds

    uint32_t m_lastFrameTimeMs{0};
    double m_lastDeltaSeconds{0.0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};

    bool m_firstFrame{true};
    bool m_softwareFrameLimiting{false};

    void updateFPS();
};

} // namespace Stormfire

#endif // TIMESTEP_MANAGER_HPP
