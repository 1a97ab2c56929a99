/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TimestepManagerTests
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <thread>

#include "core/TimestepManager.hpp"

using namespace Stormfire;

namespace {
int drainUpdates(TimestepManager& timestep) {
    int updates = 0;
    while (timestep.shouldUpdate()) {
        ++updates;
    }
    return updates;
}
} // namespace

BOOST_AUTO_TEST_SUITE(TimestepManagerTestSuite)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    TimestepManager timestep;
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), 1.0f / 60.0f, 0.001f);
    BOOST_CHECK(!timestep.isUsingSoftwareFrameLimiting());
}

BOOST_AUTO_TEST_CASE(TestInvalidValuesAreRejected) {
    TimestepManager timestep(-10.0f, 0.0f);
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_GT(timestep.getUpdateDeltaTime(), 0.0f);

    timestep.setTargetFPS(0.0f);
    timestep.setFixedTimestep(-1.0f);
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), 1.0f / 60.0f, 0.001f);

    timestep.setTargetFPS(144.0f);
    timestep.setFixedTimestep(0.01f);
    BOOST_CHECK_CLOSE(timestep.getTargetFPS(), 144.0f, 0.001f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), 0.01f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestFirstFrameRunsNoUpdates) {
    TimestepManager timestep;
    timestep.startFrame();
    BOOST_CHECK_EQUAL(drainUpdates(timestep), 0);
}

BOOST_AUTO_TEST_CASE(TestAccumulatesFixedSteps) {
    TimestepManager timestep(60.0f, 0.01f);
    timestep.startFrame();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    timestep.startFrame();

    int updates = drainUpdates(timestep);
    BOOST_CHECK_GE(updates, 4);
    BOOST_CHECK_GE(timestep.getFrameTimeMs(), 45u);
    BOOST_CHECK_GT(timestep.getCurrentFPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestStallsAreClamped) {
    TimestepManager timestep(60.0f, 0.05f);
    timestep.startFrame();
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    timestep.startFrame();

    // A 0.4 s stall only feeds 0.25 s into the accumulator
    BOOST_CHECK_LE(drainUpdates(timestep), 5);
}

BOOST_AUTO_TEST_CASE(TestElapsedSecondsAndReset) {
    TimestepManager timestep;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    BOOST_CHECK_GE(timestep.getElapsedSeconds(), 0.015);

    timestep.reset();
    BOOST_CHECK_LT(timestep.getElapsedSeconds(), 0.015);
    BOOST_CHECK_EQUAL(timestep.getCurrentFPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSoftwareLimiterHoldsFrameTime) {
    TimestepManager timestep(50.0f);
    timestep.setSoftwareFrameLimiting(true);

    auto start = std::chrono::steady_clock::now();
    timestep.startFrame();
    timestep.endFrame();
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // 50 FPS means 20 ms per frame
    BOOST_CHECK_GE(elapsed, 0.018);
}

BOOST_AUTO_TEST_SUITE_END()
