// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "CoordinatedExecutor.h"
#include "FakeHardware.h"

#include <gtest/gtest.h>

#include <algorithm>

using Clock = std::chrono::steady_clock;

static double secondsBetween(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

class CoordinatedExecutorTest : public ::testing::Test {
protected:
    CoordinatedExecutorTest() :
        config(unitConfig()), trap(stopSwitch, link), scheduler(x, y, { &tool0, &tool1 }, config), executor(scheduler, trap, config) {}

    RecordingActuator             x { "x" };
    RecordingActuator             y { "y" };
    RecordingActuator             tool0 { "tool0" };
    RecordingActuator             tool1 { "tool1" };
    FakeSwitch                    stopSwitch;
    ::testing::NiceMock<MockLink> link;
    Machine::PlotterConfig        config;
    EmergencyTrap                 trap;
    MotionScheduler               scheduler;
    CoordinatedExecutor           executor;
};

TEST_F(CoordinatedExecutorTest, EmptyQueueDoesNothing) {
    EXPECT_NO_THROW(executor.execute());
    EXPECT_TRUE(x.calls().empty());
    EXPECT_TRUE(tool0.calls().empty());
}

TEST_F(CoordinatedExecutorTest, AxesRunAndWaitInOrder) {
    scheduler.ingress(mm(10), mm(0), false);
    scheduler.ingress(mm(10), mm(20), false);
    executor.execute();

    EXPECT_EQ(x.ops(), (std::vector<std::string> { "setSpeed", "setDistance", "runAndWait" }));
    EXPECT_EQ(x.values("setDistance"), (std::vector<int64_t> { -10 }));
    EXPECT_EQ(y.values("setDistance"), (std::vector<int64_t> { 20 }));
    EXPECT_EQ(y.values("setSpeed"), (std::vector<int64_t> { 1000 }));
    EXPECT_TRUE(tool0.calls().empty());
    EXPECT_TRUE(scheduler.points().empty());
}

TEST_F(CoordinatedExecutorTest, DrawsStartAndStopTheToolPrimingWaits) {
    scheduler.ingress(mm(10), mm(0), true);
    executor.execute();

    EXPECT_EQ(tool0.ops(),
              (std::vector<std::string> { "setSpeed", "setDistance", "runAndWait", "setSpeed", "setDistance", "run", "stop" }));
    EXPECT_EQ(tool0.values("setDistance"), (std::vector<int64_t> { 50, 10 }));
    EXPECT_TRUE(tool1.calls().empty());
}

TEST_F(CoordinatedExecutorTest, RetractionWaitsForCompletion) {
    scheduler.ingress(mm(10), mm(0), true);
    scheduler.ingress(mm(20), mm(0), false);
    executor.execute();

    auto ops = tool0.ops();
    EXPECT_EQ(std::count(ops.begin(), ops.end(), "runAndWait"), 2);
    EXPECT_EQ(std::count(ops.begin(), ops.end(), "run"), 1);
    EXPECT_EQ(tool0.values("setDistance"), (std::vector<int64_t> { 50, 10, -50 }));
}

TEST_F(CoordinatedExecutorTest, LagStopsTheToolEarly) {
    config._toolTiming._retractionDistance = 0;
    config._toolTiming._lagTime            = 0.1f;
    scheduler.ingress(mm(200), mm(0), true);  // 0.2s
    executor.execute();

    auto run  = tool0.first("run");
    auto stop = tool0.first("stop");
    ASSERT_TRUE(run && stop);
    double held = secondsBetween(run->at, stop->at);
    EXPECT_GE(held, 0.09);
    EXPECT_LT(held, 0.19);
}

TEST_F(CoordinatedExecutorTest, LeadStartsTheNextDrawEarly) {
    config._toolTiming._retractionDistance = 0;
    config._toolTiming._leadTime           = 0.1f;
    config._toolTiming._lagTime            = 0.1f;
    scheduler.ingress(mm(200), mm(0), true);  // 0 .. 0.2s
    scheduler.ingress(mm(400), mm(0), true);  // 0.2 .. 0.4s
    executor.execute();

    auto xCalls    = x.calls();
    auto toolCalls = tool0.calls();
    ASSERT_EQ(xCalls.size(), 6u);
    Clock::time_point t0 = xCalls.front().at;

    std::vector<Clock::time_point> runs;
    for (const auto& call : toolCalls) {
        if (call.op == "run") {
            runs.push_back(call.at);
        }
    }
    ASSERT_EQ(runs.size(), 2u);
    // The second draw is due at 0.2s on the axes but 0.1s on the tool.
    EXPECT_GE(secondsBetween(t0, xCalls[3].at), 0.19);
    EXPECT_LT(secondsBetween(t0, runs[1]), 0.17);
}

TEST_F(CoordinatedExecutorTest, LeadAndLagAreClampedToTheTimeline) {
    config._toolTiming._retractionDistance = 0;
    config._toolTiming._leadTime           = 5.0f;
    config._toolTiming._lagTime            = 5.0f;
    scheduler.ingress(mm(50), mm(0), true);
    auto start = Clock::now();
    executor.execute();

    EXPECT_EQ(tool0.ops(), (std::vector<std::string> { "setSpeed", "setDistance", "run", "stop" }));
    EXPECT_LT(secondsBetween(start, Clock::now()), 1.0);
}

TEST_F(CoordinatedExecutorTest, TrapAbortsEveryController) {
    for (int i = 1; i <= 5; ++i) {
        scheduler.ingress(mm(100 * i), mm(100 * i), i % 2 == 0);
    }
    x.onCall([this](const std::string& op) {
        if (op == "runAndWait") {
            stopSwitch.set(true);
        }
    });

    auto start = Clock::now();
    try {
        executor.execute();
        FAIL() << "execute() should throw";
    } catch (const Error& err) {
        EXPECT_EQ(err, Error::EmergencyStop);
    }
    EXPECT_LT(secondsBetween(start, Clock::now()), 0.5);

    auto xOps = x.ops();
    EXPECT_EQ(std::count(xOps.begin(), xOps.end(), "runAndWait"), 1);
    auto yOps = y.ops();
    EXPECT_LE(std::count(yOps.begin(), yOps.end(), "runAndWait"), 1);
    EXPECT_TRUE(tool0.calls().empty());
    EXPECT_TRUE(scheduler.points().empty());
}

TEST_F(CoordinatedExecutorTest, TrippedTrapBlocksAllHardware) {
    stopSwitch.set(true);
    scheduler.ingress(mm(10), mm(10), true);
    EXPECT_THROW(executor.execute(), Error);
    EXPECT_TRUE(x.calls().empty());
    EXPECT_TRUE(y.calls().empty());
    EXPECT_TRUE(tool0.calls().empty());
}

TEST_F(CoordinatedExecutorTest, HardwareFailureStopsSiblingsAndIsRethrown) {
    config._toolTiming._retractionDistance = 0;
    tool0.failOn("run");
    scheduler.ingress(mm(100), mm(0), true);  // 0 .. 0.1s
    scheduler.ingress(mm(200), mm(0), true);  // 0.1 .. 0.2s

    try {
        executor.execute();
        FAIL() << "execute() should throw";
    } catch (const Error& err) {
        EXPECT_EQ(err, Error::HardwareIOError);
    }
    auto xOps = x.ops();
    EXPECT_LE(std::count(xOps.begin(), xOps.end(), "runAndWait"), 1);
    EXPECT_TRUE(scheduler.points().empty());

    // The executor is usable again for the next job.
    tool0.failOn("");
    x.clearCalls();
    scheduler.ingress(mm(210), mm(0), false);
    EXPECT_NO_THROW(executor.execute());
    EXPECT_EQ(x.values("setDistance"), (std::vector<int64_t> { -10 }));
}

TEST_F(CoordinatedExecutorTest, FailureAfterTripIsReportedAsEmergencyStop) {
    config._toolTiming._retractionDistance = 0;
    tool0.onCall([this](const std::string& op) {
        if (op == "run") {
            stopSwitch.set(true);
        }
    });
    tool0.failOn("run");
    scheduler.ingress(mm(100), mm(0), true);

    try {
        executor.execute();
        FAIL() << "execute() should throw";
    } catch (const Error& err) {
        EXPECT_EQ(err, Error::EmergencyStop);
    }
}
