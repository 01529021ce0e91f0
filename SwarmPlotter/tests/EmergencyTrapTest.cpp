// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "EmergencyTrap.h"
#include "FakeHardware.h"

#include <gtest/gtest.h>

#include <thread>

using ::testing::Throw;

class EmergencyTrapTest : public ::testing::Test {
protected:
    FakeSwitch                      stopSwitch;
    ::testing::StrictMock<MockLink> link;
};

TEST_F(EmergencyTrapTest, NeverThrowsBeforeTripping) {
    EmergencyTrap trap(stopSwitch, link);
    for (int i = 0; i < 10; ++i) {
        EXPECT_NO_THROW(trap.check());
    }
    EXPECT_FALSE(trap.isTripped());
}

TEST_F(EmergencyTrapTest, PressHaltsThenLatches) {
    EmergencyTrap trap(stopSwitch, link);
    EXPECT_CALL(link, haltAll()).Times(1);

    stopSwitch.set(true);

    EXPECT_TRUE(trap.isTripped());
    for (int i = 0; i < 3; ++i) {
        try {
            trap.check();
            FAIL() << "check() should throw once tripped";
        } catch (const Error& err) {
            EXPECT_EQ(err, Error::EmergencyStop);
        }
    }
}

TEST_F(EmergencyTrapTest, ReleaseDoesNotClearTheLatch) {
    EmergencyTrap trap(stopSwitch, link);
    EXPECT_CALL(link, haltAll()).Times(1);

    stopSwitch.set(true);
    stopSwitch.set(false);
    stopSwitch.set(true);

    EXPECT_THROW(trap.check(), Error);
}

TEST_F(EmergencyTrapTest, ReleaseAloneIsIgnored) {
    EmergencyTrap trap(stopSwitch, link);
    stopSwitch.set(false);
    EXPECT_NO_THROW(trap.check());
}

TEST_F(EmergencyTrapTest, NormallyClosedTripsOnRelease) {
    EmergencyTrap trap(stopSwitch, link, false);
    EXPECT_CALL(link, haltAll()).Times(1);

    stopSwitch.set(true);
    EXPECT_NO_THROW(trap.check());
    stopSwitch.set(false);
    EXPECT_THROW(trap.check(), Error);
}

TEST_F(EmergencyTrapTest, ReinitializeRearms) {
    EmergencyTrap trap(stopSwitch, link);
    EXPECT_CALL(link, haltAll()).Times(2);

    stopSwitch.set(true);
    trap.reinitialize();
    EXPECT_FALSE(trap.isTripped());
    EXPECT_NO_THROW(trap.check());

    stopSwitch.set(true);
    EXPECT_THROW(trap.check(), Error);
}

TEST_F(EmergencyTrapTest, FailedHaltStillLatches) {
    EmergencyTrap trap(stopSwitch, link);
    EXPECT_CALL(link, haltAll()).WillOnce(Throw(Error::HardwareIOError));

    stopSwitch.set(true);
    EXPECT_TRUE(trap.isTripped());
    EXPECT_THROW(trap.check(), Error);
}

TEST_F(EmergencyTrapTest, SleepRunsToDeadlineWhenArmed) {
    EmergencyTrap trap(stopSwitch, link);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(trap.sleepUntil(start + std::chrono::milliseconds(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST_F(EmergencyTrapTest, TripWakesASleeper) {
    EmergencyTrap trap(stopSwitch, link);
    EXPECT_CALL(link, haltAll()).Times(1);

    auto        start = std::chrono::steady_clock::now();
    std::thread presser([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stopSwitch.set(true);
    });
    bool slept = trap.sleepUntil(start + std::chrono::seconds(10));
    presser.join();

    EXPECT_FALSE(slept);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
