// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "ClosableQueue.h"
#include "EmergencyTrap.h"
#include "Error.h"
#include "MotionScheduler.h"

#include <atomic>
#include <chrono>
#include <mutex>

/**
 * @brief Plays the scheduler's timeline on the hardware.
 *
 * Each execute() starts one controller thread per actuator channel (X, Y, tool).
 * Controllers take their items strictly in order and wait for each item's start
 * time against a shared t0. The tool controller starts drawing leadTime early
 * and stops lagTime early; retraction and priming run unskewed to completion.
 *
 * The trap is checked after every item. The first failing controller aborts
 * all channels; the error is rethrown from execute() once every thread joined.
 */
class CoordinatedExecutor {
public:
    CoordinatedExecutor(MotionScheduler& scheduler, EmergencyTrap& trap, const Machine::PlotterConfig& config);

    CoordinatedExecutor(const CoordinatedExecutor&) = delete;
    CoordinatedExecutor& operator=(const CoordinatedExecutor&) = delete;

    // Runs the pending points and clears them. Throws the first controller error.
    void execute();

private:
    using Clock = std::chrono::steady_clock;

    struct ControllerItem {
        MotorCommand command;
        double       startTime    = 0;
        double       duration     = 0;
        bool         isRetraction = false;
    };

    using Channel = ClosableQueue<ControllerItem>;

    void axisController(Channel& channel);
    void toolController(Channel& channel);

    void runAxisItem(const ControllerItem& item);
    void runToolItem(const ControllerItem& item);

    // Seconds are relative to t0.
    void waitUntil(double seconds);
    void sleepUntil(Clock::time_point due);
    void fail(Error err);

    MotionScheduler&              _scheduler;
    EmergencyTrap&                _trap;
    const Machine::PlotterConfig& _config;

    Channel _xChannel;
    Channel _yChannel;
    Channel _toolChannel;

    Clock::time_point _t0;

    std::mutex        _failMutex;
    Error             _failure = Error::Ok;
    std::atomic<bool> _aborted { false };
};
