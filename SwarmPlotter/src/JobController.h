// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Command.h"
#include "CoordinatedExecutor.h"
#include "EmergencyTrap.h"
#include "Error.h"
#include "MotionScheduler.h"
#include "Machine/PlotterConfig.h"

#include <atomic>
#include <mutex>
#include <vector>

enum class JobState : uint8_t {
    Idle,
    Homing,
    Executing,
    Trapped,
};

const char* stateName(JobState state);

/**
 * @brief Accepts one job at a time and runs it: home, schedule, execute.
 *
 * Idle -> Homing -> Executing -> Idle on success. An emergency stop parks the
 * controller in Trapped until rearm(); any other failure returns it to Idle
 * with the scheduler reset to the homed origin.
 */
class JobController {
public:
    JobController(MotionScheduler& scheduler, CoordinatedExecutor& executor, EmergencyTrap& trap, Machine::PlotterConfig& config);

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    // Blocks until the job finished. Error::JobInProgress if another job runs.
    Error submitJob(const std::vector<Toolpath::Command>& commands);

    // Throws on hardware failure or emergency stop.
    void home();

    // Error::NotTrapped unless an emergency stop is latched.
    Error rearm();

    // Live patches, only while Idle.
    Error setFlowRate(float rate);
    Error updateToolTiming(const Machine::ToolTiming& timing);
    Error updateConfig(const std::string& json);

    JobState state() const { return _state.load(); }

private:
    void setState(JobState state);
    void run(const std::vector<Toolpath::Command>& commands);
    void moveAndWait(Machine::Actuator& axis, int32_t steps);

    MotionScheduler&        _scheduler;
    CoordinatedExecutor&    _executor;
    EmergencyTrap&          _trap;
    Machine::PlotterConfig& _config;

    std::mutex            _admission;
    std::atomic<JobState> _state { JobState::Idle };
};
