// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "JobController.h"
#include "Logging.h"

#include <variant>

const char* stateName(JobState state) {
    switch (state) {
        case JobState::Idle:
            return "Idle";
        case JobState::Homing:
            return "Homing";
        case JobState::Executing:
            return "Executing";
        case JobState::Trapped:
            return "Trapped";
    }
    return "Unknown";
}

JobController::JobController(MotionScheduler&        scheduler,
                             CoordinatedExecutor&    executor,
                             EmergencyTrap&          trap,
                             Machine::PlotterConfig& config) :
    _scheduler(scheduler),
    _executor(executor), _trap(trap), _config(config) {}

void JobController::setState(JobState state) {
    log_debug("Job: " << stateName(_state.load()) << " -> " << stateName(state));
    _state = state;
}

void JobController::moveAndWait(Machine::Actuator& axis, int32_t steps) {
    axis.setSpeed(uint32_t(_config._motion._planarSpeed));
    axis.setDistance(steps, true);
    axis.runAndWait();
    _trap.check();
}

void JobController::home() {
    auto&              homing = _config._homing;
    Machine::Actuator& x      = _scheduler.xAxis();
    Machine::Actuator& y      = _scheduler.yAxis();

    log_info("Job: Homing");
    // Bounce the offset so the node reapplies it even if unchanged.
    x.setHomingOffset(-homing._homingOffset);
    x.setHomingOffset(homing._homingOffset);
    x.homingAndWait(-homing._maxSteps);
    _trap.check();
    y.homingAndWait(homing._maxSteps);
    _trap.check();

    moveAndWait(y, -_config._axes.toSteps(Distance::fromMillimeters(homing._parkYMm)));
    moveAndWait(x, _config._axes.toSteps(Distance::fromMillimeters(homing._parkXMm)));
    log_info("Job: Homed");
}

void JobController::run(const std::vector<Toolpath::Command>& commands) {
    _scheduler.reset();
    _trap.check();
    home();

    setState(JobState::Executing);
    for (const auto& command : commands) {
        std::visit(Toolpath::overloaded {
                       [this](const Toolpath::Move& move) { _scheduler.ingress(move.x, move.y, false); },
                       [this](const Toolpath::Draw& draw) { _scheduler.ingress(draw.x, draw.y, true); },
                       [this](const Toolpath::SelectTool& select) { _scheduler.selectTool(select.toolId); },
                   },
                   command);
        // Each command is its own timeline; the axes resynchronize between commands.
        _executor.execute();
        _trap.check();
    }
}

Error JobController::submitJob(const std::vector<Toolpath::Command>& commands) {
    {
        std::lock_guard<std::mutex> lock(_admission);
        if (_state.load() != JobState::Idle) {
            log_warn("Job: Rejected, controller is " << stateName(_state.load()));
            return Error::JobInProgress;
        }
        for (const auto& command : commands) {
            if (auto select = std::get_if<Toolpath::SelectTool>(&command)) {
                if (!_scheduler.hasTool(select->toolId)) {
                    log_error("Job: No actuator for tool " << select->toolId);
                    return Error::InvalidTool;
                }
            }
        }
        setState(JobState::Homing);
    }

    log_info("Job: Started, " << commands.size() << " commands");
    try {
        run(commands);
    } catch (const Error& err) {
        _scheduler.clear();
        // A node may fail on the halt broadcast before the trap check is reached.
        if (err == Error::EmergencyStop || _trap.isTripped()) {
            log_error("Job: Aborted by emergency stop");
            setState(JobState::Trapped);
            return Error::EmergencyStop;
        } else {
            log_error("Job: Failed, " << errorString(err));
            _scheduler.reset();
            setState(JobState::Idle);
        }
        return err;
    }

    _scheduler.clear();
    setState(JobState::Idle);
    log_info("Job: Finished");
    return Error::Ok;
}

Error JobController::rearm() {
    std::lock_guard<std::mutex> lock(_admission);
    if (_state.load() != JobState::Trapped) {
        return Error::NotTrapped;
    }
    _trap.reinitialize();
    setState(JobState::Idle);
    return Error::Ok;
}

Error JobController::setFlowRate(float rate) {
    std::lock_guard<std::mutex> lock(_admission);
    if (_state.load() != JobState::Idle) {
        return Error::JobInProgress;
    }
    if (!(rate >= 0 && rate <= MAX_FLOW_RATE)) {
        log_error("Flow rate " << rate << " is outside [0, " << MAX_FLOW_RATE << "]");
        return Error::ConfigurationError;
    }
    _config._motion._flowRate = rate;
    log_info("Flow rate set to " << rate);
    return Error::Ok;
}

Error JobController::updateToolTiming(const Machine::ToolTiming& timing) {
    std::lock_guard<std::mutex> lock(_admission);
    if (_state.load() != JobState::Idle) {
        return Error::JobInProgress;
    }
    Machine::PlotterConfig candidate(_config);
    candidate._toolTiming = timing;
    try {
        candidate.validateAll();
    } catch (const Error& err) {
        return err;
    }
    _config._toolTiming = timing;
    return Error::Ok;
}

Error JobController::updateConfig(const std::string& json) {
    std::lock_guard<std::mutex> lock(_admission);
    if (_state.load() != JobState::Idle) {
        return Error::JobInProgress;
    }
    try {
        _config.load_json(json);
    } catch (const Error& err) {
        return err;
    }
    return Error::Ok;
}
