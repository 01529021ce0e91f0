// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "CoordinatedExecutor.h"
#include "Logging.h"

#include <algorithm>
#include <functional>
#include <thread>

static const auto ABORT_POLL = std::chrono::milliseconds(10);

static std::chrono::steady_clock::duration toDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
}

CoordinatedExecutor::CoordinatedExecutor(MotionScheduler& scheduler, EmergencyTrap& trap, const Machine::PlotterConfig& config) :
    _scheduler(scheduler), _trap(trap), _config(config) {}

void CoordinatedExecutor::sleepUntil(Clock::time_point due) {
    // Returns early when the trap trips, or within one poll slice of an abort.
    while (!_aborted.load()) {
        auto now = Clock::now();
        if (now >= due) {
            return;
        }
        if (!_trap.sleepUntil(std::min(due, now + ABORT_POLL))) {
            return;
        }
    }
}

void CoordinatedExecutor::waitUntil(double seconds) {
    sleepUntil(_t0 + toDuration(seconds));
}

void CoordinatedExecutor::fail(Error err) {
    {
        std::lock_guard<std::mutex> lock(_failMutex);
        if (_failure == Error::Ok) {
            _failure = err;
        }
    }
    _aborted = true;
    _xChannel.abort();
    _yChannel.abort();
    _toolChannel.abort();
}

void CoordinatedExecutor::runAxisItem(const ControllerItem& item) {
    waitUntil(item.startTime);
    _trap.check();
    if (_aborted.load()) {
        return;
    }
    if (item.command.steps != 0) {
        Machine::Actuator& axis = *item.command.actuator;
        axis.setSpeed(item.command.speed);
        axis.setDistance(item.command.steps, true);
        axis.runAndWait();
    }
    _trap.check();
}

void CoordinatedExecutor::runToolItem(const ControllerItem& item) {
    Machine::Actuator& tool = *item.command.actuator;
    if (item.isRetraction) {
        waitUntil(item.startTime);
        _trap.check();
        if (_aborted.load()) {
            return;
        }
        if (item.command.steps != 0) {
            tool.setSpeed(item.command.speed);
            tool.setDistance(item.command.steps, true);
            tool.runAndWait();
        }
        _trap.check();
        return;
    }

    auto&  timing   = _config._toolTiming;
    double start    = std::max(0.0, item.startTime - timing._leadTime);
    double duration = std::max(0.0, item.duration - timing._lagTime);

    waitUntil(start);
    _trap.check();
    if (_aborted.load()) {
        return;
    }
    if (item.command.steps != 0) {
        tool.setSpeed(item.command.speed);
        tool.setDistance(item.command.steps, true);
        tool.run();
        sleepUntil(Clock::now() + toDuration(duration));
        tool.stop();
    }
    _trap.check();
}

void CoordinatedExecutor::axisController(Channel& channel) {
    ControllerItem item;
    while (channel.pop(item)) {
        try {
            runAxisItem(item);
        } catch (const Error& err) {
            log_debug("Axis " << item.command.actuator->name() << " controller stopped: " << errorString(err));
            fail(err);
            channel.taskDone();
            return;
        }
        channel.taskDone();
    }
}

void CoordinatedExecutor::toolController(Channel& channel) {
    ControllerItem item;
    while (channel.pop(item)) {
        try {
            runToolItem(item);
        } catch (const Error& err) {
            log_debug("Tool " << item.command.actuator->name() << " controller stopped: " << errorString(err));
            fail(err);
            channel.taskDone();
            return;
        }
        channel.taskDone();
    }
}

void CoordinatedExecutor::execute() {
    const auto& points = _scheduler.points();
    if (points.empty()) {
        return;
    }

    // A previous job may have left its channels aborted.
    _xChannel.reopen();
    _yChannel.reopen();
    _toolChannel.reopen();
    _failure = Error::Ok;
    _aborted = false;

    for (const auto& point : points) {
        _xChannel.push({ point.x, point.startTime, point.duration, point.isRetraction });
        _yChannel.push({ point.y, point.startTime, point.duration, point.isRetraction });
        if (point.tool) {
            _toolChannel.push({ *point.tool, point.startTime, point.duration, point.isRetraction });
        }
    }
    log_info("Executing " << points.size() << " control points, " << (points.back().startTime + points.back().duration) << "s");

    _t0 = Clock::now();
    std::thread xThread(&CoordinatedExecutor::axisController, this, std::ref(_xChannel));
    std::thread yThread(&CoordinatedExecutor::axisController, this, std::ref(_yChannel));
    std::thread toolThread(&CoordinatedExecutor::toolController, this, std::ref(_toolChannel));

    _xChannel.waitDrained();
    _yChannel.waitDrained();
    _toolChannel.waitDrained();

    _xChannel.close();
    _yChannel.close();
    _toolChannel.close();
    xThread.join();
    yThread.join();
    toolThread.join();

    _scheduler.clear();

    if (_failure != Error::Ok) {
        Error failure = _trap.isTripped() ? Error::EmergencyStop : _failure;
        log_error("Execution aborted: " << errorString(failure));
        throw failure;
    }
    log_debug("Execution finished in " << std::chrono::duration<double>(Clock::now() - _t0).count() << "s");
}
