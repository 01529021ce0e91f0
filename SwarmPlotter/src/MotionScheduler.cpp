// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "MotionScheduler.h"
#include "Logging.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

// Axis speeds are whole steps per second; a moving axis never gets zero.
static uint32_t axisSpeed(int32_t steps, double speed) {
    if (steps == 0) {
        return 0;
    }
    return std::max<uint32_t>(1, uint32_t(std::lround(std::fabs(speed))));
}

static double axisTime(int32_t steps, double speed) {
    if (speed == 0) {
        return 0;
    }
    return std::abs(steps) / std::fabs(speed);
}

MotionScheduler::MotionScheduler(Machine::Actuator&              xAxis,
                                 Machine::Actuator&              yAxis,
                                 std::vector<Machine::Actuator*> tools,
                                 const Machine::PlotterConfig&   config) :
    _xAxis(xAxis),
    _yAxis(yAxis), _tools(std::move(tools)), _config(config) {}

Machine::Actuator* MotionScheduler::toolActuator(int32_t toolId) const {
    if (toolId < 0 || size_t(toolId) >= _tools.size()) {
        return nullptr;
    }
    return _tools[toolId];
}

bool MotionScheduler::hasTool(int32_t toolId) const {
    return toolActuator(toolId) != nullptr;
}

void MotionScheduler::append(TimedControlPoint point) {
    point.startTime = _timeCursor;
    _timeCursor += point.duration;
    _points.push_back(point);
}

void MotionScheduler::appendRetraction(Machine::Actuator* tool, int32_t direction) {
    if (!tool) {
        return;
    }
    auto& timing = _config._toolTiming;

    TimedControlPoint point;
    point.x            = { &_xAxis, 0, 0 };
    point.y            = { &_yAxis, 0, 0 };
    point.tool         = MotorCommand { tool, direction * timing._retractionDistance, uint32_t(timing._retractionSpeed) };
    point.duration     = timing._retractionSpeed ? double(timing._retractionDistance) / timing._retractionSpeed : 0;
    point.isRetraction = true;
    log_verbose((direction < 0 ? "Retract " : "Prime ") << tool->name() << " " << timing._retractionDistance << " steps");
    append(point);
}

void MotionScheduler::ingress(const Distance& x, const Distance& y, bool shouldDraw) {
    Machine::Actuator* tool = toolActuator(_activeTool);

    if (_lastWasDraw && !shouldDraw) {
        appendRetraction(tool, -1);
    } else if (!_lastWasDraw && shouldDraw) {
        appendRetraction(tool, 1);
    }
    _lastWasDraw = shouldDraw;

    int32_t targetX = -_config._axes.toSteps(x);
    int32_t targetY = _config._axes.toSteps(y);
    int32_t dx      = targetX - _currentStepX;
    int32_t dy      = targetY - _currentStepY;
    if (dx == 0 && dy == 0) {
        return;
    }

    double planarSpeed = _config._motion._planarSpeed;
    double angle       = std::atan2(double(dy), double(dx));
    double speedX      = planarSpeed * std::cos(angle);
    double speedY      = planarSpeed * std::sin(angle);

    TimedControlPoint point;
    point.x        = { &_xAxis, dx, axisSpeed(dx, speedX) };
    point.y        = { &_yAxis, dy, axisSpeed(dy, speedY) };
    point.duration = std::max(axisTime(dx, speedX), axisTime(dy, speedY));

    if (shouldDraw && tool) {
        double  planarDistance = std::hypot(double(dx), double(dy));
        int32_t toolSteps      = int32_t(std::lround(planarDistance * _config._motion._flowRate));
        double  toolSpeed      = point.duration > 0 ? std::fabs(toolSteps / point.duration) : 0;
        toolSpeed              = std::max(toolSpeed, double(_config._motion._toolSpeedFloor));
        point.tool             = MotorCommand { tool, toolSteps, uint32_t(std::lround(toolSpeed)) };
    }

    append(point);
    _currentStepX = targetX;
    _currentStepY = targetY;
}

void MotionScheduler::selectTool(int32_t toolId) {
    if (toolId == _activeTool) {
        return;
    }
    if (_lastWasDraw) {
        appendRetraction(toolActuator(_activeTool), -1);
        _lastWasDraw = false;
    }
    log_debug("Tool " << _activeTool << " -> " << toolId);
    _activeTool = toolId;
}

void MotionScheduler::clear() {
    _points.clear();
    _timeCursor = 0;
}

void MotionScheduler::reset() {
    clear();
    _currentStepX = 0;
    _currentStepY = 0;
    _lastWasDraw  = false;
    _activeTool   = 0;
}
