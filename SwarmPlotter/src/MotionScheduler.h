// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Distance.h"
#include "Machine/Actuator.h"
#include "Machine/PlotterConfig.h"

#include <cstdint>
#include <optional>
#include <vector>

// One actuator's share of a control point. Zero steps at zero speed is a no-op.
struct MotorCommand {
    Machine::Actuator* actuator = nullptr;
    int32_t            steps    = 0;
    uint32_t           speed    = 0;
};

// A slice of the plot timeline. Point i+1 starts where point i ends.
struct TimedControlPoint {
    MotorCommand                x;
    MotorCommand                y;
    std::optional<MotorCommand> tool;
    double                      startTime    = 0;  // seconds from dispatch
    double                      duration     = 0;  // seconds
    bool                        isRetraction = false;
};

/**
 * @brief Turns commands into a flat timeline of TimedControlPoints.
 *
 * Tracks the carriage position in steps, the active tool and whether the last
 * motion was a draw. The carriage moves at a constant planar speed; each planar
 * move is split into X and Y speeds by its angle. Draw/travel transitions get a
 * synthetic retraction or priming point for the active tool.
 *
 * The X axis is mirrored: a positive X coordinate is a negative step count.
 */
class MotionScheduler {
public:
    // tools[i] is the actuator of tool id i. Unused slots may be null.
    MotionScheduler(Machine::Actuator&              xAxis,
                    Machine::Actuator&              yAxis,
                    std::vector<Machine::Actuator*> tools,
                    const Machine::PlotterConfig&   config);

    MotionScheduler(const MotionScheduler&) = delete;
    MotionScheduler& operator=(const MotionScheduler&) = delete;

    void ingress(const Distance& x, const Distance& y, bool shouldDraw);
    void selectTool(int32_t toolId);

    const std::vector<TimedControlPoint>& points() const { return _points; }

    void clear();
    void reset();

    int32_t activeTool() const { return _activeTool; }
    bool    hasTool(int32_t toolId) const;
    bool    lastWasDraw() const { return _lastWasDraw; }
    int32_t currentStepX() const { return _currentStepX; }
    int32_t currentStepY() const { return _currentStepY; }

    Machine::Actuator& xAxis() { return _xAxis; }
    Machine::Actuator& yAxis() { return _yAxis; }

private:
    Machine::Actuator* toolActuator(int32_t toolId) const;

    // Appends a retraction (negative) or priming (positive) point for the tool.
    void appendRetraction(Machine::Actuator* tool, int32_t direction);
    void append(TimedControlPoint point);

    Machine::Actuator&              _xAxis;
    Machine::Actuator&              _yAxis;
    std::vector<Machine::Actuator*> _tools;
    const Machine::PlotterConfig&   _config;

    int32_t _currentStepX = 0;
    int32_t _currentStepY = 0;
    int32_t _activeTool   = 0;
    bool    _lastWasDraw  = false;
    double  _timeCursor   = 0;

    std::vector<TimedControlPoint> _points;
};
