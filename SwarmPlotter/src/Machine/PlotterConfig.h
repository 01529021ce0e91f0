// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "../Config.h"
#include "../Distance.h"
#include "../Logging.h"
#include "../Configuration/Configurable.h"

#include <string>

namespace Machine {
    // Lead screw and gearing shared by the X and Y axes.
    class AxisGeometry : public Configuration::Configurable {
    public:
        float   _leadMm           = WORM_LEAD_MM;
        int32_t _stepsPerRotation = DEFAULT_STEPS_PER_ROTATION;
        int32_t _teethOnMotor     = 1;
        int32_t _teethOnSink      = 1;

        AxisGeometry() = default;

        void group(Configuration::HandlerBase& handler) override {
            handler.item("lead_mm", _leadMm, 0.001f, 1000.0f);
            handler.item("steps_per_rotation", _stepsPerRotation, 1, 100000);
            handler.item("teeth_on_motor", _teethOnMotor, 0, 1000);
            handler.item("teeth_on_sink", _teethOnSink, 0, 1000);
        }

        // Zero teeth are caught here rather than mid-job.
        void validate() override { gearRatio(_teethOnMotor, _teethOnSink); }

        int32_t toSteps(const Distance& distance) const {
            return distance.toSteps(gearRatio(_teethOnMotor, _teethOnSink), _stepsPerRotation, _leadMm);
        }
    };

    class MotionSettings : public Configuration::Configurable {
    public:
        float _planarSpeed    = DEFAULT_PLANAR_SPEED;      // steps/s along the path
        float _toolSpeedFloor = DEFAULT_TOOL_SPEED_FLOOR;  // steps/s
        float _flowRate       = 1.0f;                      // tool steps per planar step

        MotionSettings() = default;

        void group(Configuration::HandlerBase& handler) override {
            handler.item("planar_speed", _planarSpeed, 0.0f, 100000.0f);
            handler.item("tool_speed_floor", _toolSpeedFloor, 0.0f, 100000.0f);
            handler.item("flow_rate", _flowRate, 0.0f, MAX_FLOW_RATE);
        }
    };

    // Compensation for the slow response of the tool motors.
    class ToolTiming : public Configuration::Configurable {
    public:
        float   _leadTime           = 0.0f;  // seconds the tool starts ahead of the axes
        float   _lagTime            = 0.0f;  // seconds the tool stops ahead of the axes
        int32_t _retractionDistance = 0;     // steps
        int32_t _retractionSpeed    = 1000;  // steps/s

        ToolTiming() = default;

        void group(Configuration::HandlerBase& handler) override {
            handler.item("lead_time", _leadTime, 0.0f, 60.0f);
            handler.item("lag_time", _lagTime, 0.0f, 60.0f);
            handler.item("retraction_distance", _retractionDistance, 0, 1000000);
            handler.item("retraction_speed", _retractionSpeed, 0, 1000000);
        }
    };

    class HomingSettings : public Configuration::Configurable {
    public:
        int32_t _homingOffset = DEFAULT_HOMING_OFFSET;
        int32_t _maxSteps     = DEFAULT_HOMING_MAXSTEPS;
        int32_t _parkXMm      = DEFAULT_PARK_X_MM;
        int32_t _parkYMm      = DEFAULT_PARK_Y_MM;

        HomingSettings() = default;

        void group(Configuration::HandlerBase& handler) override {
            handler.item("homing_offset", _homingOffset);
            handler.item("max_steps", _maxSteps, 1, 10000000);
            handler.item("park_x_mm", _parkXMm, 0, 10000);
            handler.item("park_y_mm", _parkYMm, 0, 10000);
        }
    };

    class PlotterConfig : public Configuration::Configurable {
    public:
        AxisGeometry   _axes;
        MotionSettings _motion;
        ToolTiming     _toolTiming;
        HomingSettings _homing;

        int32_t _toolCount = DEFAULT_TOOL_COUNT;
        int32_t _logLevel  = MsgLevelInfo;

        // The emergency stop reads true while pressed.
        bool _stopSwitchNormallyOpen = true;

        PlotterConfig() = default;

        void group(Configuration::HandlerBase& handler) override;

        // Check every item against its range; throws Error::ConfigurationError.
        void validateAll();

        // Parse and validate. On failure the config is left unchanged.
        void load_json(const std::string& json);
        void load_file(const std::string& path);

        std::string toJSON();
        void        save_file(const std::string& path);
    };
}
