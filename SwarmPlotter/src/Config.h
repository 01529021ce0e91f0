// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

// Compile-time defaults for the plotter. Everything here can be overridden by the
// JSON configuration record, see Machine/PlotterConfig.h.

#include <cstdint>

#ifndef M_PI
#    define M_PI 3.14159265358979323846
#endif

// Worm gear drive: one screw rotation advances the carriage by module * pi millimeters.
const float WORM_MODULE  = 1.5f;
const float WORM_LEAD_MM = float(WORM_MODULE * M_PI);

const int32_t DEFAULT_STEPS_PER_ROTATION = 200;

// Constant planar speed of the XY carriage in steps per second.
const float DEFAULT_PLANAR_SPEED = 1000.0f;

// Tool motors are never commanded slower than this (steps per second).
const float DEFAULT_TOOL_SPEED_FLOOR = 50.0f;

const float MAX_FLOW_RATE = 10.0f;

// Collinearity tolerance for the merge pass (signed triangle area, mm^2).
const double COLLINEAR_TOLERANCE = 1e-6;

// Homing and park position of the carriage.
const int32_t DEFAULT_HOMING_OFFSET   = -1000;
const int32_t DEFAULT_HOMING_MAXSTEPS = 500000;
const int32_t DEFAULT_PARK_X_MM       = 75;
const int32_t DEFAULT_PARK_Y_MM       = 115;

const int32_t DEFAULT_TOOL_COUNT = 2;
const int32_t MAX_TOOL_COUNT     = 8;
