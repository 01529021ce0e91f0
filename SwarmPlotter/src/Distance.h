// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Config.h"

#include <cstdint>

// Ratio between the motor gear and the driven gear. Throws Error::ConfigurationError
// when either tooth count is zero.
float gearRatio(int32_t teethOnMotor, int32_t teethOnSink);

// A whole-millimeter distance on the plotter bed.
class Distance {
public:
    // cm is truncated to whole millimeters before mm is added.
    explicit Distance(float cm = 0, int32_t mm = 0);

    static Distance fromMillimeters(int32_t mm) { return Distance(0, mm); }

    int32_t mm() const { return _mm; }

    // Motor steps for this distance: mm -> screw rotations -> axis rotations -> steps.
    int32_t toSteps(float gearRatio, int32_t stepsPerRotation = DEFAULT_STEPS_PER_ROTATION, float leadMm = WORM_LEAD_MM) const;

    bool operator==(const Distance& other) const { return _mm == other._mm; }
    bool operator!=(const Distance& other) const { return _mm != other._mm; }

private:
    int32_t _mm;
};
