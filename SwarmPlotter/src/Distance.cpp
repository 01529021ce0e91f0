// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Distance.h"
#include "Error.h"
#include "Logging.h"

#include <cmath>

float gearRatio(int32_t teethOnMotor, int32_t teethOnSink) {
    if (teethOnMotor == 0 || teethOnSink == 0) {
        log_error("Gear tooth count cannot be zero (motor " << teethOnMotor << ", sink " << teethOnSink << ")");
        throw Error::ConfigurationError;
    }
    return float(teethOnMotor) / float(teethOnSink);
}

Distance::Distance(float cm, int32_t mm) : _mm(int32_t(cm * 10) + mm) {}

int32_t Distance::toSteps(float gearRatio, int32_t stepsPerRotation, float leadMm) const {
    double rotations = double(_mm) / leadMm;
    return int32_t(std::lround(rotations * stepsPerRotation * gearRatio));
}
