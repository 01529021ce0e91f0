// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "DryRunActuator.h"
#include "../Logging.h"

#include <chrono>
#include <cstdlib>
#include <thread>

namespace Machine {
    DryRunActuator::DryRunActuator(std::string name, float timeScale) : _name(std::move(name)), _timeScale(timeScale) {}

    void DryRunActuator::sleepFor(int32_t steps) const {
        if (_timeScale <= 0 || _speed == 0) {
            return;
        }
        double seconds = double(std::abs(steps)) / _speed * _timeScale;
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }

    void DryRunActuator::setSpeed(uint32_t stepsPerSecond) {
        _speed = stepsPerSecond;
        log_verbose(_name << ": speed " << stepsPerSecond);
    }

    void DryRunActuator::setDistance(int32_t steps, bool relative) {
        _distance = steps;
        log_verbose(_name << ": distance " << steps << (relative ? " relative" : " absolute"));
    }

    void DryRunActuator::run() {
        log_debug(_name << ": run " << _distance << " @ " << _speed);
        _position += _distance;
    }

    void DryRunActuator::runAndWait() {
        log_debug(_name << ": run and wait " << _distance << " @ " << _speed);
        sleepFor(_distance);
        _position += _distance;
    }

    void DryRunActuator::stop() {
        log_verbose(_name << ": stop");
    }

    void DryRunActuator::waitDone() {
        sleepFor(_distance);
    }

    void DryRunActuator::setHomingOffset(int32_t steps) {
        log_verbose(_name << ": homing offset " << steps);
    }

    void DryRunActuator::homingAndWait(int32_t maxSteps) {
        log_debug(_name << ": homing toward " << maxSteps);
        _position = 0;
    }

    void DryRunLink::haltAll() {
        log_warn("Dry run: halt all motors");
    }
}
