// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Actuator.h"

#include <string>

namespace Machine {
    // Stands in for a stepper node: logs every call and, when timeScale > 0,
    // sleeps for the time the move would take.
    class DryRunActuator : public Actuator {
    public:
        explicit DryRunActuator(std::string name, float timeScale = 0.0f);

        const char* name() const override { return _name.c_str(); }

        void setSpeed(uint32_t stepsPerSecond) override;
        void setDistance(int32_t steps, bool relative) override;
        void run() override;
        void runAndWait() override;
        void stop() override;
        void waitDone() override;
        void setHomingOffset(int32_t steps) override;
        void homingAndWait(int32_t maxSteps) override;

        int64_t position() const { return _position; }

    private:
        void sleepFor(int32_t steps) const;

        std::string _name;
        float       _timeScale;
        uint32_t    _speed    = 0;
        int32_t     _distance = 0;
        int64_t     _position = 0;
    };

    // Switch driven from software, e.g. by Ctrl-C in the CLI.
    class DryRunSwitch : public Switch {
    public:
        explicit DryRunSwitch(std::string name) : _name(std::move(name)) {}

        const char* name() const override { return _name.c_str(); }
        void        onValueChanged(Listener listener) override { _listener = std::move(listener); }

        void set(bool value) {
            if (_listener) {
                _listener(value);
            }
        }

    private:
        std::string _name;
        Listener    _listener;
    };

    class DryRunLink : public HardwareLink {
    public:
        void haltAll() override;
    };
}
