// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Command.h"
#include "Error.h"
#include "Machine/Actuator.h"
#include "Machine/PlotterConfig.h"

#include <gmock/gmock.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Toolpath {
    inline void PrintTo(const Move& m, std::ostream* os) { *os << toString(Command(m)); }
    inline void PrintTo(const Draw& d, std::ostream* os) { *os << toString(Command(d)); }
    inline void PrintTo(const SelectTool& t, std::ostream* os) { *os << toString(Command(t)); }
}

inline void PrintTo(const Error& err, std::ostream* os) {
    *os << errorString(err);
}

// One call on a RecordingActuator.
struct ActuatorCall {
    std::string                           op;
    int64_t                               value = 0;
    std::chrono::steady_clock::time_point at;
};

// Records every call with a timestamp. Safe to call from the controller threads.
class RecordingActuator : public Machine::Actuator {
public:
    explicit RecordingActuator(std::string name) : _name(std::move(name)) {}

    const char* name() const override { return _name.c_str(); }

    void setSpeed(uint32_t stepsPerSecond) override { record("setSpeed", stepsPerSecond); }
    void setDistance(int32_t steps, bool relative) override { record("setDistance", steps); }
    void run() override { record("run", 0); }
    void runAndWait() override { record("runAndWait", 0); }
    void stop() override { record("stop", 0); }
    void waitDone() override { record("waitDone", 0); }
    void setHomingOffset(int32_t steps) override { record("setHomingOffset", steps); }
    void homingAndWait(int32_t maxSteps) override { record("homingAndWait", maxSteps); }

    // Throw Error::HardwareIOError on the given operation.
    void failOn(const std::string& op) {
        std::lock_guard<std::mutex> lock(_mutex);
        _failOn = op;
    }

    // Called after every recorded operation, outside the lock.
    void onCall(std::function<void(const std::string& op)> hook) {
        std::lock_guard<std::mutex> lock(_mutex);
        _hook = std::move(hook);
    }

    std::vector<ActuatorCall> calls() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _calls;
    }

    std::vector<std::string> ops() const {
        std::vector<std::string> result;
        for (const auto& call : calls()) {
            result.push_back(call.op);
        }
        return result;
    }

    std::vector<int64_t> values(const std::string& op) const {
        std::vector<int64_t> result;
        for (const auto& call : calls()) {
            if (call.op == op) {
                result.push_back(call.value);
            }
        }
        return result;
    }

    std::optional<ActuatorCall> first(const std::string& op) const {
        for (const auto& call : calls()) {
            if (call.op == op) {
                return call;
            }
        }
        return std::nullopt;
    }

    std::optional<ActuatorCall> last(const std::string& op) const {
        auto all = calls();
        for (auto it = all.rbegin(); it != all.rend(); ++it) {
            if (it->op == op) {
                return *it;
            }
        }
        return std::nullopt;
    }

    void clearCalls() {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.clear();
    }

private:
    void record(const char* op, int64_t value) {
        std::function<void(const std::string&)> hook;
        bool                                    fail;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _calls.push_back({ op, value, std::chrono::steady_clock::now() });
            hook = _hook;
            fail = _failOn == op;
        }
        if (hook) {
            hook(op);
        }
        if (fail) {
            throw Error::HardwareIOError;
        }
    }

    std::string                             _name;
    mutable std::mutex                      _mutex;
    std::vector<ActuatorCall>               _calls;
    std::string                             _failOn;
    std::function<void(const std::string&)> _hook;
};

class FakeSwitch : public Machine::Switch {
public:
    const char* name() const override { return "fake_switch"; }
    void        onValueChanged(Listener listener) override { _listener = std::move(listener); }

    void set(bool value) {
        if (_listener) {
            _listener(value);
        }
    }

private:
    Listener _listener;
};

class MockLink : public Machine::HardwareLink {
public:
    MOCK_METHOD(void, haltAll, (), (override));
};

// One step per millimeter and round numbers everywhere.
inline Machine::PlotterConfig unitConfig() {
    Machine::PlotterConfig config;
    config._axes._leadMm                   = 200.0f;
    config._axes._stepsPerRotation         = 200;
    config._motion._planarSpeed            = 1000.0f;
    config._motion._toolSpeedFloor         = 50.0f;
    config._motion._flowRate               = 1.0f;
    config._toolTiming._retractionDistance = 50;
    config._toolTiming._retractionSpeed    = 1000;
    return config;
}

inline Distance mm(int32_t value) {
    return Distance::fromMillimeters(value);
}
