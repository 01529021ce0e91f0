// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <functional>

namespace Machine {
    // A stepper-driven axis or tool on the hardware link. Every call is a blocking
    // round trip to the node and throws Error::HardwareIOError when the link fails.
    class Actuator {
    public:
        Actuator() = default;

        Actuator(const Actuator&) = delete;
        Actuator& operator=(const Actuator&) = delete;

        virtual const char* name() const = 0;

        virtual void setSpeed(uint32_t stepsPerSecond)         = 0;
        virtual void setDistance(int32_t steps, bool relative) = 0;

        // Starts the programmed move and returns immediately.
        virtual void run() = 0;
        // Starts the programmed move and returns once the node reports it finished.
        virtual void runAndWait() = 0;
        virtual void stop()       = 0;
        virtual void waitDone()   = 0;

        virtual void setHomingOffset(int32_t steps) = 0;
        // Drives toward the end stop for at most maxSteps and waits for the node.
        virtual void homingAndWait(int32_t maxSteps) = 0;

        virtual ~Actuator() = default;
    };

    // A switch node. Listeners are called from the link's receive context.
    class Switch {
    public:
        using Listener = std::function<void(bool value)>;

        virtual const char* name() const                  = 0;
        virtual void        onValueChanged(Listener listener) = 0;

        virtual ~Switch() = default;
    };

    // The shared serial link all nodes hang off.
    class HardwareLink {
    public:
        // Broadcast that stops every motor on the link at once.
        virtual void haltAll() = 0;

        virtual ~HardwareLink() = default;
    };
}
