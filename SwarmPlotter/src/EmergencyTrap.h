// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Machine/Actuator.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Latched abort flag driven by the safety switch.
 *
 * When the switch reports its stop value the trap broadcasts a halt to every
 * motor on the link and latches. From then on check() throws Error::EmergencyStop
 * until an operator calls reinitialize().
 */
class EmergencyTrap {
public:
    // normallyOpen: the switch reads true while pressed, and pressed means stop.
    EmergencyTrap(Machine::Switch& stopSwitch, Machine::HardwareLink& link, bool normallyOpen = true);

    EmergencyTrap(const EmergencyTrap&) = delete;
    EmergencyTrap& operator=(const EmergencyTrap&) = delete;

    // Throws Error::EmergencyStop once tripped.
    void check() const;

    bool isTripped() const { return _tripped.load(); }

    void reinitialize();

    // Halt and latch. Called from the switch listener.
    void trip();

    // Sleeps until deadline. Returns false as soon as the trap trips.
    bool sleepUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    void onSwitch(bool value);

    Machine::HardwareLink& _link;
    bool                   _normallyOpen;

    std::atomic<bool>               _tripped { false };
    mutable std::mutex              _mutex;
    mutable std::condition_variable _wake;
};
