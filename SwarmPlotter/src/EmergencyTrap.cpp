// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "EmergencyTrap.h"
#include "Error.h"
#include "Logging.h"

EmergencyTrap::EmergencyTrap(Machine::Switch& stopSwitch, Machine::HardwareLink& link, bool normallyOpen) :
    _link(link), _normallyOpen(normallyOpen) {
    stopSwitch.onValueChanged([this](bool value) { onSwitch(value); });
    log_debug("Emergency trap armed on " << stopSwitch.name() << (normallyOpen ? " (normally open)" : " (normally closed)"));
}

void EmergencyTrap::onSwitch(bool value) {
    // A normally-open switch closes (true) when pressed.
    if (value == _normallyOpen) {
        trip();
    }
}

void EmergencyTrap::trip() {
    if (_tripped.load()) {
        return;
    }
    log_error("Emergency stop");
    try {
        _link.haltAll();
    } catch (const Error& err) {
        log_error("Halt broadcast failed: " << errorString(err));
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _tripped = true;
    }
    _wake.notify_all();
}

void EmergencyTrap::check() const {
    if (_tripped.load()) {
        throw Error::EmergencyStop;
    }
}

void EmergencyTrap::reinitialize() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_tripped.load()) {
        log_info("Emergency trap re-armed");
    }
    _tripped = false;
}

bool EmergencyTrap::sleepUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(_mutex);
    return !_wake.wait_until(lock, deadline, [this] { return _tripped.load(); });
}
