// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Validator.h"
#include "../Error.h"
#include "../Logging.h"

#include <cmath>

namespace Configuration {
    void Validator::enterSection(const char* name, Configurable* value) {
        std::string parent = _path;
        _path += name;
        _path += '/';
        value->group(*this);
        value->validate();
        _path = parent;
    }

    void Validator::item(const char* name, float& value, float minValue, float maxValue) {
        if (std::isnan(value) || value < minValue || value > maxValue) {
            log_error("Configuration " << _path << name << " = " << value << " is outside [" << minValue << ", " << maxValue << "]");
            throw Error::ConfigurationError;
        }
    }

    void Validator::item(const char* name, int32_t& value, int32_t minValue, int32_t maxValue) {
        if (value < minValue || value > maxValue) {
            log_error("Configuration " << _path << name << " = " << value << " is outside [" << minValue << ", " << maxValue << "]");
            throw Error::ConfigurationError;
        }
    }
}
