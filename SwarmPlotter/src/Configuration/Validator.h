// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "HandlerBase.h"
#include "Configurable.h"

#include <string>

namespace Configuration {
    // Checks every item against its declared range and runs each section's
    // validate(). The first violation throws Error::ConfigurationError.
    class Validator : public HandlerBase {
    protected:
        void enterSection(const char* name, Configurable* value) override;

    public:
        Validator() = default;

        void item(const char* name, float& value, float minValue, float maxValue) override;
        void item(const char* name, int32_t& value, int32_t minValue, int32_t maxValue) override;
        void item(const char* name, bool& value) override {}

    private:
        std::string _path;
    };
}
