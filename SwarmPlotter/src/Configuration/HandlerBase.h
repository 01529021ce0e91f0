// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace Configuration {
    class Configurable;

    // Visits every item of a Configurable tree. Parsers write into the items,
    // generators read them, validators check them against their ranges.
    class HandlerBase {
    protected:
        virtual void enterSection(const char* name, Configurable* value) = 0;

    public:
        virtual void item(const char* name,
                          float&      value,
                          float       minValue = -std::numeric_limits<float>::max(),
                          float       maxValue = std::numeric_limits<float>::max()) = 0;
        virtual void item(const char* name,
                          int32_t&    value,
                          int32_t     minValue = std::numeric_limits<int32_t>::min(),
                          int32_t     maxValue = std::numeric_limits<int32_t>::max()) = 0;
        virtual void item(const char* name, bool& value) = 0;

        template <typename T>
        void section(const char* name, T* value) {
            enterSection(name, value);
        }

        virtual ~HandlerBase() = default;
    };
}
