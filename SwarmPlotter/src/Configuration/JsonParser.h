// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "HandlerBase.h"
#include "Configurable.h"

#include <string>

namespace Configuration {
    // Reads a flat, sectioned JSON record into a Configurable tree. Keys missing
    // from the record keep their current value; ranges are left to the Validator.
    class JsonParser : public HandlerBase {
    public:
        explicit JsonParser(std::string json) : _json(std::move(json)) {}

        void item(const char* name, float& value, float minValue, float maxValue) override;
        void item(const char* name, int32_t& value, int32_t minValue, int32_t maxValue) override;
        void item(const char* name, bool& value) override;

        static size_t findMatchingBrace(const std::string& json, size_t openPos);

    protected:
        void enterSection(const char* name, Configurable* value) override;

    private:
        // Position just past the ':' of "name" at this object's top level.
        size_t findValue(const char* name) const;
        bool   parseNumber(const char* name, double& value) const;

        std::string _json;
    };
}
