// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "HandlerBase.h"
#include "Configurable.h"
#include "JSONEncoder.h"

namespace Configuration {
    // Writes a Configurable tree as a JSON record that JsonParser reads back.
    class JsonGenerator : public HandlerBase {
        JSONencoder& _encoder;

    protected:
        void enterSection(const char* name, Configurable* value) override;

    public:
        explicit JsonGenerator(JSONencoder& encoder) : _encoder(encoder) {}

        void item(const char* name, float& value, float minValue, float maxValue) override { _encoder.member(name, value); }
        void item(const char* name, int32_t& value, int32_t minValue, int32_t maxValue) override { _encoder.member(name, value); }
        void item(const char* name, bool& value) override { _encoder.member(name, value); }
    };
}
