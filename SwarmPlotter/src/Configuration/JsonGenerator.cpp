// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "JsonGenerator.h"

namespace Configuration {
    void JsonGenerator::enterSection(const char* name, Configurable* value) {
        _encoder.begin_object(name);
        value->group(*this);
        _encoder.end_object();
    }
}
