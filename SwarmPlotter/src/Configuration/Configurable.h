// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "HandlerBase.h"

namespace Configuration {
    class Configurable {
    public:
        Configurable() = default;

        // Cross-item checks; throw Error::ConfigurationError.
        virtual void validate() {}
        virtual void group(HandlerBase& handler) = 0;

        virtual ~Configurable() = default;
    };
}
