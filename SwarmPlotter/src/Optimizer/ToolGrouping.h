// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "../Command.h"

#include <vector>

namespace Optimizer {
    // Regroups the toolpath so every tool is selected exactly once, in ascending
    // tool order, followed by all of its work. Commands issued before the first
    // SelectTool have no tool and are dropped.
    std::vector<Toolpath::Command> groupByTool(const std::vector<Toolpath::Command>& commands);
}
