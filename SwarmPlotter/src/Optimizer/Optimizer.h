// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "../Command.h"
#include "CollinearMerge.h"
#include "ToolGrouping.h"
#include "PathSort.h"

#include <vector>

namespace Optimizer {
    // Runs merge -> group -> reorder over a sliced toolpath.
    std::vector<Toolpath::Command> optimize(const std::vector<Toolpath::Command>& commands);
}
