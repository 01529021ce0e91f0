// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Optimizer.h"
#include "../Logging.h"

using namespace Toolpath;

namespace Optimizer {
    std::vector<Command> optimize(const std::vector<Command>& commands) {
        auto merged  = mergeCollinear(commands);
        auto grouped = groupByTool(merged);
        auto sorted  = sortPaths(grouped);

        log_info("Optimized toolpath: " << commands.size() << " -> " << merged.size() << " after merge, " << sorted.size() << " after grouping");
        log_debug("Travel distance " << travelDistance(grouped) << "mm -> " << travelDistance(sorted) << "mm");
        return sorted;
    }
}
