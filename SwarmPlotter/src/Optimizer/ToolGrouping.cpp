// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "ToolGrouping.h"
#include "../Logging.h"

#include <map>

using namespace Toolpath;

namespace Optimizer {
    std::vector<Command> groupByTool(const std::vector<Command>& commands) {
        std::map<int32_t, std::vector<Command>> buckets;  // ordered by tool id
        std::optional<int32_t>                  currentTool;
        size_t                                  dropped = 0;

        for (const auto& cmd : commands) {
            if (auto select = std::get_if<SelectTool>(&cmd)) {
                currentTool = select->toolId;
            } else if (currentTool) {
                buckets[*currentTool].push_back(cmd);
            } else {
                ++dropped;
            }
        }
        if (dropped) {
            log_warn("Dropped " << dropped << " commands issued before the first tool selection");
        }

        std::vector<Command> grouped;
        grouped.reserve(commands.size());
        for (const auto& [toolId, bucket] : buckets) {
            grouped.push_back(SelectTool { toolId });
            grouped.insert(grouped.end(), bucket.begin(), bucket.end());
        }
        return grouped;
    }
}
