// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "../Command.h"

#include <optional>
#include <vector>

namespace Optimizer {
    /**
     * @brief A continuous piece of toolpath: one Move followed by its Draw run.
     * start is the first Move (or the first Draw when the piece has no Move),
     * end is the last command.
     */
    struct PathSegment {
        std::vector<Toolpath::Command> commands;
        Toolpath::Point                start;
        Toolpath::Point                end;
    };

    /**
     * @brief Segments drawn by one tool, headed by that tool's SelectTool.
     * Work before the first SelectTool lands in a block without a marker.
     */
    struct ToolBlock {
        std::optional<Toolpath::SelectTool> marker;
        std::vector<PathSegment>            segments;
    };

    /**
     * @brief Split a toolpath into tool blocks and segments.
     * A segment ends at every Move and SelectTool. Segments without a point are discarded.
     */
    std::vector<ToolBlock> splitSegments(const std::vector<Toolpath::Command>& commands);

    /**
     * @brief Nearest-neighbour ordering, starting at the first segment.
     * Each step takes the unvisited segment whose start is closest to the current end;
     * ties go to the earliest segment.
     */
    std::vector<PathSegment> orderGreedy(std::vector<PathSegment> segments);

    /**
     * @brief Reorder the segments of each tool block to shorten the travel between them.
     * SelectTool markers and the block order are preserved.
     */
    std::vector<Toolpath::Command> sortPaths(const std::vector<Toolpath::Command>& commands);

    /**
     * @brief Sum of the gaps between consecutive segments (end of one to start of the next).
     */
    double travelDistance(const std::vector<Toolpath::Command>& commands);
}
