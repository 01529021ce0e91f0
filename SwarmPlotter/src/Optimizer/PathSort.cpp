// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "PathSort.h"
#include "../Logging.h"

#include <limits>

using namespace Toolpath;

namespace Optimizer {
    static void closeSegment(std::vector<Command>& pending, std::vector<PathSegment>& out) {
        if (pending.empty()) {
            return;
        }
        std::optional<Point> start;
        for (const auto& cmd : pending) {
            if (std::holds_alternative<Move>(cmd)) {
                start = pointOf(cmd);
                break;
            }
        }
        if (!start) {
            start = pointOf(pending.front());
        }
        std::optional<Point> end = pointOf(pending.back());

        if (start && end) {
            out.push_back(PathSegment { std::move(pending), *start, *end });
        } else {
            log_debug("Discarding segment without coordinates");
        }
        pending.clear();
    }

    std::vector<ToolBlock> splitSegments(const std::vector<Command>& commands) {
        std::vector<ToolBlock> blocks;
        std::vector<Command>   pending;

        for (const auto& cmd : commands) {
            if (auto select = std::get_if<SelectTool>(&cmd)) {
                if (!blocks.empty()) {
                    closeSegment(pending, blocks.back().segments);
                } else if (!pending.empty()) {
                    blocks.emplace_back();
                    closeSegment(pending, blocks.back().segments);
                }
                blocks.push_back(ToolBlock { *select, {} });
            } else if (std::holds_alternative<Move>(cmd)) {
                if (blocks.empty()) {
                    blocks.emplace_back();
                }
                closeSegment(pending, blocks.back().segments);
                pending.push_back(cmd);
            } else {
                pending.push_back(cmd);
            }
        }
        if (!pending.empty()) {
            if (blocks.empty()) {
                blocks.emplace_back();
            }
            closeSegment(pending, blocks.back().segments);
        }
        return blocks;
    }

    std::vector<PathSegment> orderGreedy(std::vector<PathSegment> segments) {
        std::vector<PathSegment> ordered;
        if (segments.empty()) {
            return ordered;
        }
        ordered.reserve(segments.size());
        ordered.push_back(std::move(segments.front()));
        segments.erase(segments.begin());

        while (!segments.empty()) {
            const Point& last    = ordered.back().end;
            size_t       closest = 0;
            double       minimum = std::numeric_limits<double>::infinity();
            for (size_t i = 0; i < segments.size(); ++i) {
                double d = distanceBetween(last, segments[i].start);
                if (d < minimum) {
                    minimum = d;
                    closest = i;
                }
            }
            ordered.push_back(std::move(segments[closest]));
            segments.erase(segments.begin() + closest);
        }
        return ordered;
    }

    std::vector<Command> sortPaths(const std::vector<Command>& commands) {
        std::vector<Command> sorted;
        sorted.reserve(commands.size());
        for (auto& block : splitSegments(commands)) {
            if (block.marker) {
                sorted.push_back(*block.marker);
            }
            for (auto& segment : orderGreedy(std::move(block.segments))) {
                sorted.insert(sorted.end(), segment.commands.begin(), segment.commands.end());
            }
        }
        return sorted;
    }

    double travelDistance(const std::vector<Command>& commands) {
        double               total = 0;
        std::optional<Point> previousEnd;
        for (const auto& block : splitSegments(commands)) {
            for (const auto& segment : block.segments) {
                if (previousEnd) {
                    total += distanceBetween(*previousEnd, segment.start);
                }
                previousEnd = segment.end;
            }
        }
        return total;
    }
}
