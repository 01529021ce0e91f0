// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "CollinearMerge.h"

#include <cmath>

using namespace Toolpath;

namespace Optimizer {
    bool isCollinear(const Point& p1, const Point& p2, const Point& p3) {
        double area = (p2.y - p1.y) * (p3.x - p2.x) - (p2.x - p1.x) * (p3.y - p2.y);
        return std::fabs(area) < COLLINEAR_TOLERANCE;
    }

    std::vector<Command> mergeCollinear(const std::vector<Command>& commands) {
        std::vector<Command> merged;
        if (commands.empty()) {
            return merged;
        }
        merged.push_back(commands.front());

        // Position of the last travel; draws do not move it.
        Point current = { 0, 0 };
        if (std::holds_alternative<Move>(commands.front())) {
            current = *pointOf(commands.front());
        }

        Point runStart = current;
        bool  drawing  = false;

        for (size_t i = 1; i < commands.size(); ++i) {
            const Command& cmd  = commands[i];
            const Draw*    draw = std::get_if<Draw>(&cmd);

            if (!draw) {
                drawing = false;
                merged.push_back(cmd);
                if (std::holds_alternative<Move>(cmd)) {
                    current = *pointOf(cmd);
                }
                runStart = current;
                continue;
            }

            if (!drawing) {
                runStart = current;
                drawing  = true;
            }

            const Draw* last = std::get_if<Draw>(&merged.back());
            if (!last) {
                // First draw after a travel or tool change stays as is.
                merged.push_back(cmd);
                continue;
            }

            Point lastEnd = *pointOf(merged.back());
            if (isCollinear(runStart, lastEnd, *pointOf(cmd))) {
                merged.back() = *draw;
            } else {
                merged.push_back(cmd);
                runStart = lastEnd;
            }
        }
        return merged;
    }
}
