// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Command.h"

#include <cmath>

namespace Toolpath {
    bool operator==(const Move& a, const Move& b) {
        return a.x == b.x && a.y == b.y;
    }

    bool operator==(const Draw& a, const Draw& b) {
        return a.x == b.x && a.y == b.y;
    }

    bool operator==(const SelectTool& a, const SelectTool& b) {
        return a.toolId == b.toolId;
    }

    double distanceBetween(const Point& a, const Point& b) {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

    std::optional<Point> pointOf(const Command& command) {
        return std::visit(overloaded {
                              [](const Move& m) -> std::optional<Point> { return Point { double(m.x.mm()), double(m.y.mm()) }; },
                              [](const Draw& d) -> std::optional<Point> { return Point { double(d.x.mm()), double(d.y.mm()) }; },
                              [](const SelectTool&) -> std::optional<Point> { return std::nullopt; },
                          },
                          command);
    }

    std::string toString(const Command& command) {
        return std::visit(overloaded {
                              [](const Move& m) { return "Move(" + std::to_string(m.x.mm()) + "," + std::to_string(m.y.mm()) + ")"; },
                              [](const Draw& d) { return "Draw(" + std::to_string(d.x.mm()) + "," + std::to_string(d.y.mm()) + ")"; },
                              [](const SelectTool& t) { return "SelectTool(" + std::to_string(t.toolId) + ")"; },
                          },
                          command);
    }
}
