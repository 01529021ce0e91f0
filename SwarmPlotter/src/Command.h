// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Distance.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Toolpath {
    // Travel with the tool disengaged.
    struct Move {
        Distance x;
        Distance y;
    };

    // Motion with the tool engaged.
    struct Draw {
        Distance x;
        Distance y;
    };

    struct SelectTool {
        int32_t toolId;
    };

    using Command = std::variant<Move, Draw, SelectTool>;

    bool operator==(const Move& a, const Move& b);
    bool operator==(const Draw& a, const Draw& b);
    bool operator==(const SelectTool& a, const SelectTool& b);

    // Position on the bed in millimeters.
    struct Point {
        double x;
        double y;
    };

    double distanceBetween(const Point& a, const Point& b);

    // The target point of a Move or Draw, nothing for SelectTool.
    std::optional<Point> pointOf(const Command& command);

    std::string toString(const Command& command);

    // Visitor helper for std::visit over Command.
    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}
