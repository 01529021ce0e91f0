// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "../Command.h"

#include <vector>

namespace Optimizer {
    // True when p3 continues the line through p1 and p2 (signed area within tolerance).
    bool isCollinear(const Toolpath::Point& p1, const Toolpath::Point& p2, const Toolpath::Point& p3);

    // Collapses runs of collinear Draw commands into a single Draw ending at the
    // furthest point. Never reorders and never grows the sequence.
    std::vector<Toolpath::Command> mergeCollinear(const std::vector<Toolpath::Command>& commands);
}
