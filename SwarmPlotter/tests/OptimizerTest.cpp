// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "FakeHardware.h"
#include "Optimizer/Optimizer.h"

#include <gtest/gtest.h>

using namespace Toolpath;

TEST(Optimizer, PipelineMergesGroupsAndSorts) {
    std::vector<Command> in = {
        SelectTool { 1 }, Move { mm(100), mm(0) }, Draw { mm(101), mm(0) }, Draw { mm(102), mm(0) },
        SelectTool { 0 }, Move { mm(0), mm(0) }, Draw { mm(0), mm(5) },
        SelectTool { 1 }, Move { mm(0), mm(0) }, Draw { mm(3), mm(0) },
    };
    std::vector<Command> out = {
        SelectTool { 0 }, Move { mm(0), mm(0) }, Draw { mm(0), mm(5) },
        SelectTool { 1 }, Move { mm(100), mm(0) }, Draw { mm(102), mm(0) }, Move { mm(0), mm(0) }, Draw { mm(3), mm(0) },
    };
    EXPECT_EQ(Optimizer::optimize(in), out);
}

TEST(Optimizer, KeepsOneMarkerPerTool) {
    std::vector<Command> in = {
        SelectTool { 2 }, Move { mm(0), mm(0) }, Draw { mm(1), mm(1) },
        SelectTool { 0 }, Move { mm(4), mm(4) }, Draw { mm(1), mm(1) },
        SelectTool { 2 }, Move { mm(7), mm(7) }, Draw { mm(9), mm(1) },
    };
    int markers = 0;
    for (const auto& cmd : Optimizer::optimize(in)) {
        markers += std::holds_alternative<SelectTool>(cmd);
    }
    EXPECT_EQ(markers, 2);
}

TEST(Optimizer, EmptyToolpath) {
    EXPECT_TRUE(Optimizer::optimize({}).empty());
}
