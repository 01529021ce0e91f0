// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include "Command.h"

#include <istream>
#include <string>
#include <vector>

namespace Toolpath {
    /**
     * @brief Reads the G-code subset the slicer emits.
     *
     *   G0 X.. Y..     Move
     *   G1 X.. Y..     Draw
     *   T<n>, M6 T<n>  SelectTool
     *
     * Coordinates are millimeters, rounded to whole millimeters. A missing X or Y
     * keeps the previous value. Comments in () or after ; are ignored, as are F
     * words. Anything else is a ToolpathParseError reported with its line number.
     */
    class Reader {
    public:
        Reader() = default;

        // Parses one line and appends its commands. lineNumber is for messages only.
        void parseLine(const std::string& line, int lineNumber, std::vector<Command>& out);

        std::vector<Command> read(std::istream& input);
        std::vector<Command> readFile(const std::string& path);

    private:
        int32_t _x = 0;
        int32_t _y = 0;
    };

    // Strips comments and whitespace and folds to upper case.
    std::string cleanLine(const std::string& line);
}
