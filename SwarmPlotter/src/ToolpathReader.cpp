// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "ToolpathReader.h"
#include "Error.h"
#include "Logging.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace Toolpath {
    std::string cleanLine(const std::string& line) {
        std::string cleaned;
        bool        inComment = false;
        for (char c : line) {
            if (inComment) {
                if (c == ')') {
                    inComment = false;
                }
                continue;
            }
            if (c == '(') {
                inComment = true;
            } else if (c == ';') {
                break;
            } else if (!std::isspace(static_cast<unsigned char>(c))) {
                cleaned += char(std::toupper(static_cast<unsigned char>(c)));
            }
        }
        return cleaned;
    }

    struct Word {
        char   letter;
        double value;
    };

    // Length of the decimal number at p: optional sign, digits, optional fraction.
    static size_t numberLength(const char* p) {
        size_t n = 0;
        if (p[n] == '-' || p[n] == '+') {
            ++n;
        }
        size_t digits = 0;
        while (std::isdigit(static_cast<unsigned char>(p[n]))) {
            ++n;
            ++digits;
        }
        if (p[n] == '.') {
            ++n;
            while (std::isdigit(static_cast<unsigned char>(p[n]))) {
                ++n;
                ++digits;
            }
        }
        return digits ? n : 0;
    }

    static std::vector<Word> splitWords(const std::string& line, int lineNumber) {
        std::vector<Word> words;
        const char*       p = line.c_str();
        while (*p) {
            char letter = *p++;
            if (!std::isalpha(static_cast<unsigned char>(letter))) {
                log_error("Toolpath line " << lineNumber << ": unexpected '" << letter << "'");
                throw Error::ToolpathParseError;
            }
            size_t length = numberLength(p);
            if (!length) {
                log_error("Toolpath line " << lineNumber << ": " << letter << " has no value");
                throw Error::ToolpathParseError;
            }
            words.push_back({ letter, strtod(std::string(p, length).c_str(), nullptr) });
            p += length;
        }
        return words;
    }

    // Millimeters, rounded to the nearest whole one.
    static int32_t coordinate(const Word& word, int lineNumber) {
        double rounded = std::round(word.value);
        if (!(rounded >= INT32_MIN && rounded <= INT32_MAX)) {
            log_error("Toolpath line " << lineNumber << ": " << word.letter << " out of range");
            throw Error::ToolpathParseError;
        }
        return int32_t(rounded);
    }

    void Reader::parseLine(const std::string& line, int lineNumber, std::vector<Command>& out) {
        std::string cleaned = cleanLine(line);
        if (cleaned.empty()) {
            return;
        }

        std::optional<int> motion;
        std::optional<int> tool;
        int32_t            x = _x;
        int32_t            y = _y;

        for (const Word& word : splitWords(cleaned, lineNumber)) {
            switch (word.letter) {
                case 'G':
                    if (word.value != 0 && word.value != 1) {
                        log_error("Toolpath line " << lineNumber << ": unsupported G" << word.value);
                        throw Error::ToolpathParseError;
                    }
                    motion = int(word.value);
                    break;
                case 'M':
                    // M6 only announces the tool change carried by the T word.
                    if (word.value != 6) {
                        log_error("Toolpath line " << lineNumber << ": unsupported M" << word.value);
                        throw Error::ToolpathParseError;
                    }
                    break;
                case 'T':
                    if (word.value < 0 || word.value > INT32_MAX || word.value != std::floor(word.value)) {
                        log_error("Toolpath line " << lineNumber << ": bad tool number " << word.value);
                        throw Error::ToolpathParseError;
                    }
                    tool = int(word.value);
                    break;
                case 'X':
                    x = coordinate(word, lineNumber);
                    break;
                case 'Y':
                    y = coordinate(word, lineNumber);
                    break;
                case 'F':
                    break;
                default:
                    log_error("Toolpath line " << lineNumber << ": unknown word " << word.letter);
                    throw Error::ToolpathParseError;
            }
        }

        if (tool) {
            out.push_back(SelectTool { *tool });
        }
        if (motion) {
            Distance dx = Distance::fromMillimeters(x);
            Distance dy = Distance::fromMillimeters(y);
            if (*motion == 0) {
                out.push_back(Move { dx, dy });
            } else {
                out.push_back(Draw { dx, dy });
            }
            _x = x;
            _y = y;
        } else if (x != _x || y != _y) {
            log_error("Toolpath line " << lineNumber << ": coordinates without G0 or G1");
            throw Error::ToolpathParseError;
        }
    }

    std::vector<Command> Reader::read(std::istream& input) {
        std::vector<Command> commands;
        std::string          line;
        int                  lineNumber = 0;
        while (std::getline(input, line)) {
            parseLine(line, ++lineNumber, commands);
        }
        log_info("Read " << commands.size() << " commands from " << lineNumber << " lines");
        return commands;
    }

    std::vector<Command> Reader::readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            log_error("Failed to open toolpath " << path);
            throw Error::FsFailedOpenFile;
        }
        return read(file);
    }
}
