// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "JSONEncoder.h"

#include <iomanip>
#include <sstream>

namespace Configuration {
    JSONencoder::JSONencoder(std::string* output) : _output(output) {
        _count[0] = 0;
    }

    void JSONencoder::inc_level() {
        if (_level < MAX_JSON_LEVEL - 1) {
            ++_level;
        }
        _count[_level] = 0;
    }

    void JSONencoder::dec_level() {
        if (_level > 0) {
            --_level;
        }
    }

    void JSONencoder::indent() {
        for (int i = 0; i < _level; ++i) {
            *_output += "  ";
        }
    }

    void JSONencoder::comma_line() {
        if (_count[_level]) {
            *_output += ',';
        }
        *_output += '\n';
        indent();
        ++_count[_level];
    }

    void JSONencoder::quoted(const char* s) {
        *_output += '"';
        for (const char* p = s; *p; ++p) {
            char c = *p;
            switch (c) {
                case '"':
                    *_output += "\\\"";
                    break;
                case '\\':
                    *_output += "\\\\";
                    break;
                case '\n':
                    *_output += "\\n";
                    break;
                default:
                    *_output += c;
                    break;
            }
        }
        *_output += '"';
    }

    void JSONencoder::tag(const char* name) {
        quoted(name);
        *_output += ": ";
    }

    void JSONencoder::begin() {
        begin_object();
    }

    void JSONencoder::end() {
        end_object();
        *_output += '\n';
    }

    void JSONencoder::begin_object() {
        if (_level || _count[0]) {
            comma_line();
        }
        *_output += '{';
        inc_level();
    }

    void JSONencoder::begin_object(const char* name) {
        comma_line();
        tag(name);
        *_output += '{';
        inc_level();
    }

    void JSONencoder::end_object() {
        dec_level();
        *_output += '\n';
        indent();
        *_output += '}';
    }

    void JSONencoder::member(const char* name, int32_t value) {
        comma_line();
        tag(name);
        *_output += std::to_string(value);
    }

    void JSONencoder::member(const char* name, float value) {
        std::ostringstream ss;
        ss << std::setprecision(7) << value;
        comma_line();
        tag(name);
        *_output += ss.str();
    }

    void JSONencoder::member(const char* name, bool value) {
        comma_line();
        tag(name);
        *_output += value ? "true" : "false";
    }
}
