// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <string>

namespace Configuration {
    // Streaming JSON writer into a std::string. Commas and nesting are tracked
    // per level; indentation is two spaces.
    class JSONencoder {
    public:
        explicit JSONencoder(std::string* output);

        void begin();
        void end();

        void begin_object();
        void begin_object(const char* tag);
        void end_object();

        void member(const char* tag, int32_t value);
        void member(const char* tag, float value);
        void member(const char* tag, bool value);

    private:
        static const int MAX_JSON_LEVEL = 16;

        void comma_line();
        void quoted(const char* s);
        void tag(const char* name);
        void dec_level();
        void inc_level();
        void indent();

        std::string* _output;
        int          _level = 0;
        int          _count[MAX_JSON_LEVEL];
    };
}
