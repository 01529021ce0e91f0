// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "JsonParser.h"
#include "../Error.h"
#include "../Logging.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace Configuration {
    static size_t skipSpace(const std::string& json, size_t pos) {
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
            ++pos;
        }
        return pos;
    }

    // Index of the closing quote of the string starting at openPos.
    static size_t endOfString(const std::string& json, size_t openPos) {
        for (size_t i = openPos + 1; i < json.size(); ++i) {
            if (json[i] == '\\') {
                ++i;
            } else if (json[i] == '"') {
                return i;
            }
        }
        return std::string::npos;
    }

    size_t JsonParser::findMatchingBrace(const std::string& json, size_t openPos) {
        int depth = 0;
        for (size_t i = openPos; i < json.size(); ++i) {
            char c = json[i];
            if (c == '"') {
                i = endOfString(json, i);
                if (i == std::string::npos) {
                    return std::string::npos;
                }
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return i;
                }
            }
        }
        return std::string::npos;
    }

    size_t JsonParser::findValue(const char* name) const {
        int    depth  = 0;
        size_t keyLen = strlen(name);
        for (size_t i = 0; i < _json.size(); ++i) {
            char c = _json[i];
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == '"') {
                size_t close = endOfString(_json, i);
                if (close == std::string::npos) {
                    return std::string::npos;
                }
                if (depth == 1 && close - i - 1 == keyLen && _json.compare(i + 1, keyLen, name) == 0) {
                    size_t colon = skipSpace(_json, close + 1);
                    if (colon < _json.size() && _json[colon] == ':') {
                        return skipSpace(_json, colon + 1);
                    }
                }
                i = close;
            }
        }
        return std::string::npos;
    }

    bool JsonParser::parseNumber(const char* name, double& value) const {
        size_t pos = findValue(name);
        if (pos == std::string::npos) {
            return false;
        }
        std::string text = _json.substr(pos);
        // Quoted numbers are accepted as well.
        if (!text.empty() && text[0] == '"') {
            text = text.substr(1, text.find('"', 1) - 1);
        }
        const char* begin = text.c_str();
        char*       end   = nullptr;
        value             = strtod(begin, &end);
        if (end == begin) {
            log_error("Configuration item " << name << " is not a number");
            throw Error::ConfigurationError;
        }
        return true;
    }

    void JsonParser::item(const char* name, float& value, float minValue, float maxValue) {
        double parsed;
        if (parseNumber(name, parsed)) {
            value = float(parsed);
            log_verbose("Config " << name << " = " << value);
        }
    }

    void JsonParser::item(const char* name, int32_t& value, int32_t minValue, int32_t maxValue) {
        double parsed;
        if (parseNumber(name, parsed)) {
            if (parsed != std::floor(parsed)) {
                log_error("Configuration item " << name << " must be a whole number, got " << parsed);
                throw Error::ConfigurationError;
            }
            if (!(parsed >= minValue && parsed <= maxValue)) {
                log_error("Configuration item " << name << " = " << parsed << " is outside [" << minValue << ", " << maxValue << "]");
                throw Error::ConfigurationError;
            }
            value = int32_t(parsed);
            log_verbose("Config " << name << " = " << value);
        }
    }

    void JsonParser::item(const char* name, bool& value) {
        size_t pos = findValue(name);
        if (pos == std::string::npos) {
            return;
        }
        if (_json.compare(pos, 4, "true") == 0) {
            value = true;
        } else if (_json.compare(pos, 5, "false") == 0) {
            value = false;
        } else {
            log_error("Configuration item " << name << " must be true or false");
            throw Error::ConfigurationError;
        }
    }

    void JsonParser::enterSection(const char* name, Configurable* value) {
        size_t pos = findValue(name);
        if (pos == std::string::npos) {
            log_debug("Section " << name << " not present, keeping defaults");
            return;
        }
        if (_json[pos] != '{') {
            log_error("Configuration section " << name << " must be an object");
            throw Error::ConfigurationError;
        }
        size_t end = findMatchingBrace(_json, pos);
        if (end == std::string::npos) {
            log_error("Unterminated configuration section " << name);
            throw Error::ConfigurationError;
        }
        JsonParser section(_json.substr(pos, end - pos + 1));
        value->group(section);
    }
}
