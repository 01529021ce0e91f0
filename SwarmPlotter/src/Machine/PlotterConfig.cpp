// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "PlotterConfig.h"
#include "../Error.h"
#include "../Configuration/JsonParser.h"
#include "../Configuration/JsonGenerator.h"
#include "../Configuration/Validator.h"

#include <fstream>
#include <sstream>

namespace Machine {
    void PlotterConfig::group(Configuration::HandlerBase& handler) {
        handler.item("log_level", _logLevel, MsgLevelNone, MsgLevelVerbose);
        handler.item("tool_count", _toolCount, 1, MAX_TOOL_COUNT);
        handler.item("stop_switch_normally_open", _stopSwitchNormallyOpen);
        handler.section("axes", &_axes);
        handler.section("motion", &_motion);
        handler.section("tool_timing", &_toolTiming);
        handler.section("homing", &_homing);
    }

    void PlotterConfig::validateAll() {
        Configuration::Validator validator;
        group(validator);
        validate();
    }

    void PlotterConfig::load_json(const std::string& json) {
        if (json.find('{') == std::string::npos) {
            log_error("Configuration record is not a JSON object");
            throw Error::ConfigurationError;
        }
        // Parse into a copy so a bad record never leaves a half-applied config.
        PlotterConfig candidate(*this);
        Configuration::JsonParser parser(json.substr(json.find('{')));
        candidate.group(parser);
        candidate.validateAll();
        *this = candidate;
        log_debug("Configuration loaded, flow rate " << _motion._flowRate << ", planar speed " << _motion._planarSpeed);
    }

    void PlotterConfig::load_file(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            log_error("Failed to open config file " << path);
            throw Error::FsFailedOpenFile;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        log_info("Loading config from " << path);
        load_json(buffer.str());
    }

    std::string PlotterConfig::toJSON() {
        std::string                  output;
        Configuration::JSONencoder   j(&output);
        Configuration::JsonGenerator generator(j);

        j.begin();
        group(generator);
        j.end();
        return output;
    }

    void PlotterConfig::save_file(const std::string& path) {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            log_error("Failed to write config file " << path);
            throw Error::FsFailedOpenFile;
        }
        file << toJSON();
    }
}
