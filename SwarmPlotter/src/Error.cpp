// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Error.h"

const std::map<Error, const char*> ErrorNames = {
    { Error::Ok, "No error" },
    { Error::EmergencyStop, "Emergency stop engaged" },
    { Error::ConfigurationError, "Invalid configuration value" },
    { Error::HardwareIOError, "Hardware link failure" },
    { Error::JobInProgress, "A job is already in progress" },
    { Error::NotTrapped, "Emergency stop is not engaged" },
    { Error::InvalidTool, "Tool number is not configured" },
    { Error::FsFailedOpenFile, "Failed to open file" },
    { Error::ToolpathParseError, "Malformed toolpath" },
};

const char* errorString(Error errorNumber) {
    auto it = ErrorNames.find(errorNumber);
    return it == ErrorNames.end() ? "Unknown error" : it->second;
}
