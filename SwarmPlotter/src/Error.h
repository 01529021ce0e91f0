// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <map>

// Error codes are returned from job-level calls and thrown from the
// hardware and configuration layers. Catch them by const reference.
enum class Error : uint8_t {
    Ok                 = 0,
    EmergencyStop      = 1,
    ConfigurationError = 2,
    HardwareIOError    = 3,
    JobInProgress      = 4,
    NotTrapped         = 5,
    InvalidTool        = 6,
    FsFailedOpenFile   = 10,
    ToolpathParseError = 11,
};

const char* errorString(Error errorNumber);

extern const std::map<Error, const char*> ErrorNames;
