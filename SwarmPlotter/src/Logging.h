// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <functional>
#include <sstream>
#include <string>

enum MsgLevel {
    MsgLevelNone    = 0,
    MsgLevelError   = 1,
    MsgLevelWarning = 2,
    MsgLevelInfo    = 3,
    MsgLevelDebug   = 4,
    MsgLevelVerbose = 5,
};

bool     atMsgLevel(MsgLevel level);
void     setMsgLevel(MsgLevel level);
MsgLevel getMsgLevel();

// Replaces the destination of finished log lines. An empty function restores stderr.
using LogSink = std::function<void(const std::string& line)>;
void setLogSink(LogSink sink);

// Collects one message and emits it as a single line when destroyed, so lines
// from the controller threads never interleave.
class LogStream {
public:
    explicit LogStream(const char* prefix);
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        _line << value;
        return *this;
    }

    ~LogStream();

private:
    std::ostringstream _line;
};

#define log_msg(level, prefix, x)                                                                                                          \
    if (atMsgLevel(level)) {                                                                                                               \
        LogStream ss(prefix);                                                                                                              \
        ss << x;                                                                                                                           \
    }

#define log_error(x) log_msg(MsgLevelError, "[MSG:ERR: ", x)
#define log_warn(x) log_msg(MsgLevelWarning, "[MSG:WARN: ", x)
#define log_info(x) log_msg(MsgLevelInfo, "[MSG:INFO: ", x)
#define log_debug(x) log_msg(MsgLevelDebug, "[MSG:DBG: ", x)
#define log_verbose(x) log_msg(MsgLevelVerbose, "[MSG:VRB: ", x)
