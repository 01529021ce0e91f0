// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#include "Logging.h"

#include <atomic>
#include <iostream>
#include <mutex>

static std::atomic<int> msgLevel { MsgLevelInfo };

static std::mutex logMutex;
static LogSink    logSink;

bool atMsgLevel(MsgLevel level) {
    return msgLevel.load() >= level;
}

void setMsgLevel(MsgLevel level) {
    msgLevel = level;
}

MsgLevel getMsgLevel() {
    return MsgLevel(msgLevel.load());
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(logMutex);
    logSink = std::move(sink);
}

LogStream::LogStream(const char* prefix) {
    _line << prefix;
}

LogStream::~LogStream() {
    _line << ']';
    std::lock_guard<std::mutex> lock(logMutex);
    if (logSink) {
        logSink(_line.str());
    } else {
        std::cerr << _line.str() << std::endl;
    }
}
