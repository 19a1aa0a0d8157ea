#include "Log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace ams {

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

std::mutex& logMutex() {
    static std::mutex mu;
    return mu;
}

LogLevel initialLevel() {
    LogLevel level = LogLevel::Warn;
    if (const char* env = std::getenv("AMS_LOG_LEVEL")) {
        if (!parseLogLevel(env, level)) {
            level = LogLevel::Warn;
        }
    }
    return level;
}

std::atomic<int>& levelStorage() {
    static std::atomic<int> level{static_cast<int>(initialLevel())};
    return level;
}
} // namespace

LogLevel logLevel() {
    return static_cast<LogLevel>(levelStorage().load());
}

void setLogLevel(LogLevel level) {
    levelStorage().store(static_cast<int>(level));
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    const std::string v = toLower(name);
    if (v == "debug") {
        out = LogLevel::Debug;
    } else if (v == "info") {
        out = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        out = LogLevel::Warn;
    } else if (v == "error") {
        out = LogLevel::Error;
    } else if (v == "off" || v == "none") {
        out = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
    }
    return "?";
}

void logLine(LogLevel level, const std::string& message) {
    if (!logEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(logMutex());
    std::cerr << "[ams][" << logLevelName(level) << "] " << message << "\n";
}

} // namespace ams
