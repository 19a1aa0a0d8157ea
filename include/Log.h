#pragma once

#include <string>

namespace ams {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4,
};

// Process-wide threshold. Initialized from AMS_LOG_LEVEL on first use
// (debug|info|warn|error|off), default warn.
LogLevel logLevel();
void setLogLevel(LogLevel level);

// Accepts the names above, case-insensitive. Returns false on anything else.
bool parseLogLevel(const std::string& name, LogLevel& out);
const char* logLevelName(LogLevel level);

// Writes "[ams][LEVEL] message" to stderr if level passes the threshold.
// One line at a time across threads.
void logLine(LogLevel level, const std::string& message);

inline bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(logLevel());
}

} // namespace ams
