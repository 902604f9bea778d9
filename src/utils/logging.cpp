#include "typehook/utils/logging.hpp"
#include <atomic>
#include <iostream>

namespace typehook {
namespace utils {

namespace {
std::atomic<int> currentLevel{static_cast<int>(LogLevel::Warn)};
} // namespace

void setLogLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(currentLevel.load());
}

bool shouldLog(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= currentLevel.load();
}

void writeLog(LogLevel level, const std::string& message) {
    std::clog << "[" << logLevelName(level) << "] " << message << std::endl;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "unknown";
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    static const LogLevel levels[] = {
        LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
        LogLevel::Error, LogLevel::Critical, LogLevel::Off
    };
    for (LogLevel level : levels) {
        if (name == logLevelName(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

} // namespace utils
} // namespace typehook
