#ifndef TYPEHOOK_UTILS_LOGGING_HPP
#define TYPEHOOK_UTILS_LOGGING_HPP

#include <string>

namespace typehook {
namespace utils {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Critical = 4,
    Off = 5
};

/**
 * @brief Set the process-wide threshold below which log messages are dropped.
 */
void setLogLevel(LogLevel level);
LogLevel logLevel();

bool shouldLog(LogLevel level);

/**
 * @brief Write a single line to std::clog, prefixed with the level tag.
 */
void writeLog(LogLevel level, const std::string& message);

const char* logLevelName(LogLevel level);

/**
 * @brief Parse "debug", "info", "warn", "error", "critical" or "off".
 * @return false if the name is not a known level (out is left untouched).
 */
bool parseLogLevel(const std::string& name, LogLevel& out);

} // namespace utils
} // namespace typehook

#define THLOG(level, message) \
    do { \
        if (::typehook::utils::shouldLog(level)) { \
            ::typehook::utils::writeLog(level, message); \
        } \
    } while (false)

#define THLOG_DEBUG(message)    THLOG(::typehook::utils::LogLevel::Debug, message)
#define THLOG_INFO(message)     THLOG(::typehook::utils::LogLevel::Info, message)
#define THLOG_WARN(message)     THLOG(::typehook::utils::LogLevel::Warn, message)
#define THLOG_ERROR(message)    THLOG(::typehook::utils::LogLevel::Error, message)
#define THLOG_CRITICAL(message) THLOG(::typehook::utils::LogLevel::Critical, message)

#endif // TYPEHOOK_UTILS_LOGGING_HPP
