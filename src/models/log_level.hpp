#ifndef LOG_LEVEL_HPP
#define LOG_LEVEL_HPP

#include <string>

// Severity of a log entry, serialized as its numeric value (0-4)
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

namespace log_level {

// Canonical upper-case name ("DEBUG" ... "FATAL")
std::string toString(LogLevel level);

int toValue(LogLevel level);

// Throws std::invalid_argument outside 0-4
LogLevel fromValue(int value);

// Case-insensitive. Accepts the syslog aliases WARNING, NOTICE, CRITICAL,
// ALERT and EMERGENCY. Throws std::invalid_argument for unknown names.
LogLevel fromName(const std::string& name);

} // namespace log_level

#endif // LOG_LEVEL_HPP
