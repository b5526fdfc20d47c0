#include "log_level.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace log_level {

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

int toValue(LogLevel level) {
    return static_cast<int>(level);
}

LogLevel fromValue(int value) {
    if (value < 0 || value > 4) {
        throw std::invalid_argument("Invalid log level value: " + std::to_string(value) +
                                    ". Valid values are 0-4.");
    }
    return static_cast<LogLevel>(value);
}

LogLevel fromName(const std::string& name) {
    static const std::map<std::string, LogLevel> names = {
        {"DEBUG", LogLevel::DEBUG},
        {"INFO", LogLevel::INFO},
        {"NOTICE", LogLevel::INFO},
        {"WARN", LogLevel::WARN},
        {"WARNING", LogLevel::WARN},
        {"ERROR", LogLevel::ERROR},
        {"CRITICAL", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL},
        {"ALERT", LogLevel::FATAL},
        {"EMERGENCY", LogLevel::FATAL},
    };

    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = names.find(upper);
    if (it == names.end()) {
        throw std::invalid_argument("Invalid log level name: " + name);
    }
    return it->second;
}

} // namespace log_level
