#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace shop::logging {

enum class LogLevel : std::uint8_t { DEBUG, INFO, WARNING, ERROR };

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR
inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "DEBUG")
        return LogLevel::DEBUG;
    if (name == "INFO")
        return LogLevel::INFO;
    if (name == "WARN" || name == "WARNING")
        return LogLevel::WARNING;
    if (name == "ERROR")
        return LogLevel::ERROR;
    return std::nullopt;
}

}  // namespace shop::logging
