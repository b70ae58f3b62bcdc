#include "shop/logging/app_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace shop {
namespace logging {

AppLogger::AppLogger(const std::string& log_file_path)
    : AsyncLogger(log_file_path),
      current_log_level_(LogLevel::INFO),
      console_output_enabled_(true) {
}

void AppLogger::log(LogLevel level, const std::string& message) {
    if (level < current_log_level_.load()) {
        return;
    }

    std::string formatted_message = formatLogEntry(level, message);

    if (console_output_enabled_) {
        std::lock_guard<std::mutex> lock(console_mutex_);
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted_message << std::endl;
        } else {
            std::cout << formatted_message << std::endl;
        }
    }

    addLog(std::move(formatted_message));
}

void AppLogger::setLogLevel(LogLevel level) noexcept {
    current_log_level_ = level;
}

LogLevel AppLogger::getLogLevel() const noexcept {
    return current_log_level_;
}

void AppLogger::enableConsoleOutput(bool enable) noexcept {
    console_output_enabled_ = enable;
}

std::string AppLogger::formatLogEntry(LogLevel level, const std::string& message) {
    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] ";

    switch (level) {
        case LogLevel::DEBUG:
            oss << "[DEBUG] ";
            break;
        case LogLevel::INFO:
            oss << "[INFO]  ";
            break;
        case LogLevel::WARNING:
            oss << "[WARN]  ";
            break;
        case LogLevel::ERROR:
            oss << "[ERROR] ";
            break;
    }

    oss << message;
    return oss.str();
}

std::string AppLogger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace logging
}  // namespace shop
