#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "async_logger.hpp"
#include "log_level.hpp"

namespace shop {
namespace logging {

// Application log: "[timestamp] [LEVEL] message" lines written to a file
// asynchronously and, optionally, echoed to the console.
class AppLogger : public AsyncLogger {
  public:
    explicit AppLogger(const std::string& log_file_path);
    virtual ~AppLogger() = default;

    virtual void log(LogLevel level, const std::string& message);

    void setLogLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel getLogLevel() const noexcept;
    void enableConsoleOutput(bool enable) noexcept;

    [[nodiscard]] static std::string formatLogEntry(LogLevel level, const std::string& message);

  private:
    std::atomic<LogLevel> current_log_level_;
    std::atomic<bool> console_output_enabled_;
    std::mutex console_mutex_;

    static std::string getCurrentTimestamp();
};

}  // namespace logging
}  // namespace shop
