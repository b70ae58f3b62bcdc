#pragma once

#include <atomic>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "shop/utils/thread_safe_queue.hpp"

namespace shop::logging {

// Appends formatted lines to a file from a background thread.
// Lines queued before stop() are always written.
class AsyncLogger {
  public:
    explicit AsyncLogger(const std::string& log_file_path) : log_file_path_(log_file_path) {
    }

    virtual ~AsyncLogger() {
        stop();
    }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;
    AsyncLogger(AsyncLogger&&) = delete;
    AsyncLogger& operator=(AsyncLogger&&) = delete;

    // Throws std::runtime_error if the log file cannot be opened
    void start() {
        if (started_.exchange(true)) {
            return;
        }
        log_file_.open(log_file_path_, std::ios::app);
        if (!log_file_.is_open()) {
            started_ = false;
            throw std::runtime_error("Failed to open log file: " + log_file_path_);
        }
        worker_thread_ = std::thread(&AsyncLogger::run, this);
    }

    void stop() {
        log_queue_.close();
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    [[nodiscard]] const std::string& getLogFilePath() const noexcept {
        return log_file_path_;
    }

  protected:
    // Dropped silently before start() and after stop()
    void addLog(std::string message) {
        if (!started_) {
            return;
        }
        (void)log_queue_.push(std::move(message));
    }

  private:
    void run() {
        while (auto message = log_queue_.wait_and_pop()) {
            log_file_ << *message << '\n';
            log_file_.flush();
        }
    }

    std::string log_file_path_;
    std::ofstream log_file_;
    utils::ThreadSafeQueue<std::string> log_queue_;
    std::thread worker_thread_;
    std::atomic<bool> started_{false};
};

}  // namespace shop::logging
