#pragma once

#include "core/time_utils.hpp"

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace tickback::audit {

enum class LogLevel { INFO = 0, WARN = 1, ERR = 2, AUDIT = 3 };

/**
 * @class Logger
 * @brief Thread-safe run logger.
 * Lines are queued and written by a single background thread so that the
 * backtest loop never blocks on console or disk I/O.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) return;

        LogEntry entry;
        entry.level = level;
        entry.timestamp_ns = tickback::core::unix_now_ns();
        entry.message = message;

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.size() >= queue_capacity_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            queue_.push_back(std::move(entry));
        }
        cv_.notify_one();
    }

    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }

    // Blocks until every queued line has been written.
    void flush() {
        std::unique_lock<std::mutex> lock(mtx_);
        drained_cv_.wait(lock, [&] { return queue_.empty() && !writing_; });
        if (file_.is_open()) file_.flush();
        std::cout.flush();
    }

    // Appends to `path` in addition to the console. An empty path closes the file.
    bool set_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void set_min_level(LogLevel level) {
        min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    void set_queue_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_capacity_ = capacity;
    }

    uint64_t dropped_count() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct LogEntry {
        LogLevel level;
        uint64_t timestamp_ns;
        std::string message;
    };

    Logger() {
        worker_ = std::thread(&Logger::worker_loop, this);
    }

    ~Logger() {
        {
            // Under the lock so the worker cannot miss the wakeup between its check and its wait.
            std::lock_guard<std::mutex> lock(mtx_);
            running_.store(false, std::memory_order_relaxed);
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        if (file_.is_open()) file_.close();
    }

    static const char* prefix(LogLevel level) {
        switch (level) {
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::WARN: return "[WARN] ";
            case LogLevel::ERR: return "[ERROR] ";
            case LogLevel::AUDIT: return "[AUDIT] ";
        }
        return "[LOG] ";
    }

    void worker_loop() {
        for (;;) {
            LogEntry entry;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&] {
                    return !running_.load(std::memory_order_relaxed) || !queue_.empty();
                });
                if (!running_.load(std::memory_order_relaxed) && queue_.empty()) {
                    break;
                }
                entry = std::move(queue_.front());
                queue_.pop_front();
                writing_ = true;
            }

            char ts_buf[64];
            tickback::core::format_utc(entry.timestamp_ns, ts_buf, sizeof(ts_buf));
            std::string line = std::string(ts_buf) + " " + prefix(entry.level) + entry.message;

            std::ostream& console = (entry.level == LogLevel::WARN || entry.level == LogLevel::ERR)
                ? std::cerr : std::cout;
            console << line << '\n';

            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (file_.is_open()) {
                    file_ << line << "\n";
                }
                writing_ = false;
                if (queue_.empty()) drained_cv_.notify_all();
            }
        }
        std::lock_guard<std::mutex> lock(mtx_);
        drained_cv_.notify_all();
    }

    std::ofstream file_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<LogEntry> queue_;
    size_t queue_capacity_ = 4096;
    bool writing_ = false;
    std::atomic<int> min_level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace tickback::audit
