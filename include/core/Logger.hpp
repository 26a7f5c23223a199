#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Note: Never call from the per-frame streaming path, I/O can block.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message) {
        if (level < minLevel_.load(std::memory_order_relaxed)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time, &local);

        std::cout << "[" << std::put_time(&local, "%H:%M:%S")
                  << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: std::cout << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  std::cout << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  std::cout << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: std::cout << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        std::cout << message << std::endl;
    }

    static void setLevel(LogLevel level) { minLevel_.store(level, std::memory_order_relaxed); }
    static LogLevel level() { return minLevel_.load(std::memory_order_relaxed); }

    /**
     * Parse "debug", "info", "warn" or "error" (case-insensitive).
     * Throws std::invalid_argument for anything else.
     */
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

    // Helper for formatted logging
    template<typename... Args>
    static void debug(Args... args) {
        if (LogLevel::DEBUG < level()) return;
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::WARN, ss.str());
    }

    template<typename... Args>
    static void error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::ERROR, ss.str());
    }

private:
    static std::mutex mutex_;
    static std::atomic<LogLevel> minLevel_;
};

} // namespace core
