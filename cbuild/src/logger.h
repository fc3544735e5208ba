#pragma once

#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <functional>

/**
 * Thread-safe logging utilities for the profile export engine.
 * Provides different log levels and automatic timestamping.
 */
namespace profile_export {

/**
 * Log levels in increasing order of severity.
 */
enum class LogLevel {
    DEBUG,    // Detailed debugging information
    INFO,     // General informational messages
    WARNING,  // Warning messages (non-critical issues)
    ERROR     // Error messages (critical issues)
};

/**
 * Receives every message that passes the level filter.
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * Thread-safe logger with configurable log level.
 *
 * Fetch workers, the writer thread and the coordinator all log through
 * the same instance, so every line is emitted under one mutex.
 */
class Logger {
public:
    /**
     * Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * Set the minimum log level. Messages below this level are ignored.
     */
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    /**
     * Install an additional sink. Pass an empty function to remove it.
     * The sink is called with the logger mutex held and must not log.
     */
    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * Log a message at the specified level.
     */
    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;  // Message below minimum level
        }

        if (sink_) {
            sink_(level, message);
        }

        // Get current timestamp
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm;
        localtime_r(&time_t_now, &tm);

        // Format: [YYYY-MM-DD HH:MM:SS] [LEVEL] message
        std::cerr << "[";
        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        std::cerr << "] [" << level_to_string(level) << "] ";
        std::cerr << message << "\n";
    }

    void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }

private:
    Logger() : min_level_(LogLevel::INFO) {}

    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR:   return "ERROR";
            default:                return "UNKNOWN";
        }
    }

    std::mutex mutex_;
    LogLevel min_level_;
    LogSink sink_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) profile_export::Logger::instance().debug(msg)
#define LOG_INFO(msg) profile_export::Logger::instance().info(msg)
#define LOG_WARNING(msg) profile_export::Logger::instance().warning(msg)
#define LOG_ERROR(msg) profile_export::Logger::instance().error(msg)

} // namespace profile_export
