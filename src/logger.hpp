#pragma once

#include <string>
#include <chrono>
#include <iostream>
#include <sstream>
#include <mutex>
#include <atomic>

namespace s3xfer {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Process-wide logger. Lines go to stderr as "timestamp [LEVEL] component: message";
// anything below level() is dropped.
class Logger {
public:
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::DEBUG, component, message);
    }

    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::INFO, component, message);
    }

    static void warn(const std::string& component, const std::string& message) {
        log(LogLevel::WARN, component, message);
    }

    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::ERROR, component, message);
    }

    // Messages below this level are dropped
    static void set_level(LogLevel level) { min_level_ = level; }
    static LogLevel level() { return min_level_; }

    static const char* level_to_string(LogLevel level);

private:
    static std::string get_timestamp();

    static std::atomic<LogLevel> min_level_;
};

}  // namespace s3xfer
