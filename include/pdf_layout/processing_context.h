#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace pdf_layout {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 4
};

// Throws std::invalid_argument for an unknown name.
LogLevel parse_log_level(const std::string& name);
const char* to_string(LogLevel level);

// Writes "[component] message" lines to a stream. Safe to share between the
// worker threads of one pipeline run.
class Logger {
public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel level = LogLevel::INFO);

    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::NONE; }

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) {
        log(LogLevel::INFO, component, message);
    }
    void warn(const std::string& component, const std::string& message) {
        log(LogLevel::WARN, component, message);
    }
    void error(const std::string& component, const std::string& message) {
        log(LogLevel::ERROR, component, message);
    }

private:
    std::ostream& out_;
    LogLevel level_;
    std::mutex mutex_;
};

// Per-run state handed to every stage. One context per document run.
struct ProcessingContext {
    explicit ProcessingContext(Logger& logger) : logger(logger) {}

    Logger& logger;
};

} // namespace pdf_layout
