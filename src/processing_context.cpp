#include "pdf_layout/processing_context.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pdf_layout {

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;

    throw std::invalid_argument("Unknown log level: " + name);
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE: return "none";
    }
    return "unknown";
}

Logger::Logger(std::ostream& out, LogLevel level) : out_(out), level_(level) {}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << component << "] ";
    if (level >= LogLevel::WARN) {
        out_ << to_string(level) << ": ";
    }
    out_ << message << std::endl;
}

} // namespace pdf_layout
