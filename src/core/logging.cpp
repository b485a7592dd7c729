// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace profitlift {

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel ParseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown LogLevel: " + name);
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ != nullptr && level != LogLevel::OFF && level >= level_;
}

void Logger::Log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_ || level == LogLevel::OFF || level < level_) {
        return;
    }
    *stream_ << "[" << ToString(level) << "] [" << component << "] " << message << std::endl;
}

} // namespace profitlift
