// File: src/core/logging.hpp
#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace profitlift {

/// Log severity, ordered from most to least verbose
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4,
};

const char* ToString(LogLevel level);

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive)
/// @throws std::invalid_argument for unknown names
LogLevel ParseLogLevel(const std::string& name);

/// Logger: Component-prefixed line logging to an output stream
///
/// Lines are written as "[LEVEL] [Component] message". A single mutex keeps
/// lines from concurrent mining workers intact.
///
/// Thread-safety: All public methods are thread-safe.
class Logger {
public:
    /// Process-wide logger used by the pipeline components
    static Logger& Instance();

    /// Redirect output (nullptr disables logging entirely)
    void SetStream(std::ostream* stream);

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;

    bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, const std::string& component, const std::string& message);

    void Debug(const std::string& component, const std::string& message) {
        Log(LogLevel::DEBUG, component, message);
    }
    void Info(const std::string& component, const std::string& message) {
        Log(LogLevel::INFO, component, message);
    }
    void Warn(const std::string& component, const std::string& message) {
        Log(LogLevel::WARN, component, message);
    }
    void Error(const std::string& component, const std::string& message) {
        Log(LogLevel::ERROR, component, message);
    }

private:
    Logger() = default;

    mutable std::mutex mutex_;
    std::ostream* stream_{&std::cerr};
    LogLevel level_{LogLevel::INFO};
};

} // namespace profitlift
