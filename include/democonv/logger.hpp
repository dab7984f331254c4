#pragma once
// Minimal logging utility.

#include <string>

namespace democonv {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static void log(LogLevel level, const std::string& message);
    static void set_min_level(LogLevel level);

private:
    static LogLevel min_level_;
};

// Accepts debug, info, warn, error (case-insensitive).
LogLevel parse_log_level(const std::string& value);

} // namespace democonv
