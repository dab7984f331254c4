#include "democonv/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace democonv {

LogLevel Logger::min_level_ = LogLevel::Info;

namespace {

const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

} // namespace

void Logger::set_min_level(LogLevel level) {
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }

    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto& out = (level == LogLevel::Error) ? std::cerr : std::cout;
    out << "[" << level_label(level) << "] " << message << std::endl;
}

LogLevel parse_log_level(const std::string& value) {
    std::string level = value;
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (level == "debug") {
        return LogLevel::Debug;
    }
    if (level == "info") {
        return LogLevel::Info;
    }
    if (level == "warn") {
        return LogLevel::Warn;
    }
    if (level == "error") {
        return LogLevel::Error;
    }
    throw std::invalid_argument("Unknown log level: " + value);
}

} // namespace democonv
