/*
 * Logging Implementation
 */

#include "logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace input_link {

namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogCallback g_callback;

}  // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    if (text == "DEBUG") {
        out = LogLevel::Debug;
    } else if (text == "INFO") {
        out = LogLevel::Info;
    } else if (text == "WARNING") {
        out = LogLevel::Warning;
    } else if (text == "ERROR" || text == "CRITICAL") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void setLogLevel(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

void setLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_callback = std::move(callback);
}

void emitLog(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < g_min_level.load()) return;

    std::string line = std::string("[") + to_string(level) + "] " + component + ": " + message;

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        if (level >= LogLevel::Warning) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
        callback = g_callback;
    }

    // Invoked outside the lock so the callback may log itself
    if (callback) {
        try {
            callback(level, line);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] logging: log callback failed: " << e.what() << std::endl;
        }
    }
}

LogLine::LogLine(LogLevel level, const char* component)
    : level_(level), component_(component),
      enabled_(static_cast<int>(level) >= g_min_level.load()) {
}

LogLine::~LogLine() {
    if (enabled_) {
        emitLog(level_, component_, stream_.str());
    }
}

}  // namespace input_link
