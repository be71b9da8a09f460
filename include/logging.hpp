/*
 * Logging
 *
 * Process-wide log sink. Lines go to stdout (debug/info) or stderr
 * (warning/error) and, when installed, to a host callback.
 *
 *   log_error("server") << "bind :" << port << ": " << std::strerror(errno);
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <functional>
#include <sstream>
#include <string>

namespace input_link {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

const char* to_string(LogLevel level);

// Accepts DEBUG, INFO, WARNING, ERROR (and CRITICAL as ERROR). Returns false
// for anything else.
bool parse_log_level(const std::string& text, LogLevel& out);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Installs (or clears, with an empty function) the host log callback
void setLogCallback(LogCallback callback);

// Writes one formatted line to the console and the callback
void emitLog(LogLevel level, const std::string& component, const std::string& message);

class LogLine {
public:
    LogLine(LogLevel level, const char* component);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    bool enabled_;
    std::ostringstream stream_;
};

inline LogLine log_debug(const char* component) { return LogLine(LogLevel::Debug, component); }
inline LogLine log_info(const char* component) { return LogLine(LogLevel::Info, component); }
inline LogLine log_warning(const char* component) { return LogLine(LogLevel::Warning, component); }
inline LogLine log_error(const char* component) { return LogLine(LogLevel::Error, component); }

}  // namespace input_link

#endif // LOGGING_HPP
