#pragma once

#include <functional>
#include <sstream>
#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

using LogHandler = std::function<void(LogLevel, const std::string&)>;

// Lines below min_level are dropped. With use_syslog the lines go to syslog
// under the given ident instead of stderr.
void log_init(const std::string& ident, LogLevel min_level, bool use_syslog);
void log_shutdown();

void set_log_level(LogLevel min_level);
LogLevel get_log_level();

// Replaces the output backend (tests). An empty handler restores the default.
void set_log_handler(LogHandler handler);

void log_message(LogLevel level, const std::string& message);

const char* log_level_name(LogLevel level);

// Collects one line through operator<< and emits it when destroyed.
class LogLine {
public:
    explicit LogLine(LogLevel level) : level(level) {}
    LogLine(LogLine&& other) noexcept : level(other.level), stream(std::move(other.stream)), moved(false) {
        other.moved = true;
    }
    ~LogLine() {
        if (!moved) {
            log_message(level, stream.str());
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        stream << value;
        return *this;
    }

private:
    LogLevel level;
    std::ostringstream stream;
    bool moved = false;
};

inline LogLine log_debug() { return LogLine(LogLevel::Debug); }
inline LogLine log_info() { return LogLine(LogLevel::Info); }
inline LogLine log_warning() { return LogLine(LogLevel::Warning); }
inline LogLine log_error() { return LogLine(LogLevel::Error); }
