#include "log.hpp"

#include <syslog.h>
#include <ctime>
#include <iostream>
#include <mutex>

namespace {

LogLevel min_level = LogLevel::Info;
bool syslog_enabled = false;
LogHandler custom_handler;
std::mutex output_mutex;

int to_syslog_priority(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return LOG_DEBUG;
        case LogLevel::Info: return LOG_INFO;
        case LogLevel::Warning: return LOG_WARNING;
        case LogLevel::Error: return LOG_ERR;
    }
    return LOG_INFO;
}

void write_stderr(LogLevel level, const std::string& message) {
    std::time_t now = std::time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    std::cerr << stamp << " " << log_level_name(level) << " " << message << "\n";
}

} // namespace

void log_init(const std::string& ident, LogLevel level, bool use_syslog) {
    std::lock_guard<std::mutex> lock(output_mutex);
    min_level = level;
    if (use_syslog && !syslog_enabled) {
        // openlog keeps the pointer, so the ident must outlive the process
        static std::string syslog_ident;
        syslog_ident = ident;
        openlog(syslog_ident.c_str(), LOG_PID, LOG_DAEMON);
    }
    syslog_enabled = use_syslog;
}

void log_shutdown() {
    std::lock_guard<std::mutex> lock(output_mutex);
    if (syslog_enabled) {
        closelog();
        syslog_enabled = false;
    }
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(output_mutex);
    min_level = level;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(output_mutex);
    return min_level;
}

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(output_mutex);
    custom_handler = std::move(handler);
}

void log_message(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    if (static_cast<int>(level) < static_cast<int>(min_level)) {
        return;
    }
    if (custom_handler) {
        custom_handler(level, message);
    } else if (syslog_enabled) {
        syslog(to_syslog_priority(level), "%s", message.c_str());
    } else {
        write_stderr(level, message);
    }
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
