#pragma once

#include <optional>
#include <string>

namespace objcat {

// Log levels, most verbose first. All log output goes to stderr because
// stdout carries object bytes.
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Error = 3
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Parse "trace", "debug", "info" or "error".
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

void log_trace(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace objcat
