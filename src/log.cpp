#include "objcat/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace objcat {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mutex;

void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (level < g_level.load(std::memory_order_relaxed)) return;
    // Range workers log concurrently; keep lines whole.
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s ", tag);
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
}

}  // namespace

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void log_trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Trace, "TRACE", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, "DEBUG", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, "INFO", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, "ERROR:", fmt, args);
    va_end(args);
}

}  // namespace objcat
