#pragma once
#include <cstdio>
#include <cstdarg>
#include <string>
#include <vector>
#include <mutex>

namespace rastile {

enum class LogLevel { Debug, Info, Warn, Error };

void log_set_level(LogLevel level);
LogLevel log_level();
void log_msg(LogLevel level, const char* fmt, ...);

/* Parse "debug" / "info" / "warn" / "error". Unknown names give Info. */
LogLevel log_level_from_string(const std::string& name);

/* Ring buffer of recent log messages, surfaced to hosts via the C ABI */
struct LogEntry {
    LogLevel level;
    std::string text;
};

std::vector<LogEntry> log_recent(int max_count = 3);

} // namespace rastile

#define LOG_DEBUG(...) ::rastile::log_msg(::rastile::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::rastile::log_msg(::rastile::LogLevel::Info,  __VA_ARGS__)
#define LOG_WARN(...)  ::rastile::log_msg(::rastile::LogLevel::Warn,  __VA_ARGS__)
#define LOG_ERROR(...) ::rastile::log_msg(::rastile::LogLevel::Error, __VA_ARGS__)
