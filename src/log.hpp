#pragma once
/*
 * Log
 *
 * Purpose: leveled diagnostics formatted with fmt, written to stderr or a file.
 * Note: PK_ENABLE_LOGGING=0 compiles every PK_LOG_* call away.
 */
#include <string>
#include <string_view>
#include <filesystem>
#include <fmt/format.h>
#include "config.hpp"

enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
bool parse_log_level(std::string_view name, LogLevel& out);
bool log_to_file(const std::filesystem::path& path, std::string& msg);
void log_to_stderr();
void log_write(LogLevel level, std::string_view text);

#if PK_ENABLE_LOGGING
#define PK_LOG(level, ...) \
  do { \
    if (log_enabled(level)) log_write(level, fmt::format(__VA_ARGS__)); \
  } while (0)
#else
#define PK_LOG(level, ...) do { } while (0)
#endif

#define PK_LOG_TRACE(...) PK_LOG(LogLevel::Trace, __VA_ARGS__)
#define PK_LOG_DEBUG(...) PK_LOG(LogLevel::Debug, __VA_ARGS__)
#define PK_LOG_INFO(...) PK_LOG(LogLevel::Info, __VA_ARGS__)
#define PK_LOG_WARN(...) PK_LOG(LogLevel::Warn, __VA_ARGS__)
#define PK_LOG_ERROR(...) PK_LOG(LogLevel::Error, __VA_ARGS__)
