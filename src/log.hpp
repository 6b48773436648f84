#pragma once
/*
 * Log
 *
 * Purpose: process-wide file logger formatted with fmt.
 * Note: the terminal belongs to ncurses, so nothing is written to stdout/stderr.
 * Logging before log_open (or with an empty path) is a no-op.
 */
#include <string>
#include <utility>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warn, Error };

bool log_open(const std::string& path, LogLevel min_level, std::string& msg);
void log_close();
void log_write(LogLevel level, const std::string& text);
bool log_enabled(LogLevel level);
bool parse_log_level(const std::string& s, LogLevel& out);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Debug)) log_write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Info)) log_write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Warn)) log_write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Error)) log_write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}
