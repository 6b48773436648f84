#include "log.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <fmt/chrono.h>

namespace {
std::mutex g_mu;
std::FILE* g_file = nullptr;
LogLevel g_min = LogLevel::Info;

const char* level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO ";
    case LogLevel::Warn: return "WARN ";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}
}

bool log_open(const std::string& path, LogLevel min_level, std::string& msg) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
  g_min = min_level;
  if (path.empty()) return true;
  g_file = std::fopen(path.c_str(), "a");
  if (!g_file) { msg = std::string("open log file failed: ") + path; return false; }
  return true;
}

void log_close() {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
}

bool log_enabled(LogLevel level) {
  std::lock_guard<std::mutex> lk(g_mu);
  return g_file != nullptr && level >= g_min;
}

void log_write(LogLevel level, const std::string& text) {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::lock_guard<std::mutex> lk(g_mu);
  if (!g_file) return;
  fmt::print(g_file, "{:%H:%M:%S}.{:03} {} {}\n", fmt::localtime(t), ms, level_name(level), text);
  std::fflush(g_file);
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info") { out = LogLevel::Info; return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  return false;
}
