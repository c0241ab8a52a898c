#include <paddock/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <fmt/chrono.h>
#include "text_util.hpp"

namespace paddock {

namespace {

std::atomic<LogLevel> g_level{LogLevel::info};
std::mutex g_mutex;
LogWriter g_writer; // guarded by g_mutex

void write_stderr(LogLevel level, std::string_view message) {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  fmt::print(stderr, "{:%Y-%m-%dT%H:%M:%S}.{:03}Z {:<5} {}\n",
             fmt::gmtime(std::chrono::system_clock::to_time_t(now)), ms, to_string(level), message);
}

} // namespace

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug:    return "DEBUG";
    case LogLevel::info:     return "INFO";
    case LogLevel::warning:  return "WARN";
    case LogLevel::error:    return "ERROR";
    case LogLevel::critical: return "CRIT";
  }
  return "";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  const auto v = detail::lower(detail::trim(s));
  if (v == "debug")                     return LogLevel::debug;
  if (v == "info")                      return LogLevel::info;
  if (v == "warning" || v == "warn")    return LogLevel::warning;
  if (v == "error")                     return LogLevel::error;
  if (v == "critical" || v == "crit")   return LogLevel::critical;
  return std::nullopt;
}

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

void set_log_writer(LogWriter writer) {
  std::lock_guard lock(g_mutex);
  g_writer = std::move(writer);
}

namespace detail {

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void write_log(LogLevel level, std::string_view message) {
  std::lock_guard lock(g_mutex);
  if (g_writer) g_writer(level, message);
  else write_stderr(level, message);
}

} // namespace detail

} // namespace paddock
