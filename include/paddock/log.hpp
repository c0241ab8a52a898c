#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace paddock {

enum class LogLevel : std::uint8_t { debug, info, warning, error, critical };

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

// Process-wide threshold; messages below it are dropped before formatting.
void set_log_level(LogLevel level);
LogLevel log_level();

// Replace the line writer (default: timestamped line on stderr).
// Passing an empty function restores the default.
using LogWriter = std::function<void(LogLevel, std::string_view)>;
void set_log_writer(LogWriter writer);

namespace detail {
bool log_enabled(LogLevel level);
void write_log(LogLevel level, std::string_view message);
} // namespace detail

template <class... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
  if (!detail::log_enabled(level)) return;
  detail::write_log(level, fmt::format(format, std::forward<Args>(args)...));
}

template <class... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
  log(LogLevel::debug, format, std::forward<Args>(args)...);
}

template <class... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
  log(LogLevel::info, format, std::forward<Args>(args)...);
}

template <class... Args>
void log_warning(fmt::format_string<Args...> format, Args&&... args) {
  log(LogLevel::warning, format, std::forward<Args>(args)...);
}

template <class... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
  log(LogLevel::error, format, std::forward<Args>(args)...);
}

template <class... Args>
void log_critical(fmt::format_string<Args...> format, Args&&... args) {
  log(LogLevel::critical, format, std::forward<Args>(args)...);
}

} // namespace paddock
