#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace shotocr::core {

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

/// Set minimum level written to stderr. Default: Info.
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// "debug", "info", "warning"/"warn", "error" (case-sensitive). nullopt otherwise.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/// Write "HH:MM:SS.mmm [LEVEL] message" to stderr if level passes the filter.
/// Safe to call from multiple threads; lines are not interleaved.
void log(LogLevel level, std::string_view message);

void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warning(std::string_view message);
void log_error(std::string_view message);

}  // namespace shotocr::core
