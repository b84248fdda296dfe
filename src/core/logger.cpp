#include <shotocr/core/logger.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace shotocr::core {

namespace {

std::atomic<LogLevel> g_min_level{LogLevel::Info};
std::mutex g_output_mutex;

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;

  std::tm local{};
  localtime_r(&time, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "[DEBUG]";
    case LogLevel::Info:
      return "[INFO]";
    case LogLevel::Warning:
      return "[WARN]";
    case LogLevel::Error:
      return "[ERROR]";
  }
  return "[?]";
}

}  // namespace

void set_log_level(LogLevel level) noexcept { g_min_level = level; }

LogLevel log_level() noexcept { return g_min_level.load(); }

std::optional<LogLevel> parse_log_level(std::string_view text) {
  if (text == "debug") return LogLevel::Debug;
  if (text == "info") return LogLevel::Info;
  if (text == "warning" || text == "warn") return LogLevel::Warning;
  if (text == "error") return LogLevel::Error;
  return std::nullopt;
}

void log(LogLevel level, std::string_view message) {
  if (level < g_min_level.load()) return;

  const std::string stamp = timestamp();
  std::lock_guard lock(g_output_mutex);
  std::cerr << stamp << ' ' << level_tag(level) << ' ' << message << '\n';
}

void log_debug(std::string_view message) { log(LogLevel::Debug, message); }
void log_info(std::string_view message) { log(LogLevel::Info, message); }
void log_warning(std::string_view message) { log(LogLevel::Warning, message); }
void log_error(std::string_view message) { log(LogLevel::Error, message); }

}  // namespace shotocr::core
