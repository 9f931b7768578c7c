#include <earscope/core/log.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace earscope::core {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogSink g_sink;  // guarded by g_sink_mutex; empty = std::cerr

std::string_view level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warning:
      return "WARN ";
    case LogLevel::Info:
      return "INFO ";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "?    ";
}

void write_timestamp(std::ostream& os) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // namespace

void set_log_level(LogLevel level) noexcept {
  g_level.store(static_cast<int>(level));
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
  std::lock_guard lock(g_sink_mutex);
  g_sink = std::move(sink);
}

LogLevel parse_log_level(std::string_view s, LogLevel fallback) noexcept {
  if (s == "error") return LogLevel::Error;
  if (s == "warning" || s == "warn") return LogLevel::Warning;
  if (s == "info") return LogLevel::Info;
  if (s == "debug") return LogLevel::Debug;
  return fallback;
}

LogLine::LogLine(LogLevel level)
    : level_(level),
      enabled_(static_cast<int>(level) <= g_level.load()) {
  if (enabled_) {
    write_timestamp(buffer_);
    buffer_ << " [" << level_tag(level) << "] ";
  }
}

LogLine::~LogLine() {
  if (!enabled_) return;
  const std::string line = buffer_.str();
  std::lock_guard lock(g_sink_mutex);
  if (g_sink) {
    try {
      g_sink(level_, line);
      return;
    } catch (const std::exception& e) {
      std::cerr << "log sink failed (" << e.what() << "): ";
    }
  }
  std::cerr << line << '\n';
}

}  // namespace earscope::core
