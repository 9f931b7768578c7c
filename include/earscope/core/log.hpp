#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace earscope::core {

enum class LogLevel {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

/// Receives one formatted line (without trailing newline). Default: std::cerr.
using LogSink = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// Replace the output sink; pass nullptr to restore std::cerr. A line whose sink
/// throws a std::exception is written to std::cerr instead.
void set_log_sink(LogSink sink);

/// Parses "error", "warning", "info", "debug"; returns fallback otherwise.
[[nodiscard]] LogLevel parse_log_level(std::string_view s, LogLevel fallback) noexcept;

/// One log line, buffered and written on destruction. Use the EARSCOPE_LOG_* macros.
class LogLine {
 public:
  explicit LogLine(LogLevel level);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value) {
    if (enabled_) buffer_ << value;
    return *this;
  }

 private:
  LogLevel level_;
  bool enabled_;
  std::ostringstream buffer_;
};

}  // namespace earscope::core

#define EARSCOPE_LOG_ERROR ::earscope::core::LogLine(::earscope::core::LogLevel::Error)
#define EARSCOPE_LOG_WARN ::earscope::core::LogLine(::earscope::core::LogLevel::Warning)
#define EARSCOPE_LOG_INFO ::earscope::core::LogLine(::earscope::core::LogLevel::Info)
#define EARSCOPE_LOG_DEBUG ::earscope::core::LogLine(::earscope::core::LogLevel::Debug)
