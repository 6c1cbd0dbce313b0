#pragma once

#include <functional>
#include <sstream>
#include <string_view>

namespace mcsim {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel level) noexcept;

std::string_view to_string(LogLevel level) noexcept;

// Parses "trace", "debug", "info", "warn", "error", "off". Unknown text maps to Info.
LogLevel parse_log_level(std::string_view text) noexcept;

// Extra destination for formatted lines, e.g. a test capturing warnings.
// The line view is valid only during the call.
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

// Returns a handle for remove_log_sink.
int add_log_sink(LogSink sink);
void remove_log_sink(int handle);

// When false, lines go to sinks only (tests silence stderr this way).
void set_log_to_stderr(bool enabled) noexcept;

void log(LogLevel level, std::string_view message);

} // namespace mcsim

// Stream-style: MCSIM_LOG_WARN("clearing.budget_exceeded eq=" << eq);
#define MCSIM_LOG_AT(level, expr)                         \
  do {                                                    \
    if (::mcsim::log_enabled(level)) {                    \
      std::ostringstream mcsim_log_oss_;                  \
      mcsim_log_oss_ << expr;                             \
      ::mcsim::log((level), mcsim_log_oss_.str());        \
    }                                                     \
  } while (0)

#define MCSIM_LOG_TRACE(expr) MCSIM_LOG_AT(::mcsim::LogLevel::Trace, expr)
#define MCSIM_LOG_DEBUG(expr) MCSIM_LOG_AT(::mcsim::LogLevel::Debug, expr)
#define MCSIM_LOG_INFO(expr)  MCSIM_LOG_AT(::mcsim::LogLevel::Info, expr)
#define MCSIM_LOG_WARN(expr)  MCSIM_LOG_AT(::mcsim::LogLevel::Warn, expr)
#define MCSIM_LOG_ERROR(expr) MCSIM_LOG_AT(::mcsim::LogLevel::Error, expr)
