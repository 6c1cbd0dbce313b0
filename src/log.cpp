#include "mcsim/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mcsim {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<bool> g_to_stderr{true};

struct SinkEntry {
  int handle{};
  LogSink fn{};
};

using SinkList = std::vector<SinkEntry>;

// Writers take the current list by pointer; add/remove publish a new one.
std::mutex g_sinks_mtx;
std::shared_ptr<const SinkList> g_sinks = std::make_shared<const SinkList>();
int g_next_handle = 1;

std::mutex g_stderr_mtx;

std::shared_ptr<const SinkList> current_sinks() {
  std::lock_guard<std::mutex> lk(g_sinks_mtx);
  return g_sinks;
}

// 2026-01-02T03:04:05.678Z
void append_utc_time(std::string& out) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  out.append(buf, n);
  std::snprintf(buf, sizeof(buf), ".%03dZ", static_cast<int>(millis));
  out += buf;
}

} // namespace

void set_log_level(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }
LogLevel log_level() noexcept { return g_level.load(std::memory_order_relaxed); }

bool log_enabled(LogLevel level) noexcept {
  const LogLevel cur = log_level();
  return cur != LogLevel::Off && level != LogLevel::Off && level >= cur;
}

void set_log_to_stderr(bool enabled) noexcept { g_to_stderr.store(enabled, std::memory_order_relaxed); }

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "unknown";
}

LogLevel parse_log_level(std::string_view text) noexcept {
  for (const LogLevel l : {LogLevel::Trace, LogLevel::Debug, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
    if (text == to_string(l)) return l;
  }
  if (text == "warning") return LogLevel::Warn;
  return LogLevel::Info;
}

int add_log_sink(LogSink sink) {
  if (!sink) return 0;
  std::lock_guard<std::mutex> lk(g_sinks_mtx);
  auto next = std::make_shared<SinkList>(*g_sinks);
  const int handle = g_next_handle++;
  next->push_back(SinkEntry{handle, std::move(sink)});
  g_sinks = std::move(next);
  return handle;
}

void remove_log_sink(int handle) {
  std::lock_guard<std::mutex> lk(g_sinks_mtx);
  auto next = std::make_shared<SinkList>();
  for (const auto& e : *g_sinks) {
    if (e.handle != handle) next->push_back(e);
  }
  g_sinks = std::move(next);
}

void log(LogLevel level, std::string_view message) {
  if (!log_enabled(level)) return;

  // ts=<utc> level=<name> <event key=value...>
  std::string line;
  line.reserve(message.size() + 48);
  line += "ts=";
  append_utc_time(line);
  line += " level=";
  line += to_string(level);
  line += ' ';
  line += message;

  if (g_to_stderr.load(std::memory_order_relaxed)) {
    std::lock_guard<std::mutex> lk(g_stderr_mtx);
    std::fprintf(stderr, "%s\n", line.c_str());
  }

  // a sink may log; the list is not locked while it runs
  const auto sinks = current_sinks();
  for (const auto& e : *sinks) e.fn(level, line);
}

} // namespace mcsim
