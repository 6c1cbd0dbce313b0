#include "mcsim/run.hpp"

#include <algorithm>
#include <utility>

namespace mcsim {

namespace {

constexpr auto kErrorWindow = std::chrono::seconds(60);

void prune(std::deque<WallClock::time_point>& q, WallClock::time_point now) {
  const auto cutoff = now - kErrorWindow;
  while (!q.empty() && q.front() < cutoff) q.pop_front();
}

uint64_t count_recent(const std::deque<WallClock::time_point>& q, WallClock::time_point now) {
  const auto cutoff = now - kErrorWindow;
  return static_cast<uint64_t>(std::count_if(q.begin(), q.end(), [&](const auto& t) { return t >= cutoff; }));
}

} // namespace

std::string_view to_string(RunPhase p) noexcept {
  switch (p) {
    case RunPhase::None:     return "";
    case RunPhase::Payments: return "payments";
    case RunPhase::Clearing: return "clearing";
  }
  return "";
}

void RunStats::record_error(std::string code, std::string message, WallClock::time_point now) {
  ++totals.errors;
  error_times.push_back(now);
  prune(error_times, now);
  last_error = RunError{std::move(code), std::move(message), now};
}

Run::Run(RunSpec spec, IEventSink* sink)
  : id_(std::move(spec.run_id)),
    seed_(spec.seed),
    scenario_(std::move(spec.scenario), &routing_),
    events_(id_, sink) {
  stats_.intensity_percent = std::clamp(spec.intensity_percent, 0, 100);
  stats_.started_at = WallClock::now();
}

RunStats Run::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

RunState Run::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_.state;
}

bool Run::is_running() const {
  return state() == RunState::Running;
}

bool Run::is_winding_down() const {
  const auto s = state();
  return s == RunState::Stopping || is_terminal(s);
}

bool Run::pause() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stats_.state != RunState::Running) return false;
  stats_.state = RunState::Paused;
  return true;
}

bool Run::resume() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stats_.state != RunState::Paused) return false;
  stats_.state = RunState::Running;
  return true;
}

bool Run::set_intensity(int percent) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (is_terminal(stats_.state) || stats_.state == RunState::Stopping) return false;
  stats_.intensity_percent = std::clamp(percent, 0, 100);
  return true;
}

bool Run::begin_stop() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stats_.state != RunState::Running && stats_.state != RunState::Paused) return false;
  stats_.state = RunState::Stopping;
  return true;
}

bool Run::mark_stopped() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stats_.state != RunState::Stopping) return false;
  stats_.state = RunState::Stopped;
  stats_.stopped_at = WallClock::now();
  stats_.phase = RunPhase::None;
  stats_.queue_depth = 0;
  stats_.in_flight = 0;
  return true;
}

bool Run::mark_error(const std::string& code, const std::string& message) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (is_terminal(stats_.state)) return false;
  const auto now = WallClock::now();
  stats_.state = RunState::Error;
  stats_.stopped_at = now;
  stats_.phase = RunPhase::None;
  stats_.queue_depth = 0;
  stats_.in_flight = 0;
  stats_.record_error(code, message, now);
  return true;
}

void Run::record_error(std::string code, std::string message) {
  std::lock_guard<std::mutex> lk(mtx_);
  stats_.record_error(std::move(code), std::move(message), WallClock::now());
}

Tick Run::advance_clock(SimMs tick_ms) {
  std::lock_guard<std::mutex> lk(mtx_);
  ++stats_.tick_index;
  stats_.sim_time_ms = stats_.tick_index * tick_ms;
  return stats_.tick_index;
}

bool Run::should_warn_this_tick(const std::string& key) {
  const Tick tick = stats().tick_index;
  std::lock_guard<std::mutex> lk(warn_mtx_);
  if (tick != warn_tick_) {
    warn_tick_ = tick;
    warn_keys_.clear();
  }
  return warn_keys_.insert(key).second;
}

RunStatusEvent Run::status_event() const {
  std::lock_guard<std::mutex> lk(mtx_);
  RunStatusEvent e{};
  e.state = stats_.state;
  e.tick = stats_.tick_index;
  e.sim_ms = stats_.sim_time_ms;
  e.intensity_percent = stats_.intensity_percent;
  e.attempts = stats_.totals.attempts;
  e.committed = stats_.totals.committed;
  e.rejected = stats_.totals.rejected;
  e.errors = stats_.totals.errors;
  e.timeouts = stats_.totals.timeouts;
  e.errors_last_1m = count_recent(stats_.error_times, WallClock::now());
  e.stall_ticks = stats_.consec_all_rejected_ticks;
  if (stats_.last_error) {
    e.last_error_code = stats_.last_error->code;
    e.last_error_message = stats_.last_error->message;
  }
  return e;
}

void Run::publish_status() {
  events_.publish(status_event());
  std::lock_guard<std::mutex> lk(mtx_);
  stats_.last_event_type = "run_status";
}

} // namespace mcsim
