#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "mcsim/clearing_policy.hpp"
#include "mcsim/clearing_task.hpp"
#include "mcsim/events.hpp"
#include "mcsim/routing_cache.hpp"
#include "mcsim/scenario.hpp"
#include "mcsim/tick_metrics.hpp"
#include "mcsim/trust_drift.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

using WallClock = std::chrono::system_clock;

enum class RunPhase : uint8_t { None = 0, Payments, Clearing };

std::string_view to_string(RunPhase p) noexcept;

struct RunCounters {
  uint64_t attempts{};
  uint64_t committed{};
  uint64_t rejected{};
  uint64_t errors{};
  uint64_t timeouts{};
};

struct RunError {
  std::string code{};
  std::string message{};
  WallClock::time_point at{};
};

// Mutable run fields. Only touched through Run::locked.
struct RunStats {
  RunState state{RunState::Running};
  Tick tick_index{};
  SimMs sim_time_ms{};
  int intensity_percent{100};
  RunCounters totals{};
  std::optional<RunError> last_error{};
  std::string last_event_type{};
  RunPhase phase{RunPhase::None};
  int queue_depth{};
  int in_flight{};
  int consec_tick_failures{};
  int64_t consec_all_rejected_ticks{};
  std::deque<WallClock::time_point> error_times{}; // last 60 s
  WallClock::time_point started_at{};
  std::optional<WallClock::time_point> stopped_at{};

  // errors += 1, timestamp, last_error
  void record_error(std::string code, std::string message, WallClock::time_point now);
};

// State owned by whoever is running the tick; never shared with workers
// except the clearing handle, which is swapped under the tick.
struct TickState {
  bool seeded{false};
  bool drift_initialized{false};
  std::set<std::size_t> fired_events{};
  std::unique_ptr<AdaptiveClearingState> adaptive{};
  std::map<Currency, Amount> total_debt_cache{};
  PersistenceCursor persistence{};
  std::shared_ptr<ClearingTask> clearing{};
};

struct RunSpec {
  std::string run_id{};
  uint64_t seed{1};
  int intensity_percent{100};
  Scenario scenario{};
};

// One live simulation. Counters and lifecycle fields sit behind one
// run-scoped mutex; the scenario mirror, routing cache, event bus and
// drift history carry their own locks.
class Run {
public:
  explicit Run(RunSpec spec, IEventSink* sink = nullptr);

  Run(const Run&) = delete;
  Run& operator=(const Run&) = delete;

  const std::string& id() const noexcept { return id_; }
  uint64_t seed() const noexcept { return seed_; }

  template <class F>
  decltype(auto) locked(F&& f) {
    std::lock_guard<std::mutex> lk(mtx_);
    return f(stats_);
  }

  RunStats stats() const;
  RunState state() const;
  bool is_running() const;
  // stopping, stopped or error
  bool is_winding_down() const;

  // Lifecycle actions. Each returns false when the transition is not allowed.
  bool pause();
  bool resume();
  bool set_intensity(int percent);
  bool begin_stop();
  bool mark_stopped();
  // Moves any non-terminal run, a stopping one included, to error.
  bool mark_error(const std::string& code, const std::string& message);

  void record_error(std::string code, std::string message);

  // ++tick_index; sim_time_ms = tick_index * tick_ms. Returns the new tick.
  Tick advance_clock(SimMs tick_ms);


  // True the first time `key` is seen in the current tick.
  bool should_warn_this_tick(const std::string& key);

  RunStatusEvent status_event() const;
  void publish_status();

  RoutingCache& routing() noexcept { return routing_; }
  ScenarioState& scenario() noexcept { return scenario_; }
  EventBus& events() noexcept { return events_; }
  TrustDriftEngine& drift() noexcept { return drift_; }
  TickState& tick_state() noexcept { return tick_; }

private:
  std::string id_;
  uint64_t seed_{1};

  mutable std::mutex mtx_;
  RunStats stats_{};

  std::mutex warn_mtx_;
  Tick warn_tick_{-1};
  std::set<std::string> warn_keys_{};

  RoutingCache routing_{};
  ScenarioState scenario_;
  EventBus events_;
  TrustDriftEngine drift_{};
  TickState tick_{};
};

} // namespace mcsim
