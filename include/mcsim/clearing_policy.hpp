#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string_view>
#include <utility>

#include "mcsim/types.hpp"

namespace mcsim {

// Clearing volume below this counts as zero yield.
inline constexpr double kZeroVolumeEps = 1e-9;

enum class ClearingReason : uint8_t {
  WarmupFallbackRun = 0,
  WarmupFallbackSkip,
  WarmupDisabled,
  RateHighEnter,
  RateLowExit,
  RunActive,
  SkipNotActive,
  SkipMinInterval,
  SkipBackoff,
  SkipGuardrail,
  StaticCadence
};

std::string_view to_string(ClearingReason r) noexcept;

struct AdaptivePolicyConfig {
  int window_ticks{30};
  double no_capacity_high{0.60};
  double no_capacity_low{0.30};
  int min_interval_ticks{5};
  int backoff_max_interval_ticks{60};

  // guardrails, 0 disables
  int inflight_threshold{0};
  int queue_depth_threshold{0};

  int max_depth_min{3};
  int max_depth_max{6};
  int time_budget_ms_min{50};
  int time_budget_ms_max{250};

  // copied from the static clearing configuration
  int global_max_depth_ceiling{6};
  int global_time_budget_ms_ceiling{250};

  // static cadence while the window is underfilled, 0 = never run then
  int warmup_fallback_cadence{0};

  // Clamps window_ticks to >= 1 and logs a warning per suspicious value.
  AdaptivePolicyConfig validated() const;
};

struct ClearingDecision {
  bool should_run{false};
  ClearingReason reason{ClearingReason::SkipNotActive};
  std::optional<int> time_budget_ms{};
  std::optional<int> max_depth{};
};

struct TickSignals {
  int attempted_payments{};
  int rejected_no_capacity{};
};

struct LoadSignals {
  int in_flight{};
  int queue_depth{};
};

// Rolling per-currency state of the adaptive policy.
class AdaptiveClearingState {
public:
  struct PerCurrency {
    std::deque<std::pair<int, int>> window{}; // (attempted, rejected_no_capacity)
    double last_clearing_volume{};
    double last_clearing_cost_ms{};
    Tick last_clearing_tick{-1};
    int backoff_interval{};
    int consecutive_zero_yield{};
    bool active{false};
  };

  explicit AdaptiveClearingState(AdaptivePolicyConfig cfg = {}) : cfg_(cfg.validated()) {}

  void record_tick_signals(const Currency& eq, TickSignals s);
  void update_clearing_result(const Currency& eq, double volume, double cost_ms, Tick tick);

  double no_capacity_rate(const Currency& eq);
  std::size_t window_fill(const Currency& eq);
  PerCurrency& per_currency(const Currency& eq);

  const AdaptivePolicyConfig& config() const noexcept { return cfg_; }

private:
  AdaptivePolicyConfig cfg_{};
  std::map<Currency, PerCurrency> per_eq_{};
};

// Stateless evaluator: reads the state, updates hysteresis, returns a decision.
class AdaptiveClearingPolicy {
public:
  explicit AdaptiveClearingPolicy(AdaptivePolicyConfig cfg = {}) : cfg_(cfg.validated()) {}

  ClearingDecision evaluate(const Currency& eq, AdaptiveClearingState& state, Tick tick,
                            LoadSignals load = {}) const;

  const AdaptivePolicyConfig& config() const noexcept { return cfg_; }

private:
  std::optional<ClearingDecision> check_interval_limits_(const AdaptiveClearingState::PerCurrency& s, Tick tick) const;
  ClearingDecision run_decision_(double rate, ClearingReason reason) const;
  ClearingDecision min_budget_decision_(ClearingReason reason) const;

  AdaptivePolicyConfig cfg_{};
};

} // namespace mcsim
