#include "mcsim/clearing_policy.hpp"

#include <algorithm>

#include "mcsim/log.hpp"

namespace mcsim {

std::string_view to_string(ClearingReason r) noexcept {
  switch (r) {
    case ClearingReason::WarmupFallbackRun:  return "WARMUP_FALLBACK_RUN";
    case ClearingReason::WarmupFallbackSkip: return "WARMUP_FALLBACK_SKIP";
    case ClearingReason::WarmupDisabled:     return "WARMUP_DISABLED";
    case ClearingReason::RateHighEnter:      return "RATE_HIGH_ENTER";
    case ClearingReason::RateLowExit:        return "RATE_LOW_EXIT";
    case ClearingReason::RunActive:          return "RUN_ACTIVE";
    case ClearingReason::SkipNotActive:      return "SKIP_NOT_ACTIVE";
    case ClearingReason::SkipMinInterval:    return "SKIP_MIN_INTERVAL";
    case ClearingReason::SkipBackoff:        return "SKIP_BACKOFF";
    case ClearingReason::SkipGuardrail:      return "SKIP_GUARDRAIL";
    case ClearingReason::StaticCadence:      return "STATIC_CADENCE";
  }
  return "UNKNOWN";
}

AdaptivePolicyConfig AdaptivePolicyConfig::validated() const {
  AdaptivePolicyConfig c = *this;

  if (c.window_ticks < 1) {
    MCSIM_LOG_WARN("adaptive_policy.config window_ticks=" << c.window_ticks << " < 1, using 1");
    c.window_ticks = 1;
  }
  const double low = c.no_capacity_low;
  const double high = c.no_capacity_high;
  if (!(0.0 <= low && low < high && high <= 1.0)) {
    MCSIM_LOG_WARN("adaptive_policy.config invalid thresholds low=" << low << " high=" << high
                   << " (need 0 <= low < high <= 1)");
  }
  if (low >= high) {
    MCSIM_LOG_WARN("adaptive_policy.config hysteresis band collapsed, pressure is always max");
  }
  if (c.min_interval_ticks < 1) {
    MCSIM_LOG_WARN("adaptive_policy.config min_interval_ticks=" << c.min_interval_ticks << " < 1, cooldown disabled");
  }
  if (c.time_budget_ms_min > c.time_budget_ms_max) {
    MCSIM_LOG_WARN("adaptive_policy.config time_budget_ms_min=" << c.time_budget_ms_min
                   << " > time_budget_ms_max=" << c.time_budget_ms_max);
  }
  if (c.max_depth_min > c.max_depth_max) {
    MCSIM_LOG_WARN("adaptive_policy.config max_depth_min=" << c.max_depth_min
                   << " > max_depth_max=" << c.max_depth_max);
  }
  return c;
}

AdaptiveClearingState::PerCurrency& AdaptiveClearingState::per_currency(const Currency& eq) {
  return per_eq_[eq];
}

void AdaptiveClearingState::record_tick_signals(const Currency& eq, TickSignals sig) {
  auto& s = per_eq_[eq];
  s.window.emplace_back(std::max(0, sig.attempted_payments), std::max(0, sig.rejected_no_capacity));
  while (s.window.size() > static_cast<std::size_t>(cfg_.window_ticks)) s.window.pop_front();
}

void AdaptiveClearingState::update_clearing_result(const Currency& eq, double volume, double cost_ms, Tick tick) {
  auto& s = per_eq_[eq];
  s.last_clearing_volume = volume;
  s.last_clearing_cost_ms = cost_ms;
  s.last_clearing_tick = tick;

  if (volume < kZeroVolumeEps) {
    ++s.consecutive_zero_yield;
    // first zero yield keeps the base cooldown, then doubles
    const int min_iv = std::max(1, cfg_.min_interval_ticks);
    const int max_iv = std::max(min_iv, cfg_.backoff_max_interval_ticks);
    const int exp = std::max(0, s.consecutive_zero_yield - 1);
    int64_t iv = min_iv;
    for (int i = 0; i < exp && iv < max_iv; ++i) iv *= 2;
    s.backoff_interval = std::max(min_iv, static_cast<int>(std::min<int64_t>(max_iv, iv)));
  } else {
    s.consecutive_zero_yield = 0;
    s.backoff_interval = 0;
  }
}

double AdaptiveClearingState::no_capacity_rate(const Currency& eq) {
  const auto& s = per_eq_[eq];
  int64_t attempted = 0;
  int64_t rejected = 0;
  for (const auto& [a, r] : s.window) {
    attempted += a;
    rejected += r;
  }
  if (attempted == 0) return 0.0;
  return static_cast<double>(rejected) / static_cast<double>(attempted);
}

std::size_t AdaptiveClearingState::window_fill(const Currency& eq) {
  return per_eq_[eq].window.size();
}

static double normalize(double v, double lo, double hi) noexcept {
  if (hi <= lo) return 1.0;
  return std::clamp((v - lo) / (hi - lo), 0.0, 1.0);
}

static int clamp_int(int v, int lo, int hi) noexcept {
  return std::max(lo, std::min(hi, v));
}

ClearingDecision AdaptiveClearingPolicy::evaluate(const Currency& eq, AdaptiveClearingState& state, Tick tick,
                                                  LoadSignals load) const {
  auto& s = state.per_currency(eq);
  const double rate = state.no_capacity_rate(eq);

  if ((cfg_.inflight_threshold > 0 && load.in_flight > cfg_.inflight_threshold) ||
      (cfg_.queue_depth_threshold > 0 && load.queue_depth > cfg_.queue_depth_threshold)) {
    return ClearingDecision{false, ClearingReason::SkipGuardrail};
  }

  // cold start: no hysteresis until the window is full
  if (state.window_fill(eq) < static_cast<std::size_t>(cfg_.window_ticks)) {
    if (cfg_.warmup_fallback_cadence <= 0) return ClearingDecision{false, ClearingReason::WarmupDisabled};
    if (tick % cfg_.warmup_fallback_cadence != 0) return ClearingDecision{false, ClearingReason::WarmupFallbackSkip};
    if (auto blocked = check_interval_limits_(s, tick)) return *blocked;
    return min_budget_decision_(ClearingReason::WarmupFallbackRun);
  }

  const bool was_active = s.active;
  if (rate >= cfg_.no_capacity_high) {
    s.active = true;
  } else if (rate < cfg_.no_capacity_low) {
    s.active = false; // exactly at low keeps the previous state
  }

  if (was_active && !s.active) return ClearingDecision{false, ClearingReason::RateLowExit};
  if (!s.active) return ClearingDecision{false, ClearingReason::SkipNotActive};

  if (auto blocked = check_interval_limits_(s, tick)) return *blocked;

  return run_decision_(rate, was_active ? ClearingReason::RunActive : ClearingReason::RateHighEnter);
}

std::optional<ClearingDecision> AdaptiveClearingPolicy::check_interval_limits_(
    const AdaptiveClearingState::PerCurrency& s, Tick tick) const {
  if (s.last_clearing_tick < 0) return std::nullopt;

  const Tick since = tick - s.last_clearing_tick;
  if (since < cfg_.min_interval_ticks) return ClearingDecision{false, ClearingReason::SkipMinInterval};
  if (s.backoff_interval > 0 && since < s.backoff_interval) return ClearingDecision{false, ClearingReason::SkipBackoff};
  return std::nullopt;
}

ClearingDecision AdaptiveClearingPolicy::run_decision_(double rate, ClearingReason reason) const {
  const double pressure = normalize(rate, cfg_.no_capacity_low, cfg_.no_capacity_high);

  const double raw_depth = cfg_.max_depth_min + pressure * (cfg_.max_depth_max - cfg_.max_depth_min);
  const double raw_budget = cfg_.time_budget_ms_min + pressure * (cfg_.time_budget_ms_max - cfg_.time_budget_ms_min);

  ClearingDecision d{};
  d.should_run = true;
  d.reason = reason;
  // configured band first, the static ceiling last
  const int depth = clamp_int(static_cast<int>(raw_depth), cfg_.max_depth_min, cfg_.max_depth_max);
  const int budget = clamp_int(static_cast<int>(raw_budget), cfg_.time_budget_ms_min, cfg_.time_budget_ms_max);
  d.max_depth = std::max(1, std::min(depth, cfg_.global_max_depth_ceiling));
  d.time_budget_ms = std::max(1, std::min(budget, cfg_.global_time_budget_ms_ceiling));
  return d;
}

ClearingDecision AdaptiveClearingPolicy::min_budget_decision_(ClearingReason reason) const {
  ClearingDecision d{};
  d.should_run = true;
  d.reason = reason;
  d.max_depth = std::max(1, std::min({cfg_.max_depth_min, cfg_.max_depth_max, cfg_.global_max_depth_ceiling}));
  d.time_budget_ms = std::max(1, std::min({cfg_.time_budget_ms_min, cfg_.time_budget_ms_max,
                                          cfg_.global_time_budget_ms_ceiling}));
  return d;
}

} // namespace mcsim
