#include "mcsim/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

#include "mcsim/log.hpp"

namespace mcsim {

namespace {

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

void read_int(const char* name, int& out) {
  const char* v = env(name);
  if (!v) return;
  errno = 0;
  char* end = nullptr;
  const long x = std::strtol(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0') {
    MCSIM_LOG_WARN("config.invalid_value name=" << name << " value=" << v << " default=" << out);
    return;
  }
  out = static_cast<int>(x);
}

void read_int64(const char* name, int64_t& out) {
  const char* v = env(name);
  if (!v) return;
  errno = 0;
  char* end = nullptr;
  const long long x = std::strtoll(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0') {
    MCSIM_LOG_WARN("config.invalid_value name=" << name << " value=" << v << " default=" << out);
    return;
  }
  out = static_cast<int64_t>(x);
}

void read_double(const char* name, double& out) {
  const char* v = env(name);
  if (!v) return;
  errno = 0;
  char* end = nullptr;
  const double x = std::strtod(v, &end);
  if (errno != 0 || end == v || *end != '\0' || !std::isfinite(x)) {
    MCSIM_LOG_WARN("config.invalid_value name=" << name << " value=" << v << " default=" << out);
    return;
  }
  out = x;
}

void read_flag(const char* name, bool& out) {
  const char* v = env(name);
  if (!v) return;
  const std::string s(v);
  if (s == "1" || s == "true" || s == "yes" || s == "on") {
    out = true;
  } else if (s == "0" || s == "false" || s == "no" || s == "off") {
    out = false;
  } else {
    MCSIM_LOG_WARN("config.invalid_value name=" << name << " value=" << v << " default=" << out);
  }
}

} // namespace

std::string_view to_string(ClearingPolicyKind k) noexcept {
  switch (k) {
    case ClearingPolicyKind::Static:   return "static";
    case ClearingPolicyKind::Adaptive: return "adaptive";
  }
  return "static";
}

SimConfig SimConfig::from_env() {
  SimConfig c{};

  read_int("MCSIM_ACTIONS_PER_TICK_MAX", c.actions_per_tick_max);
  read_int64("MCSIM_TICK_MS", c.tick_ms);
  if (c.tick_ms <= 0) {
    MCSIM_LOG_WARN("config.invalid_value name=MCSIM_TICK_MS value=" << c.tick_ms << " default=1000");
    c.tick_ms = 1000;
  }

  if (const char* v = env("MCSIM_AMOUNT_CAP")) {
    double cap = 0.0;
    read_double("MCSIM_AMOUNT_CAP", cap);
    const Amount a = trunc2(cap);
    if (a > 0) {
      c.amount_cap = a;
    } else {
      MCSIM_LOG_WARN("config.invalid_value name=MCSIM_AMOUNT_CAP value=" << v << " default=none");
    }
  }

  if (const char* v = env("MCSIM_CLEARING_POLICY")) {
    const std::string s(v);
    if (s == "adaptive") {
      c.clearing_policy = ClearingPolicyKind::Adaptive;
    } else if (s == "static") {
      c.clearing_policy = ClearingPolicyKind::Static;
    } else {
      MCSIM_LOG_WARN("config.invalid_value name=MCSIM_CLEARING_POLICY value=" << s << " default=static");
    }
  }
  read_int("MCSIM_CLEARING_EVERY_N_TICKS", c.clearing_every_n_ticks);
  read_int("MCSIM_CLEARING_MAX_DEPTH", c.clearing_max_depth);
  read_int("MCSIM_CLEARING_TIME_BUDGET_MS", c.clearing_time_budget_ms);
  read_double("MCSIM_CLEARING_HARD_TIMEOUT_SEC", c.clearing_hard_timeout_sec);
  read_int("MCSIM_CLEARING_MAX_FX_EDGES", c.clearing_max_fx_edges);

  read_int("MCSIM_MAX_IN_FLIGHT", c.max_in_flight);
  c.max_in_flight = std::max(1, c.max_in_flight);
  read_int("MCSIM_MAX_TIMEOUTS_PER_TICK", c.max_timeouts_per_tick);
  read_int("MCSIM_MAX_ERRORS_TOTAL", c.max_errors_total);
  read_int("MCSIM_MAX_CONSEC_TICK_FAILURES", c.max_consec_tick_failures);

  read_flag("MCSIM_ENABLE_INJECT", c.enable_inject);

  read_int("MCSIM_METRICS_EVERY_N_TICKS", c.metrics_every_n_ticks);
  read_int("MCSIM_BOTTLENECKS_EVERY_N_TICKS", c.bottlenecks_every_n_ticks);
  read_int64("MCSIM_LAST_TICK_WRITE_EVERY_MS", c.last_tick_write_every_ms);

  auto& a = c.adaptive;
  read_int("MCSIM_CLEARING_ADAPTIVE_WINDOW_TICKS", a.window_ticks);
  read_double("MCSIM_CLEARING_ADAPTIVE_NO_CAPACITY_HIGH", a.no_capacity_high);
  read_double("MCSIM_CLEARING_ADAPTIVE_NO_CAPACITY_LOW", a.no_capacity_low);
  read_int("MCSIM_CLEARING_ADAPTIVE_MIN_INTERVAL_TICKS", a.min_interval_ticks);
  read_int("MCSIM_CLEARING_ADAPTIVE_BACKOFF_MAX_INTERVAL_TICKS", a.backoff_max_interval_ticks);
  read_int("MCSIM_CLEARING_ADAPTIVE_INFLIGHT_THRESHOLD", a.inflight_threshold);
  read_int("MCSIM_CLEARING_ADAPTIVE_QUEUE_DEPTH_THRESHOLD", a.queue_depth_threshold);
  read_int("MCSIM_CLEARING_ADAPTIVE_MAX_DEPTH_MIN", a.max_depth_min);
  read_int("MCSIM_CLEARING_ADAPTIVE_MAX_DEPTH_MAX", a.max_depth_max);
  read_int("MCSIM_CLEARING_ADAPTIVE_TIME_BUDGET_MS_MIN", a.time_budget_ms_min);
  read_int("MCSIM_CLEARING_ADAPTIVE_TIME_BUDGET_MS_MAX", a.time_budget_ms_max);
  read_int("MCSIM_CLEARING_ADAPTIVE_WARMUP_FALLBACK_CADENCE", a.warmup_fallback_cadence);

  if (const char* v = env("MCSIM_LOG_LEVEL")) set_log_level(parse_log_level(v));

  MCSIM_LOG_DEBUG("config.loaded policy=" << to_string(c.clearing_policy) << " every_n=" << c.clearing_every_n_ticks
                  << " max_in_flight=" << c.max_in_flight << " inject=" << c.enable_inject);
  return c;
}

PlannerConfig SimConfig::planner() const {
  PlannerConfig p{};
  p.actions_per_tick_max = actions_per_tick_max;
  p.amount_cap = amount_cap;
  return p;
}

ExecutorConfig SimConfig::executor() const {
  ExecutorConfig e{};
  e.max_in_flight = std::max(1, max_in_flight);
  e.max_timeouts_per_tick = max_timeouts_per_tick;
  return e;
}

ClearingOptions SimConfig::clearing() const {
  ClearingOptions o{};
  o.max_depth = clearing_max_depth;
  o.time_budget_ms = clearing_time_budget_ms;
  o.max_fx_edges = clearing_max_fx_edges;
  return o;
}

PersistenceConfig SimConfig::persistence() const {
  PersistenceConfig p{};
  p.metrics_every_n_ticks = metrics_every_n_ticks;
  p.bottlenecks_every_n_ticks = bottlenecks_every_n_ticks;
  p.last_tick_write_every_ms = last_tick_write_every_ms;
  return p;
}

AdaptivePolicyConfig SimConfig::adaptive_policy() const {
  AdaptivePolicyConfig a = adaptive;
  a.global_max_depth_ceiling = clearing_max_depth;
  a.global_time_budget_ms_ceiling = clearing_time_budget_ms;
  return a.validated();
}

} // namespace mcsim
