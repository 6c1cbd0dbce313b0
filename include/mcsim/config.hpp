#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "mcsim/clearing_engine.hpp"
#include "mcsim/clearing_policy.hpp"
#include "mcsim/payment_executor.hpp"
#include "mcsim/payment_planner.hpp"
#include "mcsim/tick_metrics.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

enum class ClearingPolicyKind : uint8_t { Static = 0, Adaptive };

std::string_view to_string(ClearingPolicyKind k) noexcept;

struct SimConfig {
  // planning
  int actions_per_tick_max{20};
  std::optional<Amount> amount_cap{};
  SimMs tick_ms{1000};

  // clearing
  ClearingPolicyKind clearing_policy{ClearingPolicyKind::Static};
  int clearing_every_n_ticks{25}; // 0 disables static clearing
  int clearing_max_depth{6};
  int clearing_time_budget_ms{250};
  double clearing_hard_timeout_sec{8.0};
  int clearing_max_fx_edges{30};
  AdaptivePolicyConfig adaptive{};

  // execution and failure ceilings, 0 disables a ceiling
  int max_in_flight{1};
  int max_timeouts_per_tick{5};
  int max_errors_total{200};
  int max_consec_tick_failures{3};

  bool enable_inject{false};

  // persistence throttling
  int metrics_every_n_ticks{5};
  int bottlenecks_every_n_ticks{10};
  int64_t last_tick_write_every_ms{500};

  // Overlays MCSIM_* environment variables on the defaults. Malformed
  // values keep the default and log a warning.
  static SimConfig from_env();

  PlannerConfig planner() const;
  ExecutorConfig executor() const;
  ClearingOptions clearing() const;
  PersistenceConfig persistence() const;
  // Adaptive bounds with the static depth and budget as ceilings.
  AdaptivePolicyConfig adaptive_policy() const;
};

} // namespace mcsim
