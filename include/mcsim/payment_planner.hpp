#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcsim/debt_snapshot.hpp"
#include "mcsim/rng.hpp"
#include "mcsim/routing_cache.hpp"
#include "mcsim/scenario.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

struct PaymentIntent {
  int seq{};           // 0-based, contiguous within a tick
  Currency currency{};
  Pid sender{};        // debtor side
  Pid receiver{};      // creditor side
  Amount amount{};
};

inline bool operator==(const PaymentIntent& a, const PaymentIntent& b) noexcept {
  return a.seq == b.seq && a.currency == b.currency && a.sender == b.sender &&
         a.receiver == b.receiver && a.amount == b.amount;
}

struct PlannerConfig {
  int actions_per_tick_max{20};
  std::optional<Amount> amount_cap{};
};

// Run-side inputs of one planning call.
struct PlanContext {
  uint64_t seed{};
  Tick tick{};
  SimMs sim_ms{};
  int intensity_percent{};
};

struct StressMultipliers {
  double all{1.0};
  std::map<std::string, double> by_group{};
  std::map<std::string, double> by_profile{};
};

// Trust line inverted to payment direction.
struct Candidate {
  Currency currency{};
  Pid sender{};
  Pid receiver{};
  Amount limit{};
};

class PaymentPlanner {
public:
  PaymentPlanner() = default;
  explicit PaymentPlanner(PlannerConfig cfg) : cfg_(cfg) {}

  // Deterministic for fixed (ctx, scenario, snapshot). Graphs are built
  // from the scenario on the fly.
  std::vector<PaymentIntent> plan(const PlanContext& ctx, const Scenario& scenario,
                                  const DebtSnapshot* snapshot) const;

  // Same, with payment graphs taken from the run's routing cache.
  std::vector<PaymentIntent> plan(const PlanContext& ctx, const std::shared_ptr<const Scenario>& scenario,
                                  const DebtSnapshot* snapshot, RoutingCache& cache) const;

  // Samples an amount in (0, cap] where cap = min(limit, global cap, model max).
  std::optional<Amount> pick_amount(Rng& rng, Amount limit, const AmountModel* model) const;

  static uint64_t tick_seed(uint64_t run_seed, Tick tick) noexcept;
  static uint64_t action_seed(uint64_t tick_seed, int64_t i) noexcept;

  static double effective_intensity(const Scenario& s, Tick tick, int intensity_percent) noexcept;
  static StressMultipliers stress_multipliers(const Scenario& s, SimMs sim_ms);
  static std::vector<Candidate> candidates(const Scenario& s);

  const PlannerConfig& config() const noexcept { return cfg_; }
  PlannerConfig& config_mut() noexcept { return cfg_; }

private:
  using GraphFn = std::function<std::shared_ptr<const Adjacency>(const Currency&)>;

  std::vector<PaymentIntent> plan_(const PlanContext& ctx, const Scenario& scenario,
                                   const DebtSnapshot* snapshot, const GraphFn& graph) const;

  PlannerConfig cfg_{};
};

} // namespace mcsim
