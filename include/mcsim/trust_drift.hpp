#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

#include "mcsim/debt_snapshot.hpp"
#include "mcsim/events.hpp"
#include "mcsim/ledger.hpp"
#include "mcsim/scenario.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

struct EdgeClearingHistory {
  Amount original_limit{};
  int clearing_count{};
  Tick last_clearing_tick{-1};
  Amount cleared_volume{};
};

// Trust lines whose limit changed, per currency, as (creditor, debtor).
struct DriftResult {
  int updated_count{};
  std::map<Currency, std::vector<EdgeRef>> changed{};
};

// floor(a * m) in whole hundredths.
Amount scale_amount(Amount a, double m) noexcept;

// Grows limits of lines that took part in clearing and decays limits of
// chronically overloaded ones. Limits stay within
// [original * min_limit_ratio, original * max_growth].
class TrustDriftEngine {
public:
  using EdgeKey = std::tuple<Pid, Pid, Currency>; // (creditor, debtor, eq)

  // Records the config and the original limit of every scenario line that
  // has no history yet. Lines with limit <= 0 are skipped.
  void init(const TrustDriftConfig& cfg, const Scenario& s);

  // No-op if the line already has history.
  void add_history(const Pid& creditor, const Pid& debtor, const Currency& eq, Amount original_limit);

  // Runs on the clearing session; commits it when a limit changed.
  // `cleared` maps (creditor, debtor) to the volume cleared on that line.
  DriftResult apply_growth(ILedgerSession& session, ScenarioState& state, const Currency& eq,
                           const std::map<EdgeRef, Amount>& cleared, Tick tick);

  // Runs on the tick session; the caller commits.
  DriftResult apply_decay(ILedgerSession& session, ScenarioState& state, const DebtSnapshot& debts, Tick tick);

  // One topology.changed per currency with a non-empty patch. Best-effort.
  static void broadcast(EventBus& bus, ILedgerSession& session, const DriftResult& r, std::string_view reason);

  bool enabled() const;
  TrustDriftConfig config() const;
  std::optional<EdgeClearingHistory> history(const Pid& creditor, const Pid& debtor, const Currency& eq) const;
  std::size_t history_size() const;

private:
  mutable std::mutex mtx_;
  TrustDriftConfig cfg_{};
  std::map<EdgeKey, EdgeClearingHistory> history_{};
};

} // namespace mcsim
