#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "mcsim/events.hpp"
#include "mcsim/ledger.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

class Run;

// Closed chain of debts: edges[i].creditor == edges[i+1].debtor, last
// creditor == first debtor.
struct DebtCycle {
  std::vector<DebtEdge> edges{};

  Amount min_amount() const noexcept;
};

// Every simple debt cycle of at most `max_depth` edges, each reported once.
// Ordered by clearable amount (desc), then length, then participant ids.
std::vector<DebtCycle> find_cycles(const std::vector<DebtRecord>& debts, const Currency& eq, int max_depth);
std::vector<DebtCycle> find_cycles(ILedgerSession& s, const Currency& eq, int max_depth);

struct ClearingOptions {
  int max_depth{6};
  int time_budget_ms{250}; // 0 = unbounded
  int max_fx_edges{30};    // cap on highlighted edges in the plan
  int max_cycles{100};
  int yield_every{5};
};

struct ClearingResult {
  Currency currency{};
  std::string plan_id{};
  int cleared_cycles{};
  Amount cleared_amount{};
  std::set<Pid> touched_nodes{};
  std::map<EdgeRef, Amount> touched_edges{}; // (creditor, debtor) -> cleared on that line
  bool budget_exceeded{false};
  bool cancelled{false};
  double elapsed_ms{};
};

// Settles debt cycles per currency on its own ledger session, one cycle per
// commit, until none remain or a budget runs out.
class ClearingEngine {
public:
  explicit ClearingEngine(ClearingOptions opts = {}) : opts_(opts) {}

  // Throws whatever the ledger throws.
  ClearingResult clear(Run& run, ILedger& ledger, const Currency& eq, Tick tick,
                       const std::atomic<bool>* cancel = nullptr) const;

  // A failing currency is logged, counted as CLEARING_ERROR and skipped.
  std::map<Currency, ClearingResult> clear_all(Run& run, ILedger& ledger, const std::vector<Currency>& eqs, Tick tick,
                                               const std::atomic<bool>* cancel = nullptr) const;

  // Seed of the cycle choice; the plan event and the first settlement use it.
  static uint64_t choice_seed(const std::string& run_id, Tick tick, const Currency& eq);

  const ClearingOptions& options() const noexcept { return opts_; }

private:
  ClearingOptions opts_{};
};

} // namespace mcsim
