#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "mcsim/events.hpp"
#include "mcsim/ledger.hpp"
#include "mcsim/scenario.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

class Run;

// Effects beyond this count in one event are ignored.
inline constexpr std::size_t kMaxInjectEffects = 500;

struct InjectResult {
  int applied{};
  int skipped{};
  Amount total_applied{}; // inject_debt only
  std::set<Currency> affected{};
  std::vector<Participant> added_participants{};
  std::vector<TrustLine> added_trustlines{};
  std::vector<Pid> frozen_participants{};
  std::vector<TrustLine> frozen_trustlines{};
  std::map<Currency, std::set<EdgeRef>> debt_lines{}; // (creditor, debtor)
};

// Applies the inject effects of one scenario event on the tick session and
// commits it. Every effect is idempotent and skipped on bad input.
class InjectExecutor {
public:
  explicit InjectExecutor(bool enabled = false) : enabled_(enabled) {}

  // nullopt when injects are disabled, the event has no effects, or the
  // commit failed (the session is then rolled back). On success the scenario
  // mirror, routing cache and drift history are updated and topology.changed
  // is published per affected currency.
  std::optional<InjectResult> apply(Run& run, ILedgerSession& session, const ScenarioEvent& ev,
                                    std::size_t event_index, Tick tick) const;

  bool enabled() const noexcept { return enabled_; }

private:
  bool enabled_{false};
};

} // namespace mcsim
