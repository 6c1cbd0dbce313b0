#pragma once
#include <map>
#include <tuple>
#include <utility>

#include "mcsim/ledger.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

// Point-in-time debt per (debtor, creditor, currency) with per-participant
// totals. Rebuilt every tick.
class DebtSnapshot {
public:
  DebtSnapshot() = default;

  static DebtSnapshot from_records(const std::vector<DebtRecord>& records);

  void add(const Pid& debtor, const Pid& creditor, const Currency& eq, Amount amount);

  Amount get(const Pid& debtor, const Pid& creditor, const Currency& eq) const noexcept;
  Amount outgoing_total(const Pid& debtor, const Currency& eq) const noexcept;
  Amount incoming_total(const Pid& creditor, const Currency& eq) const noexcept;
  Amount currency_total(const Currency& eq) const noexcept;

  bool empty() const noexcept { return debts_.empty(); }
  std::size_t size() const noexcept { return debts_.size(); }

private:
  std::map<std::tuple<Pid, Pid, Currency>, Amount> debts_{};
  std::map<std::pair<Pid, Currency>, Amount> out_{};
  std::map<std::pair<Pid, Currency>, Amount> in_{};
  std::map<Currency, Amount> total_{};
};

// Loads the current debts through the session. A failed load yields an
// empty snapshot and a warning; planning then runs without capacity data.
DebtSnapshot load_debt_snapshot(ILedgerSession& session);

} // namespace mcsim
