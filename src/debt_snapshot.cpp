#include "mcsim/debt_snapshot.hpp"

#include "mcsim/log.hpp"

namespace mcsim {

DebtSnapshot DebtSnapshot::from_records(const std::vector<DebtRecord>& records) {
  DebtSnapshot s{};
  for (const auto& r : records) s.add(r.debtor, r.creditor, r.currency, r.amount);
  return s;
}

void DebtSnapshot::add(const Pid& debtor, const Pid& creditor, const Currency& eq, Amount amount) {
  if (amount <= 0) return;
  debts_[{debtor, creditor, eq}] += amount;
  out_[{debtor, eq}] += amount;
  in_[{creditor, eq}] += amount;
  total_[eq] += amount;
}

Amount DebtSnapshot::get(const Pid& debtor, const Pid& creditor, const Currency& eq) const noexcept {
  const auto it = debts_.find(std::make_tuple(debtor, creditor, eq));
  return it == debts_.end() ? 0 : it->second;
}

Amount DebtSnapshot::outgoing_total(const Pid& debtor, const Currency& eq) const noexcept {
  const auto it = out_.find(std::make_pair(debtor, eq));
  return it == out_.end() ? 0 : it->second;
}

Amount DebtSnapshot::incoming_total(const Pid& creditor, const Currency& eq) const noexcept {
  const auto it = in_.find(std::make_pair(creditor, eq));
  return it == in_.end() ? 0 : it->second;
}

Amount DebtSnapshot::currency_total(const Currency& eq) const noexcept {
  const auto it = total_.find(eq);
  return it == total_.end() ? 0 : it->second;
}

DebtSnapshot load_debt_snapshot(ILedgerSession& session) {
  try {
    return DebtSnapshot::from_records(session.debts());
  } catch (const std::exception& e) {
    MCSIM_LOG_WARN("debt_snapshot.load_failed err=" << e.what());
    return DebtSnapshot{};
  }
}

} // namespace mcsim
