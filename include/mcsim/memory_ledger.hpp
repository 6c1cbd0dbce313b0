#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "mcsim/ledger.hpp"

namespace mcsim {

// Committed state of the in-memory ledger.
struct LedgerState {
  using EdgeKey = std::tuple<Pid, Pid, Currency>; // (from, to, eq) or (debtor, creditor, eq)

  std::map<Pid, Participant> participants{};
  std::set<Currency> equivalents{};
  std::map<EdgeKey, TrustLine> trustlines{};
  std::map<EdgeKey, Amount> debts{};
  std::map<std::string, PaymentResult> idempotency{};
  uint64_t next_tx{1};
  uint64_t version{0};
};

struct MemoryLedgerOptions {
  // How long a session waits for the single writer slot.
  std::chrono::milliseconds lock_timeout{2000};
  // Longest route considered by payment routing, in hops.
  int max_route_hops{6};
};

// Reference ledger: one writer at a time, whole-state snapshots for
// transactions and savepoints, breadth-first single-path routing.
class MemoryLedger : public ILedger {
public:
  // Hooks run inside the session before the ledger operation. They may sleep
  // or throw LedgerTimeout / LedgerRejection.
  using PaymentHook = std::function<void(const PaymentRequest&)>;
  using SettleHook = std::function<void(const Currency&, const std::vector<DebtEdge>&)>;

  explicit MemoryLedger(MemoryLedgerOptions opts = {});

  std::unique_ptr<ILedgerSession> open_session() override;

  void set_payment_hook(PaymentHook h);
  void set_settle_hook(SettleHook h);

  // Reads of committed state, outside any session.
  LedgerState committed() const;
  Amount committed_debt(const Pid& debtor, const Pid& creditor, const Currency& eq) const;

  const MemoryLedgerOptions& options() const noexcept { return opts_; }

private:
  friend class MemoryLedgerSession;

  MemoryLedgerOptions opts_{};
  std::timed_mutex writer_;

  mutable std::mutex state_mtx_;
  LedgerState state_{};
  PaymentHook payment_hook_{};
  SettleHook settle_hook_{};
};

} // namespace mcsim
