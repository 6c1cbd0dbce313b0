#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mcsim/events.hpp"
#include "mcsim/ledger.hpp"
#include "mcsim/payment_planner.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

class Run;

struct EdgeStats {
  uint64_t attempts{};
  uint64_t committed{};
  uint64_t rejected{};
  uint64_t errors{};
  uint64_t timeouts{};
};

struct CurrencyStats {
  uint64_t committed{};
  uint64_t rejected{};
  uint64_t errors{};
  uint64_t timeouts{};
  double route_len_sum{};
  uint64_t route_len_n{};
};

struct PaymentsResult {
  int committed{};
  int rejected{};
  int errors{};
  int timeouts{};
  int64_t stall_ticks{};
  // set when execution stopped early because of the per-tick timeout ceiling
  std::optional<std::string> abort_code{};
  std::string abort_message{};
  std::map<Currency, CurrencyStats> per_currency{};
  std::map<Currency, std::map<EdgeRef, EdgeStats>> edge_stats{};
  std::map<Currency, std::map<std::string, int>> rejection_codes{};
};

struct ExecutorConfig {
  int max_in_flight{1};
  int max_timeouts_per_tick{5}; // 0 disables the ceiling
};

// Runs a planned batch against the shared session with bounded
// concurrency. Ledger calls are serialized; outcomes are emitted and
// counted strictly in sequence order.
class PaymentExecutor {
public:
  PaymentExecutor() = default;
  explicit PaymentExecutor(ExecutorConfig cfg) : cfg_(cfg) {}

  PaymentsResult execute(Run& run, ILedgerSession& session, const std::vector<PaymentIntent>& intents,
                         const std::set<Pid>& known_senders, const std::vector<Currency>& equivalents) const;

  // "sim:" + 16 hex digits over (run, tick, sender, receiver, currency, amount, seq)
  static std::string idempotency_key(const std::string& run_id, Tick tick, const PaymentIntent& p);

  const ExecutorConfig& config() const noexcept { return cfg_; }

private:
  ExecutorConfig cfg_{};
};

} // namespace mcsim
