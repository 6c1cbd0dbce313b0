#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mcsim/scenario.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

// Diagnostic family of a ledger failure.
enum class LedgerErrorKind : uint8_t {
  Routing = 0,      // E001 no route, E002 no capacity
  TrustLine,        // E003 limit exceeded, E004 not active
  NotFound,
  BadRequest,
  Conflict,
  Unauthorized,
  Forbidden,
  InvalidSignature,
  Internal
};

struct LedgerError {
  LedgerErrorKind kind{LedgerErrorKind::Internal};
  std::string code{};     // "E001".."E009" where applicable
  int status_code{500};
  std::string message{};
};

std::string_view to_string(LedgerErrorKind k) noexcept;

class LedgerException : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class LedgerTimeout : public LedgerException {
public:
  using LedgerException::LedgerException;
};

// Structured failure carrying an HTTP-like status code.
class LedgerRejection : public LedgerException {
public:
  explicit LedgerRejection(LedgerError err)
    : LedgerException(err.message), err_(std::move(err)) {}

  const LedgerError& error() const noexcept { return err_; }

private:
  LedgerError err_;
};

struct PaymentRequest {
  Pid sender{};
  Pid receiver{};
  Currency currency{};
  Amount amount{};
  std::string idempotency_key{};
};

enum class PaymentStatus : uint8_t { Committed = 0, Rejected = 1 };

struct PaymentResult {
  PaymentStatus status{PaymentStatus::Rejected};
  std::string tx_id{};
  std::vector<Pid> route{};            // sender .. receiver
  std::optional<LedgerError> error{};  // set when rejected
};

// One hop of a debt cycle: `debtor` owes `creditor`.
struct DebtEdge {
  Pid debtor{};
  Pid creditor{};
  Amount amount{};
};

struct DebtRecord {
  Pid debtor{};
  Pid creditor{};
  Currency currency{};
  Amount amount{};
};

// A transactional view of the ledger. Not safe for concurrent use; callers
// sharing one session serialize access themselves.
class ILedgerSession {
public:
  virtual ~ILedgerSession() = default;

  virtual void commit() = 0;
  virtual void rollback() = 0;

  // Savepoints. release keeps the work, rollback discards it.
  virtual void begin_nested() = 0;
  virtual void release_nested() = 0;
  virtual void rollback_nested() = 0;

  // Creates participants, currencies, trust lines and seed debts that do not
  // exist yet.
  virtual void seed_from_scenario(const Scenario& s) = 0;

  // May throw LedgerTimeout or LedgerRejection.
  virtual PaymentResult attempt_payment(const PaymentRequest& req) = 0;

  // Reduces every edge of the cycle by `amount`. False if any edge has less.
  virtual bool settle_cycle(const Currency& eq, const std::vector<DebtEdge>& cycle, Amount amount) = 0;

  virtual std::vector<Participant> participants() = 0;
  virtual std::vector<Currency> equivalents() = 0;
  virtual std::vector<TrustLine> trustlines() = 0;
  virtual std::vector<DebtRecord> debts() = 0;

  virtual std::optional<Participant> find_participant(const Pid& pid) = 0;
  virtual std::optional<TrustLine> find_trustline(const Pid& from, const Pid& to, const Currency& eq) = 0;
  virtual Amount debt(const Pid& debtor, const Pid& creditor, const Currency& eq) = 0;

  virtual bool add_participant(const Participant& p) = 0;
  virtual bool add_trustline(const TrustLine& tl) = 0;
  virtual bool set_trustline_limit(const Pid& from, const Pid& to, const Currency& eq, Amount limit) = 0;
  virtual bool set_trustline_status(const Pid& from, const Pid& to, const Currency& eq, TrustLineStatus st) = 0;
  virtual bool set_participant_status(const Pid& pid, ParticipantStatus st) = 0;
  virtual void add_debt(const Pid& debtor, const Pid& creditor, const Currency& eq, Amount amount) = 0;
};

class ILedger {
public:
  virtual ~ILedger() = default;
  virtual std::unique_ptr<ILedgerSession> open_session() = 0;
};

// RAII savepoint: rolls back unless released.
class NestedScope {
public:
  explicit NestedScope(ILedgerSession& s) : s_(s) { s_.begin_nested(); }
  ~NestedScope() {
    if (!done_) {
      try {
        s_.rollback_nested();
      } catch (const std::exception&) {
        // the outer transaction still rolls back
      }
    }
  }

  NestedScope(const NestedScope&) = delete;
  NestedScope& operator=(const NestedScope&) = delete;

  void release() {
    s_.release_nested();
    done_ = true;
  }

private:
  ILedgerSession& s_;
  bool done_{false};
};

} // namespace mcsim
