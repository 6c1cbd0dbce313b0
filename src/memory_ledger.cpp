#include "mcsim/memory_ledger.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace mcsim {

std::string_view to_string(LedgerErrorKind k) noexcept {
  switch (k) {
    case LedgerErrorKind::Routing:          return "RoutingError";
    case LedgerErrorKind::TrustLine:        return "TrustLineError";
    case LedgerErrorKind::NotFound:         return "NotFound";
    case LedgerErrorKind::BadRequest:       return "BadRequest";
    case LedgerErrorKind::Conflict:         return "Conflict";
    case LedgerErrorKind::Unauthorized:     return "Unauthorized";
    case LedgerErrorKind::Forbidden:        return "Forbidden";
    case LedgerErrorKind::InvalidSignature: return "InvalidSignature";
    case LedgerErrorKind::Internal:         return "Internal";
  }
  return "Unknown";
}

namespace {

[[noreturn]] void reject(LedgerErrorKind kind, std::string code, int status, std::string message) {
  throw LedgerRejection(LedgerError{kind, std::move(code), status, std::move(message)});
}

Amount lookup(const std::map<LedgerState::EdgeKey, Amount>& m, const Pid& a, const Pid& b, const Currency& eq) {
  const auto it = m.find(LedgerState::EdgeKey{a, b, eq});
  return it == m.end() ? 0 : it->second;
}

} // namespace

class MemoryLedgerSession final : public ILedgerSession {
public:
  explicit MemoryLedgerSession(MemoryLedger& l) : l_(l) {}

  ~MemoryLedgerSession() override { release_(); }

  void commit() override {
    if (!active_) return;
    {
      std::lock_guard<std::mutex> lk(l_.state_mtx_);
      work_.version = l_.state_.version + 1;
      l_.state_ = std::move(work_);
    }
    release_();
  }

  void rollback() override { release_(); }

  void begin_nested() override {
    ensure_();
    nested_.push_back(work_);
  }

  void release_nested() override {
    if (nested_.empty()) throw LedgerException("release_nested without savepoint");
    nested_.pop_back();
  }

  void rollback_nested() override {
    if (nested_.empty()) throw LedgerException("rollback_nested without savepoint");
    work_ = std::move(nested_.back());
    nested_.pop_back();
  }

  void seed_from_scenario(const Scenario& s) override {
    ensure_();
    for (const auto& eq : s.equivalents) work_.equivalents.insert(eq);
    for (const auto& p : s.participants) {
      if (!p.id.empty()) work_.participants.emplace(p.id, p);
    }
    for (const auto& tl : s.trustlines) {
      if (tl.from.empty() || tl.to.empty() || tl.currency.empty()) continue;
      work_.equivalents.insert(tl.currency);
      work_.trustlines.emplace(LedgerState::EdgeKey{tl.from, tl.to, tl.currency}, tl);
    }
    for (const auto& d : s.seed_debts) {
      if (d.amount <= 0) continue;
      work_.debts.emplace(LedgerState::EdgeKey{d.debtor, d.creditor, d.currency}, d.amount);
    }
  }

  PaymentResult attempt_payment(const PaymentRequest& req) override {
    ensure_();

    MemoryLedger::PaymentHook hook;
    {
      std::lock_guard<std::mutex> lk(l_.state_mtx_);
      hook = l_.payment_hook_;
    }
    if (hook) hook(req);

    if (!req.idempotency_key.empty()) {
      const auto it = work_.idempotency.find(req.idempotency_key);
      if (it != work_.idempotency.end()) return it->second;
    }

    if (req.amount <= 0) reject(LedgerErrorKind::BadRequest, "E009", 400, "amount must be positive");
    if (!work_.equivalents.count(req.currency)) {
      reject(LedgerErrorKind::NotFound, "E008", 404, "equivalent not found: " + req.currency);
    }
    const auto s = work_.participants.find(req.sender);
    const auto r = work_.participants.find(req.receiver);
    if (s == work_.participants.end() || r == work_.participants.end()) {
      reject(LedgerErrorKind::NotFound, "E008", 404, "participant not found");
    }
    if (req.sender == req.receiver) reject(LedgerErrorKind::BadRequest, "E009", 400, "sender equals receiver");
    if (s->second.status != ParticipantStatus::Active || r->second.status != ParticipantStatus::Active) {
      reject(LedgerErrorKind::Forbidden, "E010", 403, "participant is not active");
    }

    auto path = find_path_(req.sender, req.receiver, req.currency, req.amount);
    if (path.empty()) {
      if (find_path_(req.sender, req.receiver, req.currency, 1).empty()) {
        reject(LedgerErrorKind::Routing, "E001", 400, "no route between participants");
      }
      reject(LedgerErrorKind::Routing, "E002", 400, "insufficient capacity");
    }

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
      transfer_(path[i], path[i + 1], req.currency, req.amount);
    }

    PaymentResult res{};
    res.status = PaymentStatus::Committed;
    res.tx_id = "tx-" + std::to_string(work_.next_tx++);
    res.route = std::move(path);
    if (!req.idempotency_key.empty()) work_.idempotency.emplace(req.idempotency_key, res);
    return res;
  }

  bool settle_cycle(const Currency& eq, const std::vector<DebtEdge>& cycle, Amount amount) override {
    ensure_();

    MemoryLedger::SettleHook hook;
    {
      std::lock_guard<std::mutex> lk(l_.state_mtx_);
      hook = l_.settle_hook_;
    }
    if (hook) hook(eq, cycle);

    if (amount <= 0 || cycle.size() < 2) return false;
    for (const auto& e : cycle) {
      if (lookup(work_.debts, e.debtor, e.creditor, eq) < amount) return false;
    }
    for (const auto& e : cycle) {
      auto it = work_.debts.find(LedgerState::EdgeKey{e.debtor, e.creditor, eq});
      it->second -= amount;
      if (it->second == 0) work_.debts.erase(it);
    }
    return true;
  }

  std::vector<Participant> participants() override {
    ensure_();
    std::vector<Participant> out;
    out.reserve(work_.participants.size());
    for (const auto& [pid, p] : work_.participants) out.push_back(p);
    return out;
  }

  std::vector<Currency> equivalents() override {
    ensure_();
    return {work_.equivalents.begin(), work_.equivalents.end()};
  }

  std::vector<TrustLine> trustlines() override {
    ensure_();
    std::vector<TrustLine> out;
    out.reserve(work_.trustlines.size());
    for (const auto& [k, tl] : work_.trustlines) out.push_back(tl);
    return out;
  }

  std::vector<DebtRecord> debts() override {
    ensure_();
    std::vector<DebtRecord> out;
    out.reserve(work_.debts.size());
    for (const auto& [k, amt] : work_.debts) {
      if (amt <= 0) continue;
      out.push_back(DebtRecord{std::get<0>(k), std::get<1>(k), std::get<2>(k), amt});
    }
    return out;
  }

  std::optional<Participant> find_participant(const Pid& pid) override {
    ensure_();
    const auto it = work_.participants.find(pid);
    if (it == work_.participants.end()) return std::nullopt;
    return it->second;
  }

  std::optional<TrustLine> find_trustline(const Pid& from, const Pid& to, const Currency& eq) override {
    ensure_();
    const auto it = work_.trustlines.find(LedgerState::EdgeKey{from, to, eq});
    if (it == work_.trustlines.end()) return std::nullopt;
    return it->second;
  }

  Amount debt(const Pid& debtor, const Pid& creditor, const Currency& eq) override {
    ensure_();
    return lookup(work_.debts, debtor, creditor, eq);
  }

  bool add_participant(const Participant& p) override {
    ensure_();
    if (p.id.empty()) return false;
    return work_.participants.emplace(p.id, p).second;
  }

  bool add_trustline(const TrustLine& tl) override {
    ensure_();
    if (!work_.participants.count(tl.from) || !work_.participants.count(tl.to)) return false;
    work_.equivalents.insert(tl.currency);
    return work_.trustlines.emplace(LedgerState::EdgeKey{tl.from, tl.to, tl.currency}, tl).second;
  }

  bool set_trustline_limit(const Pid& from, const Pid& to, const Currency& eq, Amount limit) override {
    ensure_();
    auto it = work_.trustlines.find(LedgerState::EdgeKey{from, to, eq});
    if (it == work_.trustlines.end() || it->second.limit == limit) return false;
    it->second.limit = limit;
    return true;
  }

  bool set_trustline_status(const Pid& from, const Pid& to, const Currency& eq, TrustLineStatus st) override {
    ensure_();
    auto it = work_.trustlines.find(LedgerState::EdgeKey{from, to, eq});
    if (it == work_.trustlines.end() || it->second.status == st) return false;
    it->second.status = st;
    return true;
  }

  bool set_participant_status(const Pid& pid, ParticipantStatus st) override {
    ensure_();
    auto it = work_.participants.find(pid);
    if (it == work_.participants.end() || it->second.status == st) return false;
    it->second.status = st;
    return true;
  }

  void add_debt(const Pid& debtor, const Pid& creditor, const Currency& eq, Amount amount) override {
    ensure_();
    if (amount <= 0) return;
    work_.debts[LedgerState::EdgeKey{debtor, creditor, eq}] += amount;
  }

private:
  void ensure_() {
    if (active_) return;
    if (!l_.writer_.try_lock_for(l_.opts_.lock_timeout)) {
      throw LedgerTimeout("ledger is locked by another session");
    }
    lock_ = std::unique_lock<std::timed_mutex>(l_.writer_, std::adopt_lock);
    {
      std::lock_guard<std::mutex> lk(l_.state_mtx_);
      work_ = l_.state_;
    }
    active_ = true;
  }

  void release_() noexcept {
    if (!active_) return;
    nested_.clear();
    work_ = LedgerState{};
    active_ = false;
    lock_.unlock();
  }

  // Amount `from` can push to `to`: pay down what `to` owes `from`, then
  // borrow on the trust line `to` extends to `from`.
  Amount capacity_(const Pid& from, const Pid& to, const Currency& eq) const {
    Amount cap = lookup(work_.debts, to, from, eq);
    const auto it = work_.trustlines.find(LedgerState::EdgeKey{to, from, eq});
    if (it != work_.trustlines.end() && it->second.status == TrustLineStatus::Active) {
      cap += std::max<Amount>(0, it->second.limit - lookup(work_.debts, from, to, eq));
    }
    return cap;
  }

  bool routable_(const Pid& pid) const {
    const auto it = work_.participants.find(pid);
    return it != work_.participants.end() && it->second.status == ParticipantStatus::Active;
  }

  // Shortest path whose every hop can carry `amount`. Empty when none.
  std::vector<Pid> find_path_(const Pid& src, const Pid& dst, const Currency& eq, Amount amount) const {
    std::map<Pid, std::set<Pid>> nbrs;
    for (const auto& [k, tl] : work_.trustlines) {
      if (std::get<2>(k) != eq) continue;
      nbrs[tl.to].insert(tl.from);
    }
    for (const auto& [k, amt] : work_.debts) {
      if (std::get<2>(k) != eq || amt <= 0) continue;
      nbrs[std::get<1>(k)].insert(std::get<0>(k));
    }

    std::map<Pid, Pid> parent;
    std::map<Pid, int> depth;
    std::deque<Pid> q;
    q.push_back(src);
    depth[src] = 0;

    while (!q.empty()) {
      const Pid cur = q.front();
      q.pop_front();
      if (cur == dst) break;
      if (depth[cur] >= l_.opts_.max_route_hops) continue;

      const auto it = nbrs.find(cur);
      if (it == nbrs.end()) continue;
      for (const auto& nxt : it->second) {
        if (depth.count(nxt)) continue;
        if (nxt != dst && !routable_(nxt)) continue;
        if (capacity_(cur, nxt, eq) < amount) continue;
        depth[nxt] = depth[cur] + 1;
        parent[nxt] = cur;
        q.push_back(nxt);
      }
    }

    if (!depth.count(dst)) return {};
    std::vector<Pid> path{dst};
    while (path.back() != src) path.push_back(parent[path.back()]);
    std::reverse(path.begin(), path.end());
    return path;
  }

  void transfer_(const Pid& from, const Pid& to, const Currency& eq, Amount amount) {
    Amount rest = amount;
    auto back = work_.debts.find(LedgerState::EdgeKey{to, from, eq});
    if (back != work_.debts.end()) {
      const Amount r = std::min(back->second, rest);
      back->second -= r;
      rest -= r;
      if (back->second == 0) work_.debts.erase(back);
    }
    if (rest > 0) work_.debts[LedgerState::EdgeKey{from, to, eq}] += rest;
  }

  MemoryLedger& l_;
  std::unique_lock<std::timed_mutex> lock_{};
  bool active_{false};
  LedgerState work_{};
  std::vector<LedgerState> nested_{};
};

MemoryLedger::MemoryLedger(MemoryLedgerOptions opts) : opts_(opts) {}

std::unique_ptr<ILedgerSession> MemoryLedger::open_session() {
  return std::make_unique<MemoryLedgerSession>(*this);
}

void MemoryLedger::set_payment_hook(PaymentHook h) {
  std::lock_guard<std::mutex> lk(state_mtx_);
  payment_hook_ = std::move(h);
}

void MemoryLedger::set_settle_hook(SettleHook h) {
  std::lock_guard<std::mutex> lk(state_mtx_);
  settle_hook_ = std::move(h);
}

LedgerState MemoryLedger::committed() const {
  std::lock_guard<std::mutex> lk(state_mtx_);
  return state_;
}

Amount MemoryLedger::committed_debt(const Pid& debtor, const Pid& creditor, const Currency& eq) const {
  std::lock_guard<std::mutex> lk(state_mtx_);
  return lookup(state_.debts, debtor, creditor, eq);
}

} // namespace mcsim
