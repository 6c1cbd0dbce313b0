#include "mcsim/trust_drift.hpp"

#include <algorithm>
#include <cmath>

#include "mcsim/log.hpp"
#include "mcsim/patches.hpp"

namespace mcsim {

Amount scale_amount(Amount a, double m) noexcept {
  const double v = static_cast<double>(a) * m;
  if (!std::isfinite(v) || v <= 0.0) return 0;
  return static_cast<Amount>(std::floor(v + 1e-7));
}

void TrustDriftEngine::init(const TrustDriftConfig& cfg, const Scenario& s) {
  std::lock_guard<std::mutex> lk(mtx_);
  cfg_ = cfg;
  for (const auto& tl : s.trustlines) {
    if (tl.from.empty() || tl.to.empty() || tl.currency.empty() || tl.limit <= 0) continue;
    history_.emplace(EdgeKey{tl.from, tl.to, tl.currency}, EdgeClearingHistory{tl.limit});
  }

  if (cfg_.enabled) {
    MCSIM_LOG_INFO("trust_drift.init edges=" << history_.size() << " growth_rate=" << cfg_.growth_rate
                   << " decay_rate=" << cfg_.decay_rate << " max_growth=" << cfg_.max_growth
                   << " min_limit_ratio=" << cfg_.min_limit_ratio
                   << " overload_threshold=" << cfg_.overload_threshold);
  }
}

void TrustDriftEngine::add_history(const Pid& creditor, const Pid& debtor, const Currency& eq, Amount original_limit) {
  if (original_limit <= 0) return;
  std::lock_guard<std::mutex> lk(mtx_);
  history_.emplace(EdgeKey{creditor, debtor, eq}, EdgeClearingHistory{original_limit});
}

DriftResult TrustDriftEngine::apply_growth(ILedgerSession& session, ScenarioState& state, const Currency& eq,
                                           const std::map<EdgeRef, Amount>& cleared, Tick tick) {
  DriftResult res{};
  std::vector<LimitUpdate> updates;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!cfg_.enabled || cleared.empty()) return res;

    for (const auto& [edge, volume] : cleared) {
      const auto& [creditor, debtor] = edge;
      auto it = history_.find(EdgeKey{creditor, debtor, eq});
      if (it == history_.end()) continue;

      auto& h = it->second;
      ++h.clearing_count;
      h.last_clearing_tick = tick;
      h.cleared_volume += std::max<Amount>(0, volume);

      const auto tl = session.find_trustline(creditor, debtor, eq);
      if (!tl) continue;

      const Amount cur = tl->limit;
      const Amount next = std::min(scale_amount(cur, 1.0 + cfg_.growth_rate),
                                   scale_amount(h.original_limit, cfg_.max_growth));
      if (next == cur) continue;

      session.set_trustline_limit(creditor, debtor, eq, next);
      updates.push_back(LimitUpdate{creditor, debtor, eq, next});
      res.changed[eq].emplace_back(creditor, debtor);
      ++res.updated_count;
      MCSIM_LOG_INFO("trust_drift.growth key=" << creditor << ':' << debtor << ':' << eq
                     << " old=" << format_amount(cur) << " new=" << format_amount(next));
    }
  }

  if (res.updated_count > 0) {
    session.commit();
    state.set_trustline_limits(updates);
  }
  return res;
}

DriftResult TrustDriftEngine::apply_decay(ILedgerSession& session, ScenarioState& state, const DebtSnapshot& debts,
                                          Tick tick) {
  DriftResult res{};
  std::vector<LimitUpdate> updates;
  const auto scenario = state.snapshot();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!cfg_.enabled) return res;

    for (const auto& tl : scenario->trustlines) {
      if (tl.status != TrustLineStatus::Active || tl.limit <= 0) continue;

      const auto it = history_.find(EdgeKey{tl.from, tl.to, tl.currency});
      if (it == history_.end()) continue;
      const auto& h = it->second;
      if (h.last_clearing_tick == tick) continue;

      const Amount debt = debts.get(tl.to, tl.from, tl.currency);
      const double ratio = static_cast<double>(debt) / static_cast<double>(tl.limit);
      if (ratio < cfg_.overload_threshold) continue;

      const Amount next = std::max(scale_amount(tl.limit, 1.0 - cfg_.decay_rate),
                                   scale_amount(h.original_limit, cfg_.min_limit_ratio));
      if (next == tl.limit) continue;

      if (!session.set_trustline_limit(tl.from, tl.to, tl.currency, next)) continue;
      updates.push_back(LimitUpdate{tl.from, tl.to, tl.currency, next});
      res.changed[tl.currency].emplace_back(tl.from, tl.to);
      ++res.updated_count;
      MCSIM_LOG_INFO("trust_drift.decay key=" << tl.from << ':' << tl.to << ':' << tl.currency
                     << " old=" << format_amount(tl.limit) << " new=" << format_amount(next)
                     << " ratio=" << ratio);
    }
  }

  if (!updates.empty()) state.set_trustline_limits(updates);
  return res;
}

void TrustDriftEngine::broadcast(EventBus& bus, ILedgerSession& session, const DriftResult& r,
                                 std::string_view reason) {
  for (const auto& [eq, lines] : r.changed) {
    try {
      TopologyChanged ev{};
      ev.currency = eq;
      ev.reason = std::string(reason);
      ev.edges = trustline_patches(session, eq, lines);
      if (ev.edges.empty()) {
        MCSIM_LOG_DEBUG("trust_drift.topology_changed_skipped_empty eq=" << eq << " reason=" << reason);
        continue;
      }
      const auto n = ev.edges.size();
      bus.publish(std::move(ev));
      MCSIM_LOG_INFO("trust_drift.topology_changed eq=" << eq << " reason=" << reason << " edges=" << n);
    } catch (const std::exception& e) {
      MCSIM_LOG_WARN("trust_drift.topology_changed_broadcast_error eq=" << eq << " reason=" << reason
                     << " err=" << e.what());
    }
  }
}

bool TrustDriftEngine::enabled() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cfg_.enabled;
}

TrustDriftConfig TrustDriftEngine::config() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cfg_;
}

std::optional<EdgeClearingHistory> TrustDriftEngine::history(const Pid& creditor, const Pid& debtor,
                                                              const Currency& eq) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const auto it = history_.find(EdgeKey{creditor, debtor, eq});
  if (it == history_.end()) return std::nullopt;
  return it->second;
}

std::size_t TrustDriftEngine::history_size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return history_.size();
}

} // namespace mcsim
