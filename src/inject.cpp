#include "mcsim/inject.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

#include "mcsim/log.hpp"
#include "mcsim/patches.hpp"
#include "mcsim/run.hpp"

namespace mcsim {

namespace {

// Effects that leave the currency empty use the scenario's first one.
Currency effective_currency(const Scenario& s, const Currency& eq) {
  if (!eq.empty()) return eq;
  return s.equivalents.empty() ? Currency{} : s.equivalents.front();
}

bool known_currency(ILedgerSession& session, const Currency& eq) {
  const auto eqs = session.equivalents();
  return std::find(eqs.begin(), eqs.end(), eq) != eqs.end();
}

class EffectApplier {
public:
  EffectApplier(ILedgerSession& session, const Scenario& scenario, std::optional<Amount> max_total)
    : session_(session), scenario_(scenario), max_total_(max_total) {}

  // A failing effect is rolled back on its own and counted as skipped.
  void apply(const InjectEffect& eff, std::size_t index) {
    const InjectResult before = res_;
    try {
      NestedScope scope(session_);
      const bool ok = std::visit([&](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, InjectDebt>) {
          return inject_debt_(x);
        } else if constexpr (std::is_same_v<T, AddParticipant>) {
          return add_participant_(x);
        } else if constexpr (std::is_same_v<T, CreateTrustLine>) {
          return create_trustline_(x);
        } else {
          return freeze_participant_(x);
        }
      }, eff);
      scope.release();
      if (ok) {
        ++res_.applied;
      } else {
        ++res_.skipped;
      }
    } catch (const std::exception& e) {
      res_ = before;
      ++res_.skipped;
      MCSIM_LOG_WARN("inject.effect_failed index=" << index << " err=" << e.what());
    }
  }

  InjectResult take() { return std::move(res_); }

private:
  bool inject_debt_(const InjectDebt& x) {
    const Currency eq = effective_currency(scenario_, x.currency);
    if (eq.empty() || x.creditor.empty() || x.debtor.empty()) return false;

    const Amount amount = trunc2(x.amount);
    if (amount <= 0) return false;
    if (max_total_ && res_.total_applied + amount > *max_total_) return false;

    const auto tl = session_.find_trustline(x.creditor, x.debtor, eq);
    if (!tl || tl->status != TrustLineStatus::Active || tl->limit <= 0) return false;
    if (session_.debt(x.debtor, x.creditor, eq) + amount > tl->limit) return false;

    session_.add_debt(x.debtor, x.creditor, eq, amount);
    res_.total_applied += amount;
    res_.affected.insert(eq);
    res_.debt_lines[eq].insert(EdgeRef{x.creditor, x.debtor});
    return true;
  }

  bool add_participant_(const AddParticipant& x) {
    const Participant& p = x.participant;
    if (p.id.empty()) return false;
    if (session_.find_participant(p.id)) {
      MCSIM_LOG_INFO("inject.add_participant.skip_exists pid=" << p.id);
      return false;
    }

    Participant np = p;
    if (np.name.empty()) np.name = np.id;
    if (!session_.add_participant(np)) return false;
    res_.added_participants.push_back(np);

    for (const auto& itl : x.initial_trustlines) {
      const Currency eq = effective_currency(scenario_, itl.currency);
      const Amount limit = trunc2(itl.limit);
      if (itl.sponsor.empty() || eq.empty() || limit <= 0) continue;
      if (!session_.find_participant(itl.sponsor)) {
        MCSIM_LOG_WARN("inject.add_participant.sponsor_not_found sponsor=" << itl.sponsor);
        continue;
      }
      if (!known_currency(session_, eq)) continue;

      TrustLine tl{};
      if (itl.direction == SponsorDirection::SponsorCreditsNew) {
        tl.from = itl.sponsor;
        tl.to = np.id;
      } else {
        tl.from = np.id;
        tl.to = itl.sponsor;
      }
      tl.currency = eq;
      tl.limit = limit;
      if (session_.find_trustline(tl.from, tl.to, eq)) continue;
      if (!session_.add_trustline(tl)) continue;

      res_.affected.insert(eq);
      res_.added_trustlines.push_back(tl);
    }
    return true;
  }

  bool create_trustline_(const CreateTrustLine& x) {
    const Currency eq = effective_currency(scenario_, x.currency);
    if (x.from.empty() || x.to.empty() || eq.empty()) return false;
    const Amount limit = trunc2(x.limit);
    if (limit <= 0) return false;

    if (!session_.find_participant(x.from)) {
      MCSIM_LOG_WARN("inject.create_trustline.from_not_found pid=" << x.from);
      return false;
    }
    if (!session_.find_participant(x.to)) {
      MCSIM_LOG_WARN("inject.create_trustline.to_not_found pid=" << x.to);
      return false;
    }
    if (!known_currency(session_, eq)) return false;
    if (session_.find_trustline(x.from, x.to, eq)) {
      MCSIM_LOG_INFO("inject.create_trustline.skip_exists from=" << x.from << " to=" << x.to << " eq=" << eq);
      return false;
    }

    TrustLine tl{x.from, x.to, eq, limit, TrustLineStatus::Active};
    if (!session_.add_trustline(tl)) return false;
    res_.affected.insert(eq);
    res_.added_trustlines.push_back(tl);
    return true;
  }

  bool freeze_participant_(const FreezeParticipant& x) {
    if (x.participant_id.empty()) return false;
    const auto p = session_.find_participant(x.participant_id);
    if (!p) {
      MCSIM_LOG_WARN("inject.freeze_participant.not_found pid=" << x.participant_id);
      return false;
    }
    if (p->status == ParticipantStatus::Suspended) {
      MCSIM_LOG_INFO("inject.freeze_participant.already_suspended pid=" << x.participant_id);
      return false;
    }

    session_.set_participant_status(x.participant_id, ParticipantStatus::Suspended);
    for (const auto& tl : session_.trustlines()) {
      if (tl.from != x.participant_id && tl.to != x.participant_id) continue;
      res_.affected.insert(tl.currency);
      if (!x.freeze_trustlines || tl.status != TrustLineStatus::Active) continue;
      session_.set_trustline_status(tl.from, tl.to, tl.currency, TrustLineStatus::Frozen);
      TrustLine frozen = tl;
      frozen.status = TrustLineStatus::Frozen;
      res_.frozen_trustlines.push_back(std::move(frozen));
    }
    res_.frozen_participants.push_back(x.participant_id);
    return true;
  }

  ILedgerSession& session_;
  const Scenario& scenario_;
  std::optional<Amount> max_total_;
  InjectResult res_{};
};

void patch_scenario(Run& run, const InjectResult& r) {
  auto& state = run.scenario();
  for (const auto& p : r.added_participants) state.add_participant(p);
  for (const auto& tl : r.added_trustlines) {
    state.add_trustline(tl);
    run.drift().add_history(tl.from, tl.to, tl.currency, tl.limit);
  }
  for (const auto& pid : r.frozen_participants) state.set_participant_status(pid, ParticipantStatus::Suspended);
  for (const auto& tl : r.frozen_trustlines) state.set_trustline_status(tl.from, tl.to, tl.currency, tl.status);
  for (const auto& eq : r.affected) run.routing().invalidate(eq);
}

void broadcast(Run& run, ILedgerSession& session, const InjectResult& r, Tick tick) {
  std::vector<Pid> nodes;
  for (const auto& p : r.added_participants) nodes.push_back(p.id);
  nodes.insert(nodes.end(), r.frozen_participants.begin(), r.frozen_participants.end());

  for (const auto& eq : r.affected) {
    std::set<EdgeRef> lines;
    for (const auto& tl : r.added_trustlines) {
      if (tl.currency == eq) lines.insert(EdgeRef{tl.from, tl.to});
    }
    for (const auto& tl : r.frozen_trustlines) {
      if (tl.currency == eq) lines.insert(EdgeRef{tl.from, tl.to});
    }
    const auto it = r.debt_lines.find(eq);
    if (it != r.debt_lines.end()) lines.insert(it->second.begin(), it->second.end());

    try {
      TopologyChanged tc{};
      tc.currency = eq;
      tc.reason = "inject";
      tc.edges = trustline_patches(session, eq, {lines.begin(), lines.end()});
      tc.nodes = node_patches(session, eq, nodes);
      if (tc.edges.empty() && tc.nodes.empty()) continue;

      MCSIM_LOG_INFO("inject.topology_changed run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                     << " nodes=" << tc.nodes.size() << " edges=" << tc.edges.size());
      if (run.events().publish(std::move(tc)) != 0) {
        run.locked([](RunStats& s) { s.last_event_type = "topology.changed"; });
      }
    } catch (const std::exception& e) {
      MCSIM_LOG_WARN("inject.topology_changed_failed run_id=" << run.id() << " eq=" << eq << " err=" << e.what());
    }
  }
}

} // namespace

std::optional<InjectResult> InjectExecutor::apply(Run& run, ILedgerSession& session, const ScenarioEvent& ev,
                                                  std::size_t event_index, Tick tick) const {
  if (!enabled_) {
    MCSIM_LOG_INFO("inject.skipped run_id=" << run.id() << " tick=" << tick << " event_index=" << event_index
                   << " reason=disabled");
    return std::nullopt;
  }
  if (ev.inject.empty()) return std::nullopt;

  std::optional<Amount> max_total;
  if (ev.max_total_amount) {
    const Amount m = trunc2(*ev.max_total_amount);
    if (m > 0) max_total = m;
  }

  const auto scenario = run.scenario().snapshot();
  EffectApplier applier(session, *scenario, max_total);
  const std::size_t n = std::min(ev.inject.size(), kMaxInjectEffects);
  for (std::size_t i = 0; i < n; ++i) applier.apply(ev.inject[i], i);
  InjectResult res = applier.take();

  try {
    session.commit();
  } catch (const std::exception& e) {
    session.rollback();
    MCSIM_LOG_WARN("inject.commit_failed run_id=" << run.id() << " tick=" << tick << " event_index=" << event_index
                   << " err=" << e.what());
    return std::nullopt;
  }

  patch_scenario(run, res);
  broadcast(run, session, res, tick);

  MCSIM_LOG_INFO("inject.applied run_id=" << run.id() << " tick=" << tick << " event_index=" << event_index
                 << " applied=" << res.applied << " skipped=" << res.skipped
                 << " total_amount=" << format_amount(res.total_applied));
  return res;
}

} // namespace mcsim
