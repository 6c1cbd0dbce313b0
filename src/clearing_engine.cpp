#include "mcsim/clearing_engine.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "mcsim/hash.hpp"
#include "mcsim/log.hpp"
#include "mcsim/patches.hpp"
#include "mcsim/rng.hpp"
#include "mcsim/run.hpp"

namespace mcsim {

namespace {

// Bounds the search on dense graphs.
constexpr std::size_t kMaxCandidates = 1000;

using SteadyClock = std::chrono::steady_clock;

double ms_since(SteadyClock::time_point t0) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - t0).count();
}

// DFS that reports each cycle from its smallest participant id only.
class CycleSearch {
public:
  CycleSearch(std::map<Pid, std::vector<std::pair<Pid, Amount>>> out, int max_depth)
    : out_(std::move(out)), max_depth_(static_cast<std::size_t>(max_depth)) {}

  std::vector<DebtCycle> run() {
    for (const auto& [start, nbrs] : out_) {
      start_ = &start;
      on_path_.insert(start);
      visit_(start);
      on_path_.erase(start);
      if (found_.size() >= kMaxCandidates) break;
    }
    return std::move(found_);
  }

private:
  void visit_(const Pid& node) {
    const auto it = out_.find(node);
    if (it == out_.end()) return;
    for (const auto& [next, amount] : it->second) {
      if (found_.size() >= kMaxCandidates) return;
      if (next < *start_) continue;
      if (next == *start_) {
        path_.push_back(DebtEdge{node, next, amount});
        found_.push_back(DebtCycle{path_});
        path_.pop_back();
        continue;
      }
      if (on_path_.count(next) || path_.size() + 2 > max_depth_) continue;

      path_.push_back(DebtEdge{node, next, amount});
      on_path_.insert(next);
      visit_(next);
      on_path_.erase(next);
      path_.pop_back();
    }
  }

  std::map<Pid, std::vector<std::pair<Pid, Amount>>> out_;
  std::size_t max_depth_;
  const Pid* start_{nullptr};
  std::vector<DebtEdge> path_{};
  std::set<Pid> on_path_{};
  std::vector<DebtCycle> found_{};
};

bool cycle_less(const DebtCycle& a, const DebtCycle& b) {
  const Amount ma = a.min_amount();
  const Amount mb = b.min_amount();
  if (ma != mb) return ma > mb;
  if (a.edges.size() != b.edges.size()) return a.edges.size() < b.edges.size();
  return std::lexicographical_compare(a.edges.begin(), a.edges.end(), b.edges.begin(), b.edges.end(),
                                      [](const DebtEdge& x, const DebtEdge& y) {
                                        if (x.debtor != y.debtor) return x.debtor < y.debtor;
                                        return x.creditor < y.creditor;
                                      });
}

std::vector<EdgeRef> plan_edges(const DebtCycle& c, int max_fx_edges) {
  std::vector<EdgeRef> out;
  for (const auto& e : c.edges) out.emplace_back(e.debtor, e.creditor);
  if (max_fx_edges > 0 && out.size() > static_cast<std::size_t>(max_fx_edges)) {
    out.resize(static_cast<std::size_t>(max_fx_edges));
  }
  return out;
}

} // namespace

Amount DebtCycle::min_amount() const noexcept {
  if (edges.empty()) return 0;
  Amount m = edges.front().amount;
  for (const auto& e : edges) m = std::min(m, e.amount);
  return m;
}

std::vector<DebtCycle> find_cycles(const std::vector<DebtRecord>& debts, const Currency& eq, int max_depth) {
  if (max_depth < 2) return {};

  std::map<Pid, std::vector<std::pair<Pid, Amount>>> out;
  for (const auto& d : debts) {
    if (d.currency != eq || d.amount <= 0 || d.debtor == d.creditor) continue;
    out[d.debtor].emplace_back(d.creditor, d.amount);
  }
  for (auto& [pid, nbrs] : out) std::sort(nbrs.begin(), nbrs.end());

  auto cycles = CycleSearch(std::move(out), max_depth).run();
  std::sort(cycles.begin(), cycles.end(), cycle_less);
  return cycles;
}

std::vector<DebtCycle> find_cycles(ILedgerSession& s, const Currency& eq, int max_depth) {
  return find_cycles(s.debts(), eq, max_depth);
}

uint64_t ClearingEngine::choice_seed(const std::string& run_id, Tick tick, const Currency& eq) {
  return fnv1a64(run_id + ":" + std::to_string(tick) + ":" + eq);
}

ClearingResult ClearingEngine::clear(Run& run, ILedger& ledger, const Currency& eq, Tick tick,
                                     const std::atomic<bool>* cancel) const {
  const auto t0 = SteadyClock::now();
  ClearingResult res{};
  res.currency = eq;

  auto session = ledger.open_session();

  auto cycles = find_cycles(*session, eq, opts_.max_depth);
  MCSIM_LOG_DEBUG("clearing.find_cycles_done run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                  << " cycles_n=" << cycles.size() << " elapsed_ms=" << static_cast<int64_t>(ms_since(t0)));
  if (cycles.empty()) {
    res.elapsed_ms = ms_since(t0);
    return res;
  }

  const uint64_t seed = choice_seed(run.id(), tick, eq);
  Rng rng(seed);
  std::size_t pick = rng.index(cycles.size());
  res.plan_id = "plan_" + to_hex(seed).substr(0, 12);

  {
    ClearingPlan plan{};
    plan.currency = eq;
    plan.plan_id = res.plan_id;
    const auto edges = plan_edges(cycles[pick], opts_.max_fx_edges);
    plan.steps.push_back(ClearingPlanStep{0, "highlight_edges", edges});
    plan.steps.push_back(ClearingPlanStep{400, "particles", edges});
    plan.steps.push_back(ClearingPlanStep{900, "flash", {}});
    run.locked([](RunStats& s) {
      s.last_event_type = "clearing.plan";
      s.phase = RunPhase::Clearing;
    });
    run.events().publish(std::move(plan));
  }

  bool first = true;
  for (;;) {
    if (res.cleared_cycles > 0 && opts_.yield_every > 0 && res.cleared_cycles % opts_.yield_every == 0) {
      std::this_thread::yield();
    }
    if (cancel && cancel->load()) {
      res.cancelled = true;
      break;
    }
    if (opts_.time_budget_ms > 0) {
      const double elapsed = ms_since(t0);
      if (elapsed >= opts_.time_budget_ms) {
        res.budget_exceeded = true;
        if (run.should_warn_this_tick("clearing_time_budget_exceeded:" + eq)) {
          MCSIM_LOG_WARN("clearing.time_budget_exceeded run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                         << " budget_ms=" << opts_.time_budget_ms << " elapsed_ms=" << static_cast<int64_t>(elapsed));
        }
        break;
      }
    }

    if (!first) {
      cycles = find_cycles(*session, eq, opts_.max_depth);
      if (cycles.empty()) break;
      pick = rng.index(cycles.size());
    }
    first = false;

    // chosen cycle first, then the rest in priority order
    std::vector<std::size_t> order{pick};
    for (std::size_t i = 0; i < cycles.size(); ++i) {
      if (i != pick) order.push_back(i);
    }

    bool executed = false;
    for (const std::size_t idx : order) {
      const auto& c = cycles[idx];
      const Amount amount = c.min_amount();
      if (amount <= 0) continue;
      if (!session->settle_cycle(eq, c.edges, amount)) continue;
      session->commit();

      ++res.cleared_cycles;
      res.cleared_amount += amount;
      for (const auto& e : c.edges) {
        res.touched_nodes.insert(e.debtor);
        res.touched_nodes.insert(e.creditor);
        res.touched_edges[EdgeRef{e.creditor, e.debtor}] += amount;
      }
      executed = true;
      break;
    }
    if (!executed || res.cleared_cycles >= opts_.max_cycles) break;
  }

  if (!res.touched_edges.empty()) {
    try {
      const auto growth = run.drift().apply_growth(*session, run.scenario(), eq, res.touched_edges, tick);
      if (growth.updated_count > 0) TrustDriftEngine::broadcast(run.events(), *session, growth, "trust_drift_growth");
    } catch (const std::exception& e) {
      MCSIM_LOG_WARN("trust_drift.growth_failed run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                     << " err=" << e.what());
    }
  }

  ClearingDone done{};
  done.currency = eq;
  done.plan_id = res.plan_id;
  done.cleared_cycles = res.cleared_cycles;
  done.cleared_amount = format_amount(res.cleared_amount);
  try {
    std::vector<EdgeRef> lines;
    for (const auto& [edge, amount] : res.touched_edges) lines.push_back(edge);
    done.node_patch = node_patches(*session, eq, {res.touched_nodes.begin(), res.touched_nodes.end()});
    done.edge_patch = trustline_patches(*session, eq, lines);
  } catch (const std::exception& e) {
    if (run.should_warn_this_tick("clearing_done_patch_failed:" + eq)) {
      MCSIM_LOG_DEBUG("clearing.done_patch_failed run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                      << " err=" << e.what());
    }
    done.node_patch.clear();
    done.edge_patch.clear();
  }
  session->rollback();

  run.events().publish(std::move(done));
  run.locked([](RunStats& s) {
    s.last_event_type = "clearing.done";
    s.phase = RunPhase::None;
  });

  res.elapsed_ms = ms_since(t0);
  MCSIM_LOG_INFO("clearing.eq_done run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                 << " cleared_cycles=" << res.cleared_cycles << " cleared=" << format_amount(res.cleared_amount)
                 << " elapsed_ms=" << static_cast<int64_t>(res.elapsed_ms));
  return res;
}

std::map<Currency, ClearingResult> ClearingEngine::clear_all(Run& run, ILedger& ledger,
                                                             const std::vector<Currency>& eqs, Tick tick,
                                                             const std::atomic<bool>* cancel) const {
  std::map<Currency, ClearingResult> out;
  for (const auto& eq : eqs) {
    if (cancel && cancel->load()) break;
    try {
      out[eq] = clear(run, ledger, eq, tick, cancel);
    } catch (const std::exception& e) {
      if (run.should_warn_this_tick("clearing_failed:" + eq)) {
        MCSIM_LOG_WARN("clearing.failed run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                       << " err=" << e.what());
      }
      run.record_error("CLEARING_ERROR", e.what());
      out[eq] = ClearingResult{eq};
    }
  }
  return out;
}

} // namespace mcsim
