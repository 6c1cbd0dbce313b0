#include "mcsim/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <utility>

#include "mcsim/log.hpp"
#include "mcsim/rejection_codes.hpp"

namespace mcsim {

namespace {

using SteadyClock = std::chrono::steady_clock;

int64_t steady_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now().time_since_epoch()).count();
}

int64_t ms_since(SteadyClock::time_point t0) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - t0).count();
}

std::chrono::milliseconds to_ms(double sec) {
  return std::chrono::milliseconds(static_cast<int64_t>(sec * 1000.0));
}

} // namespace

TickOrchestrator::TickOrchestrator(ILedger& ledger, SimConfig cfg, IMetricsStore* store)
  : ledger_(ledger),
    cfg_(std::move(cfg)),
    planner_(cfg_.planner()),
    executor_(cfg_.executor()),
    inject_(cfg_.enable_inject),
    policy_(cfg_.adaptive_policy()),
    persistence_(store, cfg_.persistence()) {}

TickOrchestrator::~TickOrchestrator() {
  std::vector<std::shared_ptr<ClearingTask>> tasks;
  {
    std::lock_guard<std::mutex> lk(clearing_mtx_);
    std::lock_guard<std::mutex> rl(runs_mtx_);
    for (auto& [id, run] : runs_) {
      auto& h = run->tick_state().clearing;
      if (h) tasks.push_back(std::move(h));
    }
  }
  for (auto& t : tasks) {
    t->request_cancel();
    t->join();
  }
}

Run& TickOrchestrator::add_run(RunSpec spec, IEventSink* sink) {
  if (spec.run_id.empty()) throw std::invalid_argument("run id is empty");
  std::lock_guard<std::mutex> lk(runs_mtx_);
  if (runs_.count(spec.run_id)) throw std::invalid_argument("run already exists: " + spec.run_id);
  const std::string id = spec.run_id;
  auto run = std::make_unique<Run>(std::move(spec), sink);
  Run& ref = *run;
  runs_.emplace(id, std::move(run));
  MCSIM_LOG_INFO("run.created run_id=" << id << " seed=" << ref.seed());
  return ref;
}

Run* TickOrchestrator::find_run(const std::string& run_id) {
  std::lock_guard<std::mutex> lk(runs_mtx_);
  const auto it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second.get();
}

std::vector<std::string> TickOrchestrator::run_ids() const {
  std::lock_guard<std::mutex> lk(runs_mtx_);
  std::vector<std::string> out;
  out.reserve(runs_.size());
  for (const auto& [id, run] : runs_) out.push_back(id);
  return out;
}

double TickOrchestrator::clearing_hard_timeout_sec() const noexcept {
  double sec = std::max(2.0, static_cast<double>(cfg_.clearing_time_budget_ms) / 1000.0 * 4.0);
  if (cfg_.clearing_hard_timeout_sec > 0.0) sec = std::min(sec, cfg_.clearing_hard_timeout_sec);
  return std::max(0.1, sec);
}

TickReport TickOrchestrator::tick(const std::string& run_id) {
  TickReport report{};
  Run* run = find_run(run_id);
  if (!run) {
    MCSIM_LOG_WARN("tick.unknown_run run_id=" << run_id);
    return report;
  }
  if (!run->is_running()) return report;

  const auto t0 = SteadyClock::now();
  report.tick = run->stats().tick_index;
  MCSIM_LOG_DEBUG("tick.start run_id=" << run_id << " tick=" << report.tick);

  try {
    await_pending_clearing_(*run);

    auto session = ledger_.open_session();
    try {
      tick_body_(*run, *session, report);
    } catch (...) {
      try {
        session->rollback();
      } catch (const std::exception& e) {
        MCSIM_LOG_WARN("tick.rollback_failed run_id=" << run_id << " err=" << e.what());
      }
      throw;
    }
  } catch (const std::exception& e) {
    on_tick_failed_(*run, e.what(), report);
  } catch (...) {
    on_tick_failed_(*run, "unknown exception", report);
  }

  MCSIM_LOG_DEBUG("tick.done run_id=" << run_id << " tick=" << report.tick << " elapsed_ms=" << ms_since(t0));
  return report;
}

void TickOrchestrator::tick_body_(Run& run, ILedgerSession& session, TickReport& report) {
  auto& ts = run.tick_state();
  const RunStats stats = run.stats();
  const Tick tick = stats.tick_index;
  const SimMs sim_ms = stats.sim_time_ms;

  if (!ts.seeded) {
    session.seed_from_scenario(*run.scenario().snapshot());
    session.commit();
    ts.seeded = true;
    MCSIM_LOG_INFO("tick.seeded run_id=" << run.id());
  }

  const auto initial = run.scenario().snapshot();
  const std::vector<Currency> eqs = initial->equivalents;
  if (eqs.empty()) {
    finish_tick_(run, session);
    return;
  }

  if (!ts.drift_initialized) {
    run.drift().init(initial->settings.trust_drift, *initial);
    ts.drift_initialized = true;
  }

  // injects change the ledger and must land before planning
  apply_due_events_(run, session, tick, sim_ms);

  std::set<Pid> known;
  for (const auto& p : session.participants()) known.insert(p.id);
  if (known.size() < 2) {
    finish_tick_(run, session);
    return;
  }

  const auto scenario = run.scenario().snapshot();
  const DebtSnapshot debts = load_debt_snapshot(session);

  const PlanContext ctx{run.seed(), tick, sim_ms, stats.intensity_percent};
  const auto planned = planner_.plan(ctx, scenario, &debts, run.routing());
  run.locked([&](RunStats& s) {
    s.queue_depth = static_cast<int>(planned.size());
    s.in_flight = 0;
    s.phase = planned.empty() ? RunPhase::None : RunPhase::Payments;
  });

  report.executed = true;
  report.planned = static_cast<int>(planned.size());

  const PaymentsResult payments = executor_.execute(run, session, planned, known, eqs);
  report.committed = payments.committed;
  report.rejected = payments.rejected;
  report.errors = payments.errors;
  report.timeouts = payments.timeouts;

  if (payments.stall_ticks > 0 && payments.stall_ticks % 5 == 0) {
    MCSIM_LOG_WARN("tick.all_rejected_stall run_id=" << run.id() << " tick=" << tick
                   << " consec_stall_ticks=" << payments.stall_ticks << " planned=" << planned.size()
                   << " rejected=" << payments.rejected);
  }

  if (payments.abort_code) {
    session.commit();
    report.failure = *payments.abort_code;
    fail_run(run.id(), *payments.abort_code, payments.abort_message);
    return;
  }

  const uint64_t errors_total = run.stats().totals.errors;
  if (cfg_.max_errors_total > 0 && errors_total >= static_cast<uint64_t>(cfg_.max_errors_total)) {
    session.commit();
    report.failure = "REAL_MODE_TOO_MANY_ERRORS";
    fail_run(run.id(), "REAL_MODE_TOO_MANY_ERRORS", "Too many total errors: " + std::to_string(errors_total));
    return;
  }

  // a stopping run keeps its finished batch and skips the rest of the tick
  if (run.is_winding_down()) {
    MCSIM_LOG_INFO("tick.winding_down run_id=" << run.id() << " tick=" << tick);
    finish_tick_(run, session);
    return;
  }

  for (const auto& eq : eqs) report.clearing_volume[eq] = 0.0;
  const auto plan = clearing_plan_(run, eqs, payments, tick);
  if (!plan.empty()) run_clearing_(run, session, plan, tick, report);

  apply_decay_(run, session, debts, tick);
  persist_(run, session, eqs, payments, report, tick, sim_ms);

  finish_tick_(run, session);
}

void TickOrchestrator::finish_tick_(Run& run, ILedgerSession& session) {
  session.commit();
  run.publish_status();
}

void TickOrchestrator::apply_due_events_(Run& run, ILedgerSession& session, Tick tick, SimMs sim_ms) {
  auto& ts = run.tick_state();
  const auto scenario = run.scenario().snapshot();

  for (std::size_t idx = 0; idx < scenario->events.size(); ++idx) {
    if (ts.fired_events.count(idx)) continue;
    const auto& ev = scenario->events[idx];
    if (sim_ms < ev.time_ms) continue;

    switch (ev.kind) {
      case ScenarioEventKind::Note:
        MCSIM_LOG_INFO("scenario.note run_id=" << run.id() << " tick=" << tick << " event_index=" << idx
                       << " time_ms=" << ev.time_ms << " description=" << ev.description);
        break;
      case ScenarioEventKind::Inject:
        inject_.apply(run, session, ev, idx, tick);
        break;
      case ScenarioEventKind::Stress:
        // read by the planner for as long as the window lasts
        break;
    }
    ts.fired_events.insert(idx);
  }
}

std::vector<TickOrchestrator::ClearingPlanItem> TickOrchestrator::clearing_plan_(Run& run,
                                                                                 const std::vector<Currency>& eqs,
                                                                                 const PaymentsResult& payments,
                                                                                 Tick tick) {
  std::vector<ClearingPlanItem> plan;
  const ClearingOptions base = cfg_.clearing();

  if (cfg_.clearing_policy == ClearingPolicyKind::Static) {
    if (cfg_.clearing_every_n_ticks <= 0 || tick % cfg_.clearing_every_n_ticks != 0) return plan;
    for (const auto& eq : eqs) plan.push_back(ClearingPlanItem{eq, base});
    return plan;
  }

  auto& ts = run.tick_state();
  if (!ts.adaptive) ts.adaptive = std::make_unique<AdaptiveClearingState>(policy_.config());

  const RunStats stats = run.stats();
  const LoadSignals load{stats.in_flight, stats.queue_depth};
  for (const auto& eq : eqs) {
    TickSignals sig{};
    if (const auto it = payments.per_currency.find(eq); it != payments.per_currency.end()) {
      const auto& c = it->second;
      sig.attempted_payments = static_cast<int>(c.committed + c.rejected + c.errors + c.timeouts);
    }
    if (const auto it = payments.rejection_codes.find(eq); it != payments.rejection_codes.end()) {
      if (const auto jt = it->second.find(kRoutingNoCapacity); jt != it->second.end()) {
        sig.rejected_no_capacity = jt->second;
      }
    }
    ts.adaptive->record_tick_signals(eq, sig);

    const ClearingDecision d = policy_.evaluate(eq, *ts.adaptive, tick, load);
    MCSIM_LOG_DEBUG("clearing.policy_decision run_id=" << run.id() << " tick=" << tick << " eq=" << eq
                    << " run=" << d.should_run << " reason=" << to_string(d.reason)
                    << " rate=" << ts.adaptive->no_capacity_rate(eq));
    if (!d.should_run) continue;

    ClearingOptions opts = base;
    if (d.max_depth) opts.max_depth = *d.max_depth;
    if (d.time_budget_ms) opts.time_budget_ms = *d.time_budget_ms;
    plan.push_back(ClearingPlanItem{eq, opts});
  }
  return plan;
}

void TickOrchestrator::run_clearing_(Run& run, ILedgerSession& session, const std::vector<ClearingPlanItem>& plan,
                                     Tick tick, TickReport& report) {
  // the clearing session needs the writer slot this session holds
  const auto commit_t0 = SteadyClock::now();
  session.commit();
  const int64_t commit_ms = ms_since(commit_t0);
  if (commit_ms > 500) {
    MCSIM_LOG_WARN("tick.commit_slow run_id=" << run.id() << " tick=" << tick << " commit_ms=" << commit_ms);
  }

  MCSIM_LOG_INFO("clearing.enter run_id=" << run.id() << " tick=" << tick << " eqs=" << plan.size());
  const auto t0 = SteadyClock::now();
  const double hard_sec = clearing_hard_timeout_sec();

  auto results = std::make_shared<std::map<Currency, ClearingResult>>();
  std::shared_ptr<ClearingTask> task;
  bool fresh = false;
  {
    std::lock_guard<std::mutex> lk(clearing_mtx_);
    auto& h = run.tick_state().clearing;
    if (h && h->done()) h.reset();
    if (!h) {
      h = std::make_shared<ClearingTask>([this, &run, plan, tick, results](const std::atomic<bool>& cancel) {
        for (const auto& item : plan) {
          if (cancel.load()) break;
          const ClearingEngine engine(item.options);
          auto r = engine.clear_all(run, ledger_, {item.currency}, tick, &cancel);
          for (auto& [eq, res] : r) (*results)[eq] = std::move(res);
        }
      });
      fresh = true;
    }
    task = h;
  }
  if (!fresh) {
    MCSIM_LOG_WARN("clearing.already_running run_id=" << run.id() << " tick=" << tick);
  }
  report.clearing_started = fresh;

  if (task->wait_for(to_ms(hard_sec))) {
    {
      std::lock_guard<std::mutex> lk(clearing_mtx_);
      auto& h = run.tick_state().clearing;
      if (h == task) h.reset();
    }
    if (const auto err = task->error()) {
      try {
        std::rethrow_exception(err);
      } catch (const std::exception& e) {
        MCSIM_LOG_WARN("clearing.failed run_id=" << run.id() << " tick=" << tick << " err=" << e.what());
      } catch (...) {
        MCSIM_LOG_WARN("clearing.failed run_id=" << run.id() << " tick=" << tick << " err=unknown");
      }
    } else if (fresh) {
      for (const auto& [eq, res] : *results) {
        const double volume = to_units(res.cleared_amount);
        report.clearing_volume[eq] = volume;
        if (run.tick_state().adaptive) {
          run.tick_state().adaptive->update_clearing_result(eq, volume, res.elapsed_ms, tick);
        }
      }
    }
  } else {
    MCSIM_LOG_WARN("clearing.hard_timeout run_id=" << run.id() << " tick=" << tick << " timeout_sec=" << hard_sec);
    // keep the handle so the next pass does not overlap this one
    task->request_cancel();
    run.locked([](RunStats& s) { s.phase = RunPhase::None; });
  }

  MCSIM_LOG_INFO("clearing.done run_id=" << run.id() << " tick=" << tick << " elapsed_ms=" << ms_since(t0));
}

void TickOrchestrator::apply_decay_(Run& run, ILedgerSession& session, const DebtSnapshot& debts, Tick tick) {
  if (!run.drift().enabled()) return;
  try {
    const DriftResult r = run.drift().apply_decay(session, run.scenario(), debts, tick);
    if (r.updated_count > 0) {
      MCSIM_LOG_INFO("trust_drift.decay run_id=" << run.id() << " tick=" << tick << " updated=" << r.updated_count);
      TrustDriftEngine::broadcast(run.events(), session, r, "trust_drift_decay");
    }
  } catch (const std::exception& e) {
    if (run.should_warn_this_tick("trust_drift_decay_failed")) {
      MCSIM_LOG_WARN("trust_drift.decay_failed run_id=" << run.id() << " tick=" << tick << " err=" << e.what());
    }
  }
}

void TickOrchestrator::persist_(Run& run, ILedgerSession& session, const std::vector<Currency>& eqs,
                                const PaymentsResult& payments, const TickReport& report, Tick tick, SimMs sim_ms) {
  auto& ts = run.tick_state();

  TickPayload payload{};
  payload.run_id = run.id();
  payload.tick = tick;
  payload.t_ms = sim_ms;
  payload.per_currency = payments.per_currency;
  payload.edge_stats = payments.edge_stats;

  try {
    const auto scenario = run.scenario().snapshot();
    const bool refresh_debt = cfg_.metrics_every_n_ticks <= 1 || tick % cfg_.metrics_every_n_ticks == 0;
    std::map<Currency, Amount> debt_totals;
    if (refresh_debt) {
      for (const auto& d : session.debts()) debt_totals[d.currency] += d.amount;
    }

    const auto active_participants = std::count_if(
        scenario->participants.begin(), scenario->participants.end(),
        [](const Participant& p) { return p.status == ParticipantStatus::Active; });

    for (const auto& eq : eqs) {
      MetricValues v{};
      if (const auto it = payments.per_currency.find(eq); it != payments.per_currency.end() && it->second.route_len_n) {
        v.avg_route_length = it->second.route_len_sum / static_cast<double>(it->second.route_len_n);
      }
      if (refresh_debt) ts.total_debt_cache[eq] = debt_totals[eq];
      v.total_debt = to_units(ts.total_debt_cache[eq]);
      if (const auto it = report.clearing_volume.find(eq); it != report.clearing_volume.end()) {
        v.clearing_volume = it->second;
      }
      v.active_participants = static_cast<double>(active_participants);
      v.active_trustlines = static_cast<double>(run.routing().get(scenario, eq)->direct.size());
      payload.values.emplace(eq, v);
    }
  } catch (const std::exception& e) {
    if (run.should_warn_this_tick("metrics_failed")) {
      MCSIM_LOG_WARN("metrics.compute_failed run_id=" << run.id() << " tick=" << tick << " err=" << e.what());
    }
  }

  const TickSummary summary{tick,           sim_ms,         report.planned, report.committed,
                            report.rejected, report.errors, report.timeouts};
  persistence_.persist(std::move(payload), summary, ts.persistence, steady_ms());
}

void TickOrchestrator::await_pending_clearing_(Run& run) {
  std::shared_ptr<ClearingTask> task;
  {
    std::lock_guard<std::mutex> lk(clearing_mtx_);
    auto& h = run.tick_state().clearing;
    if (h && h->done()) h.reset();
    task = h;
  }
  if (!task) return;

  const auto grace = to_ms(std::max(0.1, clearing_hard_timeout_sec() * 0.5));
  const Tick tick = run.stats().tick_index;
  MCSIM_LOG_WARN("clearing.pending_await run_id=" << run.id() << " tick=" << tick << " grace_ms=" << grace.count());

  if (!task->wait_for(grace)) {
    MCSIM_LOG_WARN("clearing.pending_grace_timeout run_id=" << run.id() << " tick=" << tick);
    task->request_cancel();
    if (!task->wait_for(grace)) {
      MCSIM_LOG_WARN("clearing.pending_still_running run_id=" << run.id() << " tick=" << tick);
      return;
    }
  }

  std::lock_guard<std::mutex> lk(clearing_mtx_);
  auto& h = run.tick_state().clearing;
  if (h == task) h.reset();
}

void TickOrchestrator::cancel_clearing_(Run& run, std::chrono::milliseconds wait) {
  std::shared_ptr<ClearingTask> task;
  {
    std::lock_guard<std::mutex> lk(clearing_mtx_);
    task = run.tick_state().clearing;
  }
  if (!task) return;

  task->request_cancel();
  if (!task->wait_for(wait)) {
    MCSIM_LOG_WARN("clearing.cancel_timeout run_id=" << run.id());
    return;
  }
  std::lock_guard<std::mutex> lk(clearing_mtx_);
  auto& h = run.tick_state().clearing;
  if (h == task) h.reset();
}

void TickOrchestrator::on_tick_failed_(Run& run, const std::string& message, TickReport& report) {
  const Tick tick = run.stats().tick_index;
  MCSIM_LOG_WARN("tick.failed run_id=" << run.id() << " tick=" << tick << " err=" << message);

  const int consec = run.locked([&](RunStats& s) {
    s.record_error("REAL_MODE_TICK_FAILED", message, WallClock::now());
    s.phase = RunPhase::None;
    s.queue_depth = 0;
    s.in_flight = 0;
    return ++s.consec_tick_failures;
  });
  report.failure = "REAL_MODE_TICK_FAILED";

  if (cfg_.max_consec_tick_failures > 0 && consec >= cfg_.max_consec_tick_failures) {
    report.failure = "REAL_MODE_TICK_FAILED_REPEATED";
    fail_run(run.id(), "REAL_MODE_TICK_FAILED_REPEATED",
             "Tick failed " + std::to_string(consec) + " times in a row");
  }
}

bool TickOrchestrator::fail_run(const std::string& run_id, const std::string& code, const std::string& message) {
  Run* run = find_run(run_id);
  if (!run) return false;
  if (!run->mark_error(code, message)) return false;

  MCSIM_LOG_ERROR("run.failed run_id=" << run_id << " code=" << code << " message=" << message);
  run->publish_status();
  persistence_.flush_pending(run->tick_state().persistence);
  cancel_clearing_(*run, std::chrono::seconds(1));
  return true;
}

bool TickOrchestrator::stop_run(const std::string& run_id) {
  Run* run = find_run(run_id);
  if (!run) return false;
  if (!run->begin_stop() && run->state() != RunState::Stopping) return false;

  cancel_clearing_(*run, std::chrono::seconds(1));
  persistence_.flush_pending(run->tick_state().persistence);
  if (!run->mark_stopped()) return false;

  MCSIM_LOG_INFO("run.stopped run_id=" << run_id << " tick=" << run->stats().tick_index);
  run->publish_status();
  return true;
}

} // namespace mcsim
