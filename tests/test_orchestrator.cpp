#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <variant>

#include "mcsim/orchestrator.hpp"
#include "test_support.hpp"

using namespace mcsim;

namespace {

SimConfig no_clearing() {
  SimConfig cfg{};
  cfg.clearing_every_n_ticks = 0;
  cfg.actions_per_tick_max = 5;
  return cfg;
}

TickReport step(TickOrchestrator& orch, Run& run) {
  run.advance_clock(orch.config().tick_ms);
  return orch.tick(run.id());
}

class BusyLedger : public ILedger {
public:
  std::unique_ptr<ILedgerSession> open_session() override { throw LedgerTimeout("database is busy"); }
};

std::vector<Amount> committed_amounts(const RecordingSink& sink) {
  std::vector<Amount> out;
  for (const auto& e : sink.of_type(EventType::TxUpdated)) out.push_back(std::get<TxUpdated>(e.payload).amount);
  return out;
}

} // namespace

TEST(TickOrchestrator, TicksPlanExecuteAndReport) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()), &sink);

  uint64_t planned = 0;
  for (int i = 0; i < 3; ++i) {
    const auto r = step(orch, run);
    EXPECT_TRUE(r.executed);
    EXPECT_EQ(r.tick, i + 1);
    EXPECT_LE(r.planned, 5);
    planned += static_cast<uint64_t>(r.planned);
    EXPECT_EQ(r.committed + r.rejected + r.errors, r.planned);
    EXPECT_FALSE(r.failure.has_value());
  }

  const auto events = sink.events();
  ASSERT_FALSE(events.empty());
  for (std::size_t i = 1; i < events.size(); ++i) EXPECT_GT(events[i].event_id, events[i - 1].event_id);
  EXPECT_EQ(sink.of_type(EventType::RunStatus).size(), 3u);

  const auto st = run.stats();
  EXPECT_EQ(st.totals.attempts, planned);
  EXPECT_EQ(st.state, RunState::Running);
  EXPECT_EQ(st.phase, RunPhase::None);
}

TEST(TickOrchestrator, SameSeedSameOutcome) {
  MemoryLedger l1;
  MemoryLedger l2;
  TickOrchestrator o1(l1, no_clearing());
  TickOrchestrator o2(l2, no_clearing());
  RecordingSink s1;
  RecordingSink s2;
  mcsim::Run& r1 = o1.add_run(test::run_spec("r1", test::chain_scenario(), 77), &s1);
  mcsim::Run& r2 = o2.add_run(test::run_spec("r1", test::chain_scenario(), 77), &s2);

  for (int i = 0; i < 4; ++i) {
    step(o1, r1);
    step(o2, r2);
  }

  EXPECT_EQ(committed_amounts(s1), committed_amounts(s2));
  EXPECT_EQ(l1.committed().debts, l2.committed().debts);
}

TEST(TickOrchestrator, StaticClearingSettlesTheTriangle) {
  MemoryLedger ledger;
  SimConfig cfg{};
  cfg.clearing_every_n_ticks = 1;
  TickOrchestrator orch(ledger, cfg);
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario(), 1, 0), &sink);

  const auto r = step(orch, run);
  EXPECT_TRUE(r.executed);
  EXPECT_EQ(r.planned, 0);
  EXPECT_TRUE(r.clearing_started);
  EXPECT_DOUBLE_EQ(r.clearing_volume.at("UAH"), 50.0);
  EXPECT_TRUE(ledger.committed().debts.empty());
  EXPECT_EQ(sink.of_type(EventType::ClearingDone).size(), 1u);
}

TEST(TickOrchestrator, StaticClearingFollowsCadence) {
  MemoryLedger ledger;
  SimConfig cfg{};
  cfg.clearing_every_n_ticks = 2;
  TickOrchestrator orch(ledger, cfg);
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario(), 1, 0));

  EXPECT_FALSE(step(orch, run).clearing_started);
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), from_units(50));
  EXPECT_TRUE(step(orch, run).clearing_started);
  EXPECT_TRUE(ledger.committed().debts.empty());
}

TEST(TickOrchestrator, AdaptiveWarmupFallbackClears) {
  MemoryLedger ledger;
  SimConfig cfg{};
  cfg.clearing_policy = ClearingPolicyKind::Adaptive;
  cfg.adaptive.window_ticks = 5;
  cfg.adaptive.warmup_fallback_cadence = 1;
  TickOrchestrator orch(ledger, cfg);
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario(), 1, 0));

  const auto r = step(orch, run);
  EXPECT_TRUE(r.clearing_started);
  EXPECT_DOUBLE_EQ(r.clearing_volume.at("UAH"), 50.0);
  ASSERT_NE(run.tick_state().adaptive, nullptr);
  EXPECT_EQ(run.tick_state().adaptive->per_currency("UAH").last_clearing_tick, 1);
}

TEST(TickOrchestrator, AdaptiveWithoutFallbackWaitsForTheWindow) {
  MemoryLedger ledger;
  SimConfig cfg{};
  cfg.clearing_policy = ClearingPolicyKind::Adaptive;
  TickOrchestrator orch(ledger, cfg);
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario(), 1, 0));

  EXPECT_FALSE(step(orch, run).clearing_started);
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), from_units(50));
}

TEST(TickOrchestrator, DueInjectEventIsAppliedOnce) {
  Scenario s = test::chain_scenario();
  ScenarioEvent ev{};
  ev.kind = ScenarioEventKind::Inject;
  ev.time_ms = 1000;
  ev.inject = {InjectDebt{"b", "a", "UAH", 20.0}};
  s.events = {ev};

  MemoryLedger ledger;
  SimConfig cfg = no_clearing();
  cfg.enable_inject = true;
  TickOrchestrator orch(ledger, cfg);
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", s, 1, 0), &sink);

  step(orch, run);
  step(orch, run);
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), from_units(20));
  ASSERT_EQ(sink.of_type(EventType::TopologyChanged).size(), 1u);
  EXPECT_EQ(run.tick_state().fired_events.count(0), 1u);
}

TEST(TickOrchestrator, InjectIsIgnoredWhenDisabled) {
  Scenario s = test::chain_scenario();
  ScenarioEvent ev{};
  ev.kind = ScenarioEventKind::Inject;
  ev.time_ms = 1000;
  ev.inject = {InjectDebt{"b", "a", "UAH", 20.0}};
  s.events = {ev};

  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  mcsim::Run& run = orch.add_run(test::run_spec("r1", s, 1, 0));

  step(orch, run);
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), 0);
  EXPECT_EQ(run.tick_state().fired_events.count(0), 1u);
}

TEST(TickOrchestrator, TooManyErrorsFailsTheRun) {
  MemoryLedger ledger;
  ledger.set_payment_hook([](const PaymentRequest&) { throw std::runtime_error("storage fault"); });
  SimConfig cfg = no_clearing();
  cfg.max_errors_total = 3;
  cfg.max_timeouts_per_tick = 0;
  TickOrchestrator orch(ledger, cfg);
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()), &sink);

  const auto r = step(orch, run);
  ASSERT_TRUE(r.failure.has_value());
  EXPECT_EQ(*r.failure, "REAL_MODE_TOO_MANY_ERRORS");
  const auto st = run.stats();
  EXPECT_EQ(st.state, RunState::Error);
  EXPECT_EQ(st.last_error->code, "REAL_MODE_TOO_MANY_ERRORS");

  const auto status = sink.of_type(EventType::RunStatus);
  ASSERT_FALSE(status.empty());
  EXPECT_EQ(std::get<RunStatusEvent>(status.back().payload).state, RunState::Error);

  EXPECT_FALSE(step(orch, run).executed);
}

TEST(TickOrchestrator, TimeoutCeilingFailsTheRun) {
  MemoryLedger ledger;
  ledger.set_payment_hook([](const PaymentRequest&) { throw LedgerTimeout("statement timeout"); });
  SimConfig cfg = no_clearing();
  cfg.max_timeouts_per_tick = 2;
  TickOrchestrator orch(ledger, cfg);
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()));

  const auto r = step(orch, run);
  EXPECT_EQ(r.failure, "REAL_MODE_TOO_MANY_TIMEOUTS");
  EXPECT_EQ(r.timeouts, 2);
  EXPECT_EQ(run.state(), RunState::Error);
}

TEST(TickOrchestrator, RepeatedTickFailuresFailTheRun) {
  BusyLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()));

  EXPECT_EQ(step(orch, run).failure, "REAL_MODE_TICK_FAILED");
  EXPECT_EQ(step(orch, run).failure, "REAL_MODE_TICK_FAILED");
  EXPECT_EQ(run.state(), RunState::Running);
  EXPECT_EQ(step(orch, run).failure, "REAL_MODE_TICK_FAILED_REPEATED");
  EXPECT_EQ(run.state(), RunState::Error);
  EXPECT_EQ(run.stats().last_error->code, "REAL_MODE_TICK_FAILED_REPEATED");
}

TEST(TickOrchestrator, PausedRunDoesNotTick) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()));

  ASSERT_TRUE(run.pause());
  EXPECT_FALSE(step(orch, run).executed);
  ASSERT_TRUE(run.resume());
  EXPECT_TRUE(step(orch, run).executed);
}

TEST(TickOrchestrator, StopRunCompletesTheStop) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()), &sink);
  step(orch, run);

  EXPECT_TRUE(orch.stop_run("r1"));
  EXPECT_EQ(run.state(), RunState::Stopped);
  EXPECT_TRUE(run.stats().stopped_at.has_value());
  EXPECT_FALSE(orch.stop_run("r1"));
  EXPECT_FALSE(orch.stop_run("missing"));
  EXPECT_FALSE(orch.fail_run("r1", "X", "too late"));
}

TEST(TickOrchestrator, RunRegistry) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  orch.add_run(test::run_spec("r1", test::chain_scenario()));

  EXPECT_THROW(orch.add_run(test::run_spec("r1", test::chain_scenario())), std::invalid_argument);
  EXPECT_THROW(orch.add_run(test::run_spec("", test::chain_scenario())), std::invalid_argument);
  EXPECT_NE(orch.find_run("r1"), nullptr);
  EXPECT_EQ(orch.find_run("r2"), nullptr);
  EXPECT_EQ(orch.run_ids(), std::vector<std::string>{"r1"});
  EXPECT_FALSE(orch.tick("r2").executed);
}

TEST(TickOrchestrator, ClearingHardTimeout) {
  MemoryLedger ledger;
  EXPECT_DOUBLE_EQ(TickOrchestrator(ledger).clearing_hard_timeout_sec(), 2.0);

  SimConfig cfg{};
  cfg.clearing_time_budget_ms = 5000;
  EXPECT_DOUBLE_EQ(TickOrchestrator(ledger, cfg).clearing_hard_timeout_sec(), 8.0);
  cfg.clearing_hard_timeout_sec = 0.0;
  EXPECT_DOUBLE_EQ(TickOrchestrator(ledger, cfg).clearing_hard_timeout_sec(), 20.0);
  cfg.clearing_hard_timeout_sec = 0.05;
  EXPECT_DOUBLE_EQ(TickOrchestrator(ledger, cfg).clearing_hard_timeout_sec(), 0.1);
}

TEST(TickOrchestrator, TickMetricsArePersisted) {
  MemoryLedger ledger;
  MemoryMetricsStore store;
  SimConfig cfg = no_clearing();
  cfg.metrics_every_n_ticks = 1;
  TickOrchestrator orch(ledger, cfg, &store);
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario(), 1, 0));

  step(orch, run);
  const auto debt = store.metric("r1", "UAH", "total_debt", 1000);
  ASSERT_TRUE(debt.has_value());
  EXPECT_DOUBLE_EQ(*debt, 150.0);
  EXPECT_DOUBLE_EQ(*store.metric("r1", "UAH", "active_participants", 1000), 3.0);
  EXPECT_DOUBLE_EQ(*store.metric("r1", "UAH", "active_trustlines", 1000), 3.0);

  const auto last = store.last_tick("r1");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->tick, 1);
}

TEST(TickOrchestrator, StoppingDuringPaymentsSkipsClearing) {
  MemoryLedger ledger;
  SimConfig cfg{};
  cfg.clearing_every_n_ticks = 1;
  TickOrchestrator orch(ledger, cfg);
  RecordingSink sink;
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::triangle_scenario()), &sink);
  ledger.set_payment_hook([&run](const PaymentRequest&) { run.begin_stop(); });

  const auto r = step(orch, run);
  ASSERT_GT(r.planned, 0);
  EXPECT_EQ(run.state(), RunState::Stopping);
  EXPECT_FALSE(r.clearing_started);
  EXPECT_TRUE(r.clearing_volume.empty());
  EXPECT_TRUE(sink.of_type(EventType::ClearingDone).empty());
  EXPECT_EQ(sink.of_type(EventType::RunStatus).size(), 1u);
  EXPECT_EQ(run.stats().totals.committed, static_cast<uint64_t>(r.committed));

  EXPECT_TRUE(orch.stop_run("r1"));
  EXPECT_EQ(run.state(), RunState::Stopped);
}

TEST(TickOrchestrator, StoppingRunCanStillFail) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());
  mcsim::Run& run = orch.add_run(test::run_spec("r1", test::chain_scenario()));
  step(orch, run);

  ASSERT_TRUE(run.begin_stop());
  EXPECT_TRUE(orch.fail_run("r1", "REAL_MODE_TICK_FAILED", "failed while stopping"));
  const auto st = run.stats();
  EXPECT_EQ(st.state, RunState::Error);
  ASSERT_TRUE(st.last_error.has_value());
  EXPECT_EQ(st.last_error->code, "REAL_MODE_TICK_FAILED");
  EXPECT_FALSE(orch.stop_run("r1"));
}

TEST(TickOrchestrator, NothingToSimulateStillPublishesStatus) {
  MemoryLedger ledger;
  TickOrchestrator orch(ledger, no_clearing());

  RecordingSink no_eq_sink;
  Scenario no_eq = test::chain_scenario();
  no_eq.id = "no-eq";
  no_eq.equivalents.clear();
  no_eq.trustlines.clear();
  mcsim::Run& r1 = orch.add_run(test::run_spec("r1", no_eq), &no_eq_sink);
  EXPECT_FALSE(step(orch, r1).executed);
  EXPECT_EQ(no_eq_sink.of_type(EventType::RunStatus).size(), 1u);

  RecordingSink alone_sink;
  Scenario alone{};
  alone.id = "alone";
  alone.equivalents = {"UAH"};
  alone.participants = {test::person("a")};
  mcsim::Run& r2 = orch.add_run(test::run_spec("r2", alone), &alone_sink);
  EXPECT_FALSE(step(orch, r2).executed);
  EXPECT_EQ(alone_sink.of_type(EventType::RunStatus).size(), 1u);
  EXPECT_EQ(r2.state(), RunState::Running);
}
