#include <gtest/gtest.h>

#include <variant>

#include "mcsim/trust_drift.hpp"
#include "test_support.hpp"

using namespace mcsim;

namespace {

TrustDriftConfig enabled_drift() {
  TrustDriftConfig cfg{};
  cfg.enabled = true;
  return cfg;
}

Scenario drift_scenario() {
  Scenario s = test::chain_scenario();
  s.trustlines.push_back(TrustLine{"a", "c", "UAH", 0, TrustLineStatus::Active});
  return s;
}

} // namespace

TEST(TrustDrift, ScaleAmountFloorsToHundredths) {
  EXPECT_EQ(scale_amount(10000, 1.05), 10500);
  EXPECT_EQ(scale_amount(333, 0.5), 166);
  EXPECT_EQ(scale_amount(10000, 0.0), 0);
}

TEST(TrustDrift, InitSkipsLinesWithoutLimit) {
  TrustDriftEngine drift;
  drift.init(enabled_drift(), drift_scenario());
  EXPECT_EQ(drift.history_size(), 2u);
  EXPECT_FALSE(drift.history("a", "c", "UAH").has_value());

  const auto h = drift.history("b", "a", "UAH");
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->original_limit, from_units(100));
  EXPECT_EQ(h->clearing_count, 0);
}

TEST(TrustDrift, GrowthRaisesClearedLinesAndCommits) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  ScenarioState state(s);
  TrustDriftEngine drift;
  drift.init(enabled_drift(), s);

  auto session = ledger.open_session();
  const std::map<EdgeRef, Amount> cleared = {{EdgeRef{"b", "a"}, from_units(10)}};
  const auto r = drift.apply_growth(*session, state, "UAH", cleared, 7);

  EXPECT_EQ(r.updated_count, 1);
  ASSERT_EQ(r.changed.at("UAH").size(), 1u);
  EXPECT_EQ(ledger.committed().trustlines.at({"b", "a", "UAH"}).limit, from_units(105));
  EXPECT_EQ(state.snapshot()->find_trustline("b", "a", "UAH")->limit, from_units(105));

  const auto h = drift.history("b", "a", "UAH");
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->clearing_count, 1);
  EXPECT_EQ(h->last_clearing_tick, 7);
  EXPECT_EQ(h->cleared_volume, from_units(10));
}

TEST(TrustDrift, GrowthIsCappedByMaxGrowth) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  ScenarioState state(s);
  TrustDriftConfig cfg = enabled_drift();
  cfg.max_growth = 1.02;
  TrustDriftEngine drift;
  drift.init(cfg, s);

  auto session = ledger.open_session();
  const std::map<EdgeRef, Amount> cleared = {{EdgeRef{"b", "a"}, from_units(10)}};
  drift.apply_growth(*session, state, "UAH", cleared, 1);
  EXPECT_EQ(ledger.committed().trustlines.at({"b", "a", "UAH"}).limit, from_units(102));

  const auto again = drift.apply_growth(*session, state, "UAH", cleared, 2);
  EXPECT_EQ(again.updated_count, 0);
  EXPECT_EQ(drift.history("b", "a", "UAH")->clearing_count, 2);
}

TEST(TrustDrift, DisabledEngineChangesNothing) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  ScenarioState state(s);
  TrustDriftEngine drift;
  drift.init(TrustDriftConfig{}, s);

  auto session = ledger.open_session();
  const auto r = drift.apply_growth(*session, state, "UAH", {{EdgeRef{"b", "a"}, from_units(10)}}, 1);
  EXPECT_EQ(r.updated_count, 0);
  EXPECT_EQ(session->find_trustline("b", "a", "UAH")->limit, from_units(100));
}

TEST(TrustDrift, DecayLowersOverloadedLines) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  ScenarioState state(s);
  TrustDriftEngine drift;
  drift.init(enabled_drift(), s);

  DebtSnapshot debts;
  debts.add("a", "b", "UAH", from_units(90)); // 90% of b -> a
  debts.add("b", "c", "UAH", from_units(10)); // 10% of c -> b

  auto session = ledger.open_session();
  const auto r = drift.apply_decay(*session, state, debts, 3);
  ASSERT_EQ(r.updated_count, 1);
  EXPECT_EQ(r.changed.at("UAH").front(), (EdgeRef{"b", "a"}));
  EXPECT_EQ(session->find_trustline("b", "a", "UAH")->limit, from_units(98));
  EXPECT_EQ(session->find_trustline("c", "b", "UAH")->limit, from_units(100));
  EXPECT_EQ(state.snapshot()->find_trustline("b", "a", "UAH")->limit, from_units(98));

  // the caller owns the commit
  session->rollback();
  EXPECT_EQ(ledger.committed().trustlines.at({"b", "a", "UAH"}).limit, from_units(100));
}

TEST(TrustDrift, DecayRespectsFloorAndSkipsLinesClearedThisTick) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  ScenarioState state(s);
  TrustDriftConfig cfg = enabled_drift();
  cfg.min_limit_ratio = 0.99;
  TrustDriftEngine drift;
  drift.init(cfg, s);

  DebtSnapshot debts;
  debts.add("a", "b", "UAH", from_units(95));
  debts.add("b", "c", "UAH", from_units(95));

  auto session = ledger.open_session();
  drift.apply_growth(*session, state, "UAH", {{EdgeRef{"c", "b"}, from_units(1)}}, 4);

  const auto r = drift.apply_decay(*session, state, debts, 4);
  ASSERT_EQ(r.updated_count, 1);
  EXPECT_EQ(session->find_trustline("b", "a", "UAH")->limit, from_units(99));
}

TEST(TrustDrift, BroadcastPublishesOnePatchPerCurrency) {
  const Scenario s = drift_scenario();
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);
  RecordingSink sink;
  EventBus bus("r1", &sink);

  DriftResult r{};
  r.updated_count = 1;
  r.changed["UAH"] = {EdgeRef{"b", "a"}, EdgeRef{"x", "y"}};

  auto session = ledger.open_session();
  TrustDriftEngine::broadcast(bus, *session, r, "trust_drift_growth");

  const auto events = sink.of_type(EventType::TopologyChanged);
  ASSERT_EQ(events.size(), 1u);
  const auto& tc = std::get<TopologyChanged>(events[0].payload);
  EXPECT_EQ(tc.reason, "trust_drift_growth");
  ASSERT_EQ(tc.edges.size(), 1u);
  EXPECT_EQ(tc.edges[0].from, "b");
  EXPECT_EQ(tc.edges[0].available, from_units(100));
}
