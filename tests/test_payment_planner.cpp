#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>

#include "mcsim/payment_planner.hpp"
#include "test_support.hpp"

using namespace mcsim;

namespace {

Scenario village() {
  Scenario s{};
  s.id = "village";
  s.equivalents = {"UAH"};
  s.participants = {test::person("a", "north", "household"), test::person("b", "north", "household"),
                    test::person("c", "south", "household"), test::person("d", "south", "shop")};
  s.trustlines = {test::line("b", "a", 100), test::line("a", "b", 100), test::line("c", "b", 200),
                  test::line("d", "c", 50),  test::line("a", "d", 80),  test::line("d", "a", 300)};

  BehaviorProfile household{};
  household.id = "household";
  household.tx_rate = 0.8;
  household.recipient_group_weights = {{"south", 1.0}, {"north", 1.0}};
  household.amount_model["UAH"] = AmountModel{10.0, 40.0, 1.0, 60.0};
  BehaviorProfile shop{};
  shop.id = "shop";
  shop.tx_rate = 1.0;
  s.profiles = {household, shop};
  return s;
}

Scenario pair_scenario() {
  Scenario s{};
  s.id = "pair";
  s.equivalents = {"UAH"};
  s.participants = {test::person("a"), test::person("b")};
  s.trustlines = {test::line("b", "a", 100)};
  return s;
}

PlannerConfig actions(int n) {
  PlannerConfig cfg{};
  cfg.actions_per_tick_max = n;
  return cfg;
}

} // namespace

TEST(PaymentPlanner, SameInputsSamePlan) {
  const Scenario s = village();
  const PaymentPlanner planner(actions(10));
  const PlanContext ctx{42, 3, 3000, 100};

  const auto p1 = planner.plan(ctx, s, nullptr);
  const auto p2 = planner.plan(ctx, s, nullptr);
  ASSERT_FALSE(p1.empty());
  EXPECT_EQ(p1, p2);

  const auto other = planner.plan(PlanContext{43, 3, 3000, 100}, s, nullptr);
  EXPECT_NE(p1, other);
}

TEST(PaymentPlanner, LowerIntensityIsAPrefix) {
  const Scenario s = village();
  const PaymentPlanner planner(actions(10));

  const auto low = planner.plan(PlanContext{11, 4, 4000, 40}, s, nullptr);
  const auto high = planner.plan(PlanContext{11, 4, 4000, 90}, s, nullptr);
  ASSERT_LE(low.size(), high.size());
  EXPECT_LE(low.size(), 4u);
  for (std::size_t i = 0; i < low.size(); ++i) EXPECT_EQ(low[i], high[i]);
}

TEST(PaymentPlanner, IntentsAreWellFormed) {
  const Scenario s = village();
  const PaymentPlanner planner(actions(10));

  for (Tick t = 1; t <= 5; ++t) {
    const auto plan = planner.plan(PlanContext{7, t, t * 1000, 100}, s, nullptr);
    EXPECT_LE(plan.size(), 10u);
    for (std::size_t i = 0; i < plan.size(); ++i) {
      const auto& p = plan[i];
      EXPECT_EQ(p.seq, static_cast<int>(i));
      EXPECT_EQ(p.currency, "UAH");
      EXPECT_NE(p.sender, p.receiver);
      EXPECT_GT(p.amount, 0);
      EXPECT_LE(p.amount, from_units(300));
    }
  }
}

TEST(PaymentPlanner, CachedGraphsGiveTheSamePlan) {
  const auto s = std::make_shared<const Scenario>(village());
  const PaymentPlanner planner(actions(10));
  RoutingCache cache;
  DebtSnapshot debts;
  debts.add("a", "b", "UAH", from_units(30));

  const PlanContext ctx{5, 2, 2000, 100};
  EXPECT_EQ(planner.plan(ctx, *s, &debts), planner.plan(ctx, s, &debts, cache));
}

TEST(PaymentPlanner, ZeroIntensityOrNoLinesPlansNothing) {
  const PaymentPlanner planner(actions(10));
  EXPECT_TRUE(planner.plan(PlanContext{1, 1, 1000, 0}, village(), nullptr).empty());

  Scenario empty = village();
  empty.trustlines.clear();
  EXPECT_TRUE(planner.plan(PlanContext{1, 1, 1000, 100}, empty, nullptr).empty());
}

TEST(PaymentPlanner, FullTargetWhenEveryoneAlwaysPays) {
  const PaymentPlanner planner(actions(5));
  const auto plan = planner.plan(PlanContext{1, 1, 1000, 100}, pair_scenario(), nullptr);
  ASSERT_EQ(plan.size(), 5u);
  for (const auto& p : plan) {
    EXPECT_EQ(p.sender, "a");
    EXPECT_EQ(p.receiver, "b");
  }
}

TEST(PaymentPlanner, ExhaustedCapacityPlansNothing) {
  const PaymentPlanner planner(actions(5));
  DebtSnapshot debts;
  debts.add("a", "b", "UAH", from_units(100));
  EXPECT_TRUE(planner.plan(PlanContext{1, 1, 1000, 100}, pair_scenario(), &debts).empty());
}

TEST(PaymentPlanner, WarmupRampsIntensity) {
  Scenario s = pair_scenario();
  s.settings.warmup.ticks = 10;

  EXPECT_NEAR(PaymentPlanner::effective_intensity(s, 0, 100), 0.1, 1e-12);
  EXPECT_NEAR(PaymentPlanner::effective_intensity(s, 5, 100), 0.55, 1e-12);
  EXPECT_NEAR(PaymentPlanner::effective_intensity(s, 10, 100), 1.0, 1e-12);
  EXPECT_NEAR(PaymentPlanner::effective_intensity(s, 10, 50), 0.5, 1e-12);

  s.settings.warmup.floor = 0.0;
  EXPECT_DOUBLE_EQ(PaymentPlanner::effective_intensity(s, 0, 100), 0.0);
  EXPECT_TRUE(PaymentPlanner(actions(5)).plan(PlanContext{1, 0, 0, 100}, s, nullptr).empty());
}

TEST(PaymentPlanner, StressMultipliersFollowTheWindow) {
  Scenario s = pair_scenario();
  ScenarioEvent rush{};
  rush.kind = ScenarioEventKind::Stress;
  rush.time_ms = 1000;
  rush.duration_ms = 500;
  rush.stress = {StressEffect{"mult", "tx_rate", "group:north", 1.5},
                 StressEffect{"mult", "tx_rate", "all", 50.0},
                 StressEffect{"add", "tx_rate", "all", 2.0}};
  s.events = {rush};

  const auto inside = PaymentPlanner::stress_multipliers(s, 1200);
  EXPECT_DOUBLE_EQ(inside.all, 10.0);
  EXPECT_DOUBLE_EQ(inside.by_group.at("north"), 1.5);

  const auto after = PaymentPlanner::stress_multipliers(s, 1500);
  EXPECT_DOUBLE_EQ(after.all, 1.0);
  EXPECT_TRUE(after.by_group.empty());
}

TEST(PaymentPlanner, CandidatesAreInvertedAndSorted) {
  Scenario s = village();
  s.trustlines.push_back(TrustLine{"c", "a", "UAH", from_units(10), TrustLineStatus::Frozen});

  const auto cands = PaymentPlanner::candidates(s);
  ASSERT_EQ(cands.size(), 6u);
  EXPECT_EQ(cands.front().receiver, "a");
  for (std::size_t i = 1; i < cands.size(); ++i) EXPECT_LE(cands[i - 1].receiver, cands[i].receiver);
  for (const auto& c : cands) EXPECT_FALSE(c.sender == "a" && c.receiver == "c");
}

TEST(PaymentPlanner, PickAmountRespectsCaps) {
  PlannerConfig cfg{};
  cfg.amount_cap = from_units(5);
  const PaymentPlanner planner(cfg);
  Rng rng(9);

  for (int i = 0; i < 50; ++i) {
    const auto a = planner.pick_amount(rng, from_units(100), nullptr);
    ASSERT_TRUE(a.has_value());
    EXPECT_GT(*a, 0);
    EXPECT_LE(*a, from_units(5));
  }

  EXPECT_FALSE(planner.pick_amount(rng, 0, nullptr).has_value());

  AmountModel too_big{};
  too_big.min = 20.0;
  EXPECT_FALSE(planner.pick_amount(rng, from_units(100), &too_big).has_value());

  const PaymentPlanner uncapped{};
  AmountModel model{10.0, 40.0, 2.0, 30.0};
  for (int i = 0; i < 50; ++i) {
    const auto a = uncapped.pick_amount(rng, from_units(100), &model);
    ASSERT_TRUE(a.has_value());
    EXPECT_GE(*a, from_units(2));
    EXPECT_LE(*a, from_units(30));
  }
}

TEST(PaymentPlanner, TickSeedFitsInThirtyTwoBits) {
  EXPECT_LE(PaymentPlanner::tick_seed(0xFFFF'FFFF'FFFFull, 123), 0xFFFF'FFFFull);
  EXPECT_NE(PaymentPlanner::tick_seed(1, 1), PaymentPlanner::tick_seed(1, 2));
  EXPECT_NE(PaymentPlanner::action_seed(10, 0), PaymentPlanner::action_seed(10, 1));
}

TEST(PaymentPlanner, AmountModelStaysWithinMinAndMax) {
  const PaymentPlanner planner{};
  Rng rng(2024);
  const AmountModel model{100.0, 300.0, 20.0, 200.0};

  for (int i = 0; i < 500; ++i) {
    const auto a = planner.pick_amount(rng, from_units(1000), &model);
    ASSERT_TRUE(a.has_value());
    EXPECT_GE(*a, from_units(20));
    EXPECT_LE(*a, from_units(200));
  }
}

TEST(PaymentPlanner, PlannedAmountsFitTheRemainingCapacity) {
  Scenario s = pair_scenario();
  s.seed_debts = {SeedDebt{"a", "b", "UAH", from_units(70)}};
  MemoryLedger ledger;
  test::seed_ledger(ledger, s);

  DebtSnapshot debts;
  {
    auto session = ledger.open_session();
    debts = load_debt_snapshot(*session);
    session->rollback();
  }
  ASSERT_EQ(debts.get("a", "b", "UAH"), from_units(70));

  const PaymentPlanner planner(actions(10));
  int checked = 0;
  for (Tick t = 1; t <= 20; ++t) {
    for (const auto& p : planner.plan(PlanContext{3, t, t * 1000, 100}, s, &debts)) {
      EXPECT_LE(p.amount, from_units(30));

      // each intent alone must still fit the unchanged ledger
      auto session = ledger.open_session();
      const auto res = session->attempt_payment(
          PaymentRequest{p.sender, p.receiver, p.currency, p.amount, "cap-" + std::to_string(t) + "-" + std::to_string(p.seq)});
      EXPECT_EQ(res.status, PaymentStatus::Committed);
      session->rollback();
      ++checked;
    }
  }
  EXPECT_GT(checked, 0);
}

TEST(PaymentPlanner, ReciprocityLetsDebtorsBeRepaidBeyondTheLine) {
  Scenario s = pair_scenario();
  s.trustlines.push_back(test::line("a", "b", 100));
  DebtSnapshot debts;
  debts.add("b", "a", "UAH", from_units(50));

  auto largest_a_to_b = [&](const Scenario& scenario) {
    Amount best = 0;
    for (Tick t = 1; t <= 20; ++t) {
      for (const auto& p : PaymentPlanner(actions(10)).plan(PlanContext{8, t, t * 1000, 100}, scenario, &debts)) {
        if (p.sender == "a") best = std::max(best, p.amount);
        if (p.sender == "b") EXPECT_LE(p.amount, from_units(50));
      }
    }
    return best;
  };

  EXPECT_LE(largest_a_to_b(s), from_units(100));

  s.settings.flow.reciprocity_bonus = 1.0;
  const Amount boosted = largest_a_to_b(s);
  EXPECT_GT(boosted, from_units(100));
  EXPECT_LE(boosted, from_units(150));
}

namespace {

// n1, n2 in "north" use the flow profile; s1, s2 in "south" have none.
// Everyone extends 100 to everyone else.
Scenario flow_scenario() {
  Scenario s{};
  s.id = "flow";
  s.equivalents = {"UAH"};
  s.participants = {test::person("n1", "north", "flow"), test::person("n2", "north", "flow"),
                    test::person("s1", "south"), test::person("s2", "south")};
  const std::vector<Pid> ids = {"n1", "n2", "s1", "s2"};
  for (const auto& a : ids) {
    for (const auto& b : ids) {
      if (a != b) s.trustlines.push_back(test::line(a, b, 100));
    }
  }
  BehaviorProfile flow{};
  flow.id = "flow";
  flow.flow_chains = {{"north", "south"}};
  flow.flow_affinity = 1.0;
  s.profiles = {flow};
  return s;
}

} // namespace

TEST(PaymentPlanner, FlowChainsSteerReceiversToTheTargetGroup) {
  const PaymentPlanner planner(actions(10));
  auto north_to_north = [&](const Scenario& s) {
    int north_senders = 0;
    int to_north = 0;
    for (Tick t = 1; t <= 20; ++t) {
      for (const auto& p : planner.plan(PlanContext{5, t, t * 1000, 100}, s, nullptr)) {
        if (p.sender[0] != 'n') continue;
        ++north_senders;
        if (p.receiver[0] == 'n') ++to_north;
      }
    }
    EXPECT_GT(north_senders, 0);
    return to_north;
  };

  Scenario off = flow_scenario();
  EXPECT_GT(north_to_north(off), 0);

  Scenario on = flow_scenario();
  on.settings.flow.enabled = true;
  EXPECT_EQ(north_to_north(on), 0);
}

TEST(PaymentPlanner, PeriodicityDropsAmountsWithNoAcceptance) {
  // default p50 is 50; with factor 3 anything at or below 50 * e^(-1/3)
  // has zero acceptance
  auto smallest = [](std::optional<double> factor) {
    Scenario s = pair_scenario();
    BehaviorProfile p{};
    p.id = "periodic";
    p.periodicity_factor = factor;
    s.profiles = {p};
    s.participants[0].profile_id = "periodic";

    Amount low = from_units(1000);
    int n = 0;
    for (Tick t = 1; t <= 30; ++t) {
      for (const auto& i : PaymentPlanner(actions(10)).plan(PlanContext{4, t, t * 1000, 100}, s, nullptr)) {
        low = std::min(low, i.amount);
        ++n;
      }
    }
    EXPECT_GT(n, 0);
    return low;
  };

  EXPECT_LT(smallest(std::nullopt), from_units(35));
  EXPECT_GT(smallest(3.0), from_units(35));
}
