#include <gtest/gtest.h>

#include "mcsim/clearing_policy.hpp"

using namespace mcsim;

namespace {

AdaptivePolicyConfig small_window() {
  AdaptivePolicyConfig cfg{};
  cfg.window_ticks = 2;
  cfg.no_capacity_high = 0.6;
  cfg.no_capacity_low = 0.3;
  cfg.min_interval_ticks = 1;
  return cfg;
}

} // namespace

TEST(ClearingPolicy, ValidatedClampsWindow) {
  AdaptivePolicyConfig cfg{};
  cfg.window_ticks = 0;
  EXPECT_EQ(cfg.validated().window_ticks, 1);
}

TEST(ClearingPolicy, NoCapacityRateOverWindow) {
  AdaptiveClearingState state(small_window());
  EXPECT_DOUBLE_EQ(state.no_capacity_rate("UAH"), 0.0);

  state.record_tick_signals("UAH", {10, 5});
  state.record_tick_signals("UAH", {10, 0});
  state.record_tick_signals("UAH", {10, 10});
  EXPECT_EQ(state.window_fill("UAH"), 2u);
  EXPECT_DOUBLE_EQ(state.no_capacity_rate("UAH"), 0.5);
}

TEST(ClearingPolicy, WarmupWithoutFallbackNeverRuns) {
  const AdaptivePolicyConfig cfg = small_window();
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 10});
  const auto d = policy.evaluate("UAH", state, 1);
  EXPECT_FALSE(d.should_run);
  EXPECT_EQ(d.reason, ClearingReason::WarmupDisabled);
}

TEST(ClearingPolicy, WarmupFallbackUsesMinimumBudget) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.window_ticks = 5;
  cfg.warmup_fallback_cadence = 2;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);
  state.record_tick_signals("UAH", {1, 0});

  EXPECT_EQ(policy.evaluate("UAH", state, 3).reason, ClearingReason::WarmupFallbackSkip);

  const auto d = policy.evaluate("UAH", state, 4);
  EXPECT_TRUE(d.should_run);
  EXPECT_EQ(d.reason, ClearingReason::WarmupFallbackRun);
  EXPECT_EQ(d.max_depth, 3);
  EXPECT_EQ(d.time_budget_ms, 50);
}

TEST(ClearingPolicy, HysteresisEntersAndExits) {
  const AdaptivePolicyConfig cfg = small_window();
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 8});
  state.record_tick_signals("UAH", {10, 8});
  const auto enter = policy.evaluate("UAH", state, 1);
  EXPECT_TRUE(enter.should_run);
  EXPECT_EQ(enter.reason, ClearingReason::RateHighEnter);
  EXPECT_EQ(enter.max_depth, 6);
  EXPECT_EQ(enter.time_budget_ms, 250);

  // in the band: stays active
  state.record_tick_signals("UAH", {10, 4});
  state.record_tick_signals("UAH", {10, 4});
  EXPECT_EQ(policy.evaluate("UAH", state, 2).reason, ClearingReason::RunActive);

  state.record_tick_signals("UAH", {10, 0});
  state.record_tick_signals("UAH", {10, 0});
  EXPECT_EQ(policy.evaluate("UAH", state, 3).reason, ClearingReason::RateLowExit);
  EXPECT_EQ(policy.evaluate("UAH", state, 4).reason, ClearingReason::SkipNotActive);
}

TEST(ClearingPolicy, RateAtLowThresholdKeepsState) {
  const AdaptivePolicyConfig cfg = small_window();
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 3});
  state.record_tick_signals("UAH", {10, 3});
  EXPECT_EQ(policy.evaluate("UAH", state, 1).reason, ClearingReason::SkipNotActive);
}

TEST(ClearingPolicy, PressureScalesDepthAndBudget) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.no_capacity_low = 0.25;
  cfg.no_capacity_high = 0.5;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {20, 10});
  state.record_tick_signals("UAH", {20, 10});
  ASSERT_TRUE(policy.evaluate("UAH", state, 1).should_run);

  // back into the band at half pressure
  cfg.no_capacity_high = 0.75;
  const AdaptiveClearingPolicy wide(cfg);
  const auto d = wide.evaluate("UAH", state, 2);
  EXPECT_TRUE(d.should_run);
  EXPECT_EQ(d.reason, ClearingReason::RunActive);
  EXPECT_EQ(d.max_depth, 4);
  EXPECT_EQ(d.time_budget_ms, 150);
}

TEST(ClearingPolicy, GlobalCeilingsCapTheDecision) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.global_max_depth_ceiling = 4;
  cfg.global_time_budget_ms_ceiling = 100;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 10});
  state.record_tick_signals("UAH", {10, 10});
  const auto d = policy.evaluate("UAH", state, 1);
  EXPECT_EQ(d.max_depth, 4);
  EXPECT_EQ(d.time_budget_ms, 100);
}

TEST(ClearingPolicy, CeilingsWinOverMinimumsAboveThem) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.max_depth_min = 8;
  cfg.max_depth_max = 10;
  cfg.time_budget_ms_min = 400;
  cfg.time_budget_ms_max = 500;
  cfg.global_max_depth_ceiling = 6;
  cfg.global_time_budget_ms_ceiling = 250;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 10});
  state.record_tick_signals("UAH", {10, 10});
  const auto d = policy.evaluate("UAH", state, 1);
  ASSERT_TRUE(d.should_run);
  EXPECT_EQ(d.max_depth, 6);
  EXPECT_EQ(d.time_budget_ms, 250);

  // inverted bands are capped the same way
  cfg.max_depth_max = 3;
  cfg.time_budget_ms_max = 50;
  const auto inverted = AdaptiveClearingPolicy(cfg).evaluate("UAH", state, 5);
  ASSERT_TRUE(inverted.should_run);
  EXPECT_LE(*inverted.max_depth, 6);
  EXPECT_LE(*inverted.time_budget_ms, 250);
}

TEST(ClearingPolicy, MinIntervalAndBackoff) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.min_interval_ticks = 5;
  cfg.backoff_max_interval_ticks = 60;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);

  state.record_tick_signals("UAH", {10, 10});
  state.record_tick_signals("UAH", {10, 10});
  ASSERT_TRUE(policy.evaluate("UAH", state, 10).should_run);

  state.update_clearing_result("UAH", 25.0, 3.0, 10);
  EXPECT_EQ(policy.evaluate("UAH", state, 12).reason, ClearingReason::SkipMinInterval);
  EXPECT_TRUE(policy.evaluate("UAH", state, 15).should_run);

  state.update_clearing_result("UAH", 0.0, 3.0, 15);
  EXPECT_EQ(state.per_currency("UAH").backoff_interval, 5);
  state.update_clearing_result("UAH", 0.0, 3.0, 20);
  EXPECT_EQ(state.per_currency("UAH").backoff_interval, 10);
  EXPECT_EQ(state.per_currency("UAH").consecutive_zero_yield, 2);

  EXPECT_EQ(policy.evaluate("UAH", state, 27).reason, ClearingReason::SkipBackoff);
  EXPECT_TRUE(policy.evaluate("UAH", state, 30).should_run);

  state.update_clearing_result("UAH", 1.0, 3.0, 30);
  EXPECT_EQ(state.per_currency("UAH").backoff_interval, 0);
  EXPECT_EQ(state.per_currency("UAH").consecutive_zero_yield, 0);
}

TEST(ClearingPolicy, BackoffIsCapped) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.min_interval_ticks = 5;
  cfg.backoff_max_interval_ticks = 12;
  AdaptiveClearingState state(cfg);
  for (int i = 0; i < 6; ++i) state.update_clearing_result("UAH", 0.0, 1.0, i);
  EXPECT_EQ(state.per_currency("UAH").backoff_interval, 12);
}

TEST(ClearingPolicy, GuardrailSkipsUnderLoad) {
  AdaptivePolicyConfig cfg = small_window();
  cfg.inflight_threshold = 2;
  AdaptiveClearingState state(cfg);
  const AdaptiveClearingPolicy policy(cfg);
  state.record_tick_signals("UAH", {10, 10});
  state.record_tick_signals("UAH", {10, 10});

  const auto d = policy.evaluate("UAH", state, 1, LoadSignals{3, 0});
  EXPECT_FALSE(d.should_run);
  EXPECT_EQ(d.reason, ClearingReason::SkipGuardrail);
  EXPECT_EQ(to_string(d.reason), "SKIP_GUARDRAIL");
}
