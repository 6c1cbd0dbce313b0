#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "mcsim/memory_ledger.hpp"
#include "test_support.hpp"

using namespace mcsim;

static LedgerError rejection_of(ILedgerSession& s, const PaymentRequest& req) {
  try {
    s.attempt_payment(req);
  } catch (const LedgerRejection& e) {
    return e.error();
  }
  ADD_FAILURE() << "payment was not rejected";
  return {};
}

TEST(MemoryLedger, DirectPaymentCreatesDebt) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());

  auto s = ledger.open_session();
  const auto res = s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(40), "k1"});
  EXPECT_EQ(res.status, PaymentStatus::Committed);
  ASSERT_EQ(res.route.size(), 2u);
  EXPECT_EQ(res.route[0], "a");
  EXPECT_EQ(res.route[1], "b");
  s->commit();

  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), from_units(40));
}

TEST(MemoryLedger, MultiHopRouteMovesDebtAlongEveryHop) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());

  auto s = ledger.open_session();
  const auto res = s->attempt_payment(PaymentRequest{"a", "c", "UAH", from_units(10), ""});
  ASSERT_EQ(res.route.size(), 3u);
  EXPECT_EQ(res.route[1], "b");
  EXPECT_EQ(s->debt("a", "b", "UAH"), from_units(10));
  EXPECT_EQ(s->debt("b", "c", "UAH"), from_units(10));
}

TEST(MemoryLedger, RejectsWithRoutingCodes) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());
  auto s = ledger.open_session();

  const auto no_capacity = rejection_of(*s, PaymentRequest{"a", "b", "UAH", from_units(150), ""});
  EXPECT_EQ(no_capacity.kind, LedgerErrorKind::Routing);
  EXPECT_EQ(no_capacity.code, "E002");

  const auto no_route = rejection_of(*s, PaymentRequest{"b", "a", "UAH", from_units(1), ""});
  EXPECT_EQ(no_route.kind, LedgerErrorKind::Routing);
  EXPECT_EQ(no_route.code, "E001");

  const auto bad_eq = rejection_of(*s, PaymentRequest{"a", "b", "EUR", from_units(1), ""});
  EXPECT_EQ(bad_eq.kind, LedgerErrorKind::NotFound);
  EXPECT_EQ(bad_eq.status_code, 404);
}

TEST(MemoryLedger, SuspendedParticipantIsForbidden) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());
  auto s = ledger.open_session();
  ASSERT_TRUE(s->set_participant_status("b", ParticipantStatus::Suspended));

  const auto err = rejection_of(*s, PaymentRequest{"a", "b", "UAH", from_units(1), ""});
  EXPECT_EQ(err.kind, LedgerErrorKind::Forbidden);
  EXPECT_EQ(err.status_code, 403);
}

TEST(MemoryLedger, IdempotencyKeyReplaysFirstResult) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());
  auto s = ledger.open_session();

  const auto r1 = s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(5), "same"});
  const auto r2 = s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(5), "same"});
  EXPECT_EQ(r1.tx_id, r2.tx_id);
  EXPECT_EQ(s->debt("a", "b", "UAH"), from_units(5));
}

TEST(MemoryLedger, RollbackAndSavepointsDiscardWork) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::chain_scenario());

  {
    auto s = ledger.open_session();
    s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(5), ""});
    s->rollback();
  }
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), 0);

  auto s = ledger.open_session();
  s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(5), ""});
  {
    NestedScope scope(*s);
    s->attempt_payment(PaymentRequest{"a", "b", "UAH", from_units(7), ""});
  }
  EXPECT_EQ(s->debt("a", "b", "UAH"), from_units(5));
  s->commit();
  EXPECT_EQ(ledger.committed_debt("a", "b", "UAH"), from_units(5));
}

TEST(MemoryLedger, SettleCycleNeedsEnoughDebtOnEveryEdge) {
  MemoryLedger ledger;
  test::seed_ledger(ledger, test::triangle_scenario());
  auto s = ledger.open_session();

  const std::vector<DebtEdge> cycle = {{"a", "b", 0}, {"b", "c", 0}, {"c", "a", 0}};
  EXPECT_FALSE(s->settle_cycle("UAH", cycle, from_units(60)));
  EXPECT_TRUE(s->settle_cycle("UAH", cycle, from_units(50)));
  EXPECT_TRUE(s->debts().empty());
}

TEST(MemoryLedger, SecondWriterTimesOut) {
  MemoryLedgerOptions opts{};
  opts.lock_timeout = std::chrono::milliseconds(50);
  MemoryLedger ledger(opts);
  test::seed_ledger(ledger, test::chain_scenario());

  auto holder = ledger.open_session();
  holder->participants(); // takes the writer slot

  std::atomic<bool> timed_out{false};
  std::thread other([&] {
    auto s = ledger.open_session();
    try {
      s->participants();
    } catch (const LedgerTimeout&) {
      timed_out.store(true);
    }
  });
  other.join();
  EXPECT_TRUE(timed_out.load());

  holder->commit();
  std::thread after([&] {
    auto s = ledger.open_session();
    EXPECT_EQ(s->participants().size(), 3u);
  });
  after.join();
}
