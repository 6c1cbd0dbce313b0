#include <gtest/gtest.h>

#include <stdexcept>

#include "mcsim/events.hpp"

using namespace mcsim;

namespace {

class ThrowingSink : public IEventSink {
public:
  void on_event(const EventEnvelope&) override {
    ++calls;
    throw std::runtime_error("socket closed");
  }
  int calls{};
};

TxFailed failed(const Pid& from) { return TxFailed{"UAH", from, "b", "PAYMENT_REJECTED", "PAYMENT_REJECTED"}; }

} // namespace

TEST(EventBus, IdsStartAtOneAndIncrease) {
  RecordingSink sink;
  EventBus bus("r1", &sink);
  EXPECT_EQ(bus.last_event_id(), 0u);

  EXPECT_EQ(bus.publish(failed("a")), 1u);
  EXPECT_EQ(bus.publish(TxUpdated{}), 2u);
  EXPECT_EQ(bus.last_event_id(), 2u);

  const auto events = sink.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].run_id, "r1");
  EXPECT_EQ(events[0].event_id, 1u);
  EXPECT_EQ(type_of(events[1].payload), EventType::TxUpdated);
}

TEST(EventBus, EmptyTopologyChangeIsDropped) {
  RecordingSink sink;
  EventBus bus("r1", &sink);

  EXPECT_EQ(bus.publish(TopologyChanged{"UAH", "inject", {}, {}}), 0u);
  EXPECT_TRUE(sink.events().empty());
  EXPECT_EQ(bus.last_event_id(), 0u);

  TopologyChanged tc{};
  tc.currency = "UAH";
  tc.reason = "inject";
  tc.nodes.push_back(NodePatch{"a", 0, ParticipantStatus::Active});
  EXPECT_EQ(bus.publish(tc), 1u);
}

TEST(EventBus, ReplayKeepsTheNewestEvents) {
  EventBus bus("r1", nullptr, 3);
  for (int i = 0; i < 5; ++i) bus.publish(failed("a"));

  const auto all = bus.replay_since(0);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all.front().event_id, 3u);
  EXPECT_EQ(all.back().event_id, 5u);

  const auto tail = bus.replay_since(4);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].event_id, 5u);
  EXPECT_TRUE(bus.replay_since(5).empty());
}

TEST(EventBus, FailingSinkDoesNotStopPublishing) {
  ThrowingSink sink;
  EventBus bus("r1", &sink);

  EXPECT_EQ(bus.publish(failed("a")), 1u);
  EXPECT_EQ(bus.publish(failed("b")), 2u);
  EXPECT_EQ(sink.calls, 2);
  EXPECT_EQ(bus.replay_since(0).size(), 2u);
}

TEST(EventBus, SinkCanBeSwapped) {
  RecordingSink first;
  RecordingSink second;
  EventBus bus("r1", &first);
  bus.publish(failed("a"));
  bus.set_sink(&second);
  bus.publish(failed("b"));

  EXPECT_EQ(first.events().size(), 1u);
  ASSERT_EQ(second.events().size(), 1u);
  EXPECT_EQ(second.events()[0].event_id, 2u);
}

TEST(EventType, WireNames) {
  EXPECT_EQ(to_string(EventType::TxUpdated), "tx.updated");
  EXPECT_EQ(to_string(EventType::TxFailed), "tx.failed");
  EXPECT_EQ(to_string(EventType::ClearingPlan), "clearing.plan");
  EXPECT_EQ(to_string(EventType::ClearingDone), "clearing.done");
  EXPECT_EQ(to_string(EventType::TopologyChanged), "topology.changed");
  EXPECT_EQ(to_string(EventType::RunStatus), "run_status");

  EXPECT_EQ(type_of(DomainEvent{ClearingDone{}}), EventType::ClearingDone);
  EXPECT_EQ(type_of(DomainEvent{RunStatusEvent{}}), EventType::RunStatus);
}
