#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "mcsim/types.hpp"

namespace mcsim {

using EdgeRef = std::pair<Pid, Pid>; // (from, to) in payment direction

// Visualization state of one trust line after a change.
struct EdgePatch {
  Pid from{};
  Pid to{};
  Currency currency{};
  Amount limit{};
  Amount used{};
  Amount available{};
  TrustLineStatus status{TrustLineStatus::Active};
};

struct NodePatch {
  Pid pid{};
  Amount net_balance{}; // owed to the node minus owed by it
  ParticipantStatus status{ParticipantStatus::Active};
};

struct TxUpdated {
  Currency currency{};
  Pid from{};
  Pid to{};
  Amount amount{};
  std::vector<EdgeRef> edges{};
  std::vector<EdgePatch> edge_patch{};
  std::vector<NodePatch> node_patch{};
};

struct TxFailed {
  Currency currency{};
  Pid from{};
  Pid to{};
  std::string error_code{};
  std::string error_message{};
};

struct ClearingPlanStep {
  int64_t at_ms{};
  std::string action{}; // "highlight_edges" | "particles" | "flash"
  std::vector<EdgeRef> edges{};
};

struct ClearingPlan {
  Currency currency{};
  std::string plan_id{};
  std::vector<ClearingPlanStep> steps{};
};

struct ClearingDone {
  Currency currency{};
  std::string plan_id{};
  int cleared_cycles{};
  std::string cleared_amount{"0.00"};
  std::vector<EdgePatch> edge_patch{};
  std::vector<NodePatch> node_patch{};
};

struct TopologyChanged {
  Currency currency{};
  std::string reason{};
  std::vector<EdgePatch> edges{};
  std::vector<NodePatch> nodes{};
};

struct RunStatusEvent {
  RunState state{RunState::Running};
  Tick tick{};
  SimMs sim_ms{};
  int intensity_percent{};
  uint64_t attempts{};
  uint64_t committed{};
  uint64_t rejected{};
  uint64_t errors{};
  uint64_t timeouts{};
  uint64_t errors_last_1m{};
  int64_t stall_ticks{};
  std::string last_error_code{};
  std::string last_error_message{};
};

using DomainEvent = std::variant<TxUpdated, TxFailed, ClearingPlan, ClearingDone, TopologyChanged, RunStatusEvent>;

enum class EventType : uint8_t { TxUpdated, TxFailed, ClearingPlan, ClearingDone, TopologyChanged, RunStatus };

inline EventType type_of(const DomainEvent& e) noexcept {
  return static_cast<EventType>(e.index()); // relies on variant order above
}

inline std::string_view to_string(EventType t) noexcept {
  switch (t) {
    case EventType::TxUpdated:       return "tx.updated";
    case EventType::TxFailed:        return "tx.failed";
    case EventType::ClearingPlan:    return "clearing.plan";
    case EventType::ClearingDone:    return "clearing.done";
    case EventType::TopologyChanged: return "topology.changed";
    case EventType::RunStatus:       return "run_status";
  }
  return "unknown";
}

struct EventEnvelope {
  std::string run_id{};
  uint64_t event_id{}; // monotonic per run, starting at 1
  DomainEvent payload{};
};

class IEventSink {
public:
  virtual ~IEventSink() = default;
  virtual void on_event(const EventEnvelope& e) = 0;
};

// Collects everything it receives.
class RecordingSink : public IEventSink {
public:
  void on_event(const EventEnvelope& e) override;

  std::vector<EventEnvelope> events() const;
  std::vector<EventEnvelope> of_type(EventType t) const;
  void clear();

private:
  mutable std::mutex mtx_;
  std::vector<EventEnvelope> events_{};
};

// Per-run publisher. Assigns event ids, keeps a bounded replay buffer and
// forwards to the sink in id order.
class EventBus {
public:
  explicit EventBus(std::string run_id, IEventSink* sink = nullptr, std::size_t replay_capacity = 2000);

  // Returns the assigned id, or 0 when the event was dropped. A topology
  // change without any edge or node patch is dropped.
  uint64_t publish(DomainEvent e);

  // Events with id > after_id still held in the buffer.
  std::vector<EventEnvelope> replay_since(uint64_t after_id) const;

  uint64_t last_event_id() const;

  void set_sink(IEventSink* sink);

private:
  std::string run_id_;
  mutable std::mutex mtx_;
  IEventSink* sink_{nullptr};
  std::size_t replay_capacity_{2000};
  uint64_t next_id_{1};
  std::deque<EventEnvelope> replay_{};
};

} // namespace mcsim
