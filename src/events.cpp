#include "mcsim/events.hpp"

#include "mcsim/log.hpp"

namespace mcsim {

void RecordingSink::on_event(const EventEnvelope& e) {
  std::lock_guard<std::mutex> lk(mtx_);
  events_.push_back(e);
}

std::vector<EventEnvelope> RecordingSink::events() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return events_;
}

std::vector<EventEnvelope> RecordingSink::of_type(EventType t) const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<EventEnvelope> out;
  for (const auto& e : events_) {
    if (type_of(e.payload) == t) out.push_back(e);
  }
  return out;
}

void RecordingSink::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  events_.clear();
}

EventBus::EventBus(std::string run_id, IEventSink* sink, std::size_t replay_capacity)
  : run_id_(std::move(run_id)), sink_(sink), replay_capacity_(replay_capacity) {}

uint64_t EventBus::publish(DomainEvent e) {
  if (const auto* tc = std::get_if<TopologyChanged>(&e)) {
    if (tc->edges.empty() && tc->nodes.empty()) {
      MCSIM_LOG_DEBUG("events.topology_changed_empty_dropped run_id=" << run_id_ << " eq=" << tc->currency);
      return 0;
    }
  }

  std::lock_guard<std::mutex> lk(mtx_);
  EventEnvelope env{run_id_, next_id_++, std::move(e)};

  replay_.push_back(env);
  while (replay_.size() > replay_capacity_) replay_.pop_front();

  if (sink_) {
    try {
      sink_->on_event(env);
    } catch (const std::exception& ex) {
      MCSIM_LOG_WARN("events.sink_failed run_id=" << run_id_ << " type=" << to_string(type_of(env.payload))
                     << " err=" << ex.what());
    }
  }
  return env.event_id;
}

std::vector<EventEnvelope> EventBus::replay_since(uint64_t after_id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<EventEnvelope> out;
  for (const auto& e : replay_) {
    if (e.event_id > after_id) out.push_back(e);
  }
  return out;
}

uint64_t EventBus::last_event_id() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return next_id_ - 1;
}

void EventBus::set_sink(IEventSink* sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink;
}

} // namespace mcsim
