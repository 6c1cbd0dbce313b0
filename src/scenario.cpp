#include "mcsim/scenario.hpp"

#include <algorithm>

#include "mcsim/routing_cache.hpp"

namespace mcsim {

const Participant* Scenario::find_participant(const Pid& pid) const noexcept {
  for (const auto& p : participants) {
    if (p.id == pid) return &p;
  }
  return nullptr;
}

const TrustLine* Scenario::find_trustline(const Pid& from, const Pid& to, const Currency& eq) const noexcept {
  for (const auto& tl : trustlines) {
    if (tl.from == from && tl.to == to && tl.currency == eq) return &tl;
  }
  return nullptr;
}

const BehaviorProfile* Scenario::find_profile(const std::string& id) const noexcept {
  if (id.empty()) return nullptr;
  for (const auto& bp : profiles) {
    if (bp.id == id) return &bp;
  }
  return nullptr;
}

bool stress_active(const ScenarioEvent& e, SimMs sim_ms) noexcept {
  if (e.kind != ScenarioEventKind::Stress) return false;
  const SimMs dur = e.duration_ms.value_or(0);
  if (dur <= 0) return sim_ms == e.time_ms;
  return e.time_ms <= sim_ms && sim_ms < e.time_ms + dur;
}

ScenarioState::ScenarioState(Scenario s, RoutingCache* cache)
  : doc_(std::make_shared<const Scenario>(std::move(s))), cache_(cache) {}

std::shared_ptr<const Scenario> ScenarioState::snapshot() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return doc_;
}

void ScenarioState::attach_cache(RoutingCache* cache) noexcept {
  std::lock_guard<std::mutex> lk(mtx_);
  cache_ = cache;
}

void ScenarioState::invalidate_(const Currency& eq) {
  if (cache_) cache_->invalidate(eq);
}

bool ScenarioState::set_trustline_limits(const std::vector<LimitUpdate>& updates) {
  if (updates.empty()) return false;
  std::lock_guard<std::mutex> lk(mtx_);
  auto next = std::make_shared<Scenario>(*doc_);
  std::vector<Currency> touched;
  for (const auto& u : updates) {
    for (auto& tl : next->trustlines) {
      if (tl.from != u.from || tl.to != u.to || tl.currency != u.currency) continue;
      if (tl.limit != u.limit) {
        tl.limit = u.limit;
        touched.push_back(u.currency);
      }
      break;
    }
  }
  if (touched.empty()) return false;
  doc_ = std::move(next);
  std::sort(touched.begin(), touched.end());
  touched.erase(std::unique(touched.begin(), touched.end()), touched.end());
  for (const auto& eq : touched) invalidate_(eq);
  return true;
}

bool ScenarioState::set_trustline_status(const Pid& from, const Pid& to, const Currency& eq, TrustLineStatus st) {
  std::lock_guard<std::mutex> lk(mtx_);
  const TrustLine* cur = doc_->find_trustline(from, to, eq);
  if (!cur || cur->status == st) return false;
  auto next = std::make_shared<Scenario>(*doc_);
  for (auto& tl : next->trustlines) {
    if (tl.from == from && tl.to == to && tl.currency == eq) {
      tl.status = st;
      break;
    }
  }
  doc_ = std::move(next);
  invalidate_(eq);
  return true;
}

bool ScenarioState::set_participant_status(const Pid& pid, ParticipantStatus st) {
  std::lock_guard<std::mutex> lk(mtx_);
  const Participant* cur = doc_->find_participant(pid);
  if (!cur || cur->status == st) return false;
  auto next = std::make_shared<Scenario>(*doc_);
  for (auto& p : next->participants) {
    if (p.id == pid) {
      p.status = st;
      break;
    }
  }
  doc_ = std::move(next);
  return true;
}

bool ScenarioState::add_participant(const Participant& p) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (doc_->find_participant(p.id)) return false;
  auto next = std::make_shared<Scenario>(*doc_);
  next->participants.push_back(p);
  doc_ = std::move(next);
  return true;
}

bool ScenarioState::add_trustline(const TrustLine& tl) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (doc_->find_trustline(tl.from, tl.to, tl.currency)) return false;
  auto next = std::make_shared<Scenario>(*doc_);
  next->trustlines.push_back(tl);
  if (std::find(next->equivalents.begin(), next->equivalents.end(), tl.currency) == next->equivalents.end()) {
    next->equivalents.push_back(tl.currency);
  }
  doc_ = std::move(next);
  invalidate_(tl.currency);
  return true;
}

} // namespace mcsim
