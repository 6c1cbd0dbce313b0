#include "mcsim/routing_cache.hpp"

#include <algorithm>

namespace mcsim {

Adjacency Adjacency::build(const Scenario& s, const Currency& eq) {
  Adjacency a{};
  for (const auto& tl : s.trustlines) {
    if (tl.currency != eq) continue;
    if (tl.status != TrustLineStatus::Active) continue;
    if (tl.from.empty() || tl.to.empty() || tl.limit <= 0) continue;

    // credit runs creditor->debtor, payments run debtor->creditor
    const Pid& sender = tl.to;
    const Pid& receiver = tl.from;

    a.out[sender].push_back(Neighbor{receiver, tl.limit});
    a.direct[{sender, receiver}] = tl.limit;

    auto [ito, ins_o] = a.max_outgoing_limit.emplace(sender, tl.limit);
    if (!ins_o && tl.limit > ito->second) ito->second = tl.limit;

    auto [iti, ins_i] = a.max_incoming_limit.emplace(receiver, tl.limit);
    if (!ins_i && tl.limit > iti->second) iti->second = tl.limit;
  }

  for (auto& [sender, nbrs] : a.out) {
    std::stable_sort(nbrs.begin(), nbrs.end(),
                     [](const Neighbor& x, const Neighbor& y) { return x.pid < y.pid; });
  }
  return a;
}

std::shared_ptr<const Adjacency> RoutingCache::get(const std::shared_ptr<const Scenario>& scenario, const Currency& eq) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = entries_.find(eq);
  if (it != entries_.end() && it->second.source == scenario) return it->second.graph;

  Entry e{};
  e.source = scenario;
  e.graph = std::make_shared<const Adjacency>(Adjacency::build(*scenario, eq));
  auto graph = e.graph;
  entries_[eq] = std::move(e);
  return graph;
}

void RoutingCache::invalidate(const Currency& eq) {
  std::lock_guard<std::mutex> lk(mtx_);
  entries_.erase(eq);
}

} // namespace mcsim
