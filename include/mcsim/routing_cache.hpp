#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "mcsim/scenario.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

// Payment-direction graph of one currency: debtor -> creditor over active
// trust lines with a positive limit.
struct Adjacency {
  struct Neighbor {
    Pid pid{};
    Amount limit{};
  };

  std::map<Pid, std::vector<Neighbor>> out{};       // neighbours sorted by pid
  std::map<Pid, Amount> max_outgoing_limit{};       // per sender
  std::map<Pid, Amount> max_incoming_limit{};       // per receiver
  std::map<std::pair<Pid, Pid>, Amount> direct{};   // (sender, receiver)

  static Adjacency build(const Scenario& s, const Currency& eq);
};

// Per-run cache of payment graphs keyed by currency. Topology mutations
// call invalidate(eq); an entry is also rebuilt when asked for a newer
// scenario snapshot than it was built from.
class RoutingCache {
public:
  std::shared_ptr<const Adjacency> get(const std::shared_ptr<const Scenario>& scenario, const Currency& eq);

  void invalidate(const Currency& eq);

private:
  struct Entry {
    std::shared_ptr<const Scenario> source{};
    std::shared_ptr<const Adjacency> graph{};
  };

  std::mutex mtx_;
  std::map<Currency, Entry> entries_{};
};

} // namespace mcsim
