#include "mcsim/patches.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace mcsim {

std::vector<EdgePatch> trustline_patches(ILedgerSession& s, const Currency& eq, const std::vector<EdgeRef>& lines) {
  std::vector<EdgePatch> out;
  std::set<EdgeRef> seen;
  for (const auto& [creditor, debtor] : lines) {
    if (!seen.insert({creditor, debtor}).second) continue;
    const auto tl = s.find_trustline(creditor, debtor, eq);
    if (!tl) continue;

    EdgePatch p{};
    p.from = creditor;
    p.to = debtor;
    p.currency = eq;
    p.limit = tl->limit;
    p.used = s.debt(debtor, creditor, eq);
    p.available = std::max<Amount>(0, tl->limit - p.used);
    p.status = tl->status;
    out.push_back(std::move(p));
  }
  return out;
}

std::vector<EdgePatch> route_patches(ILedgerSession& s, const Currency& eq, const std::vector<EdgeRef>& hops) {
  std::vector<EdgeRef> lines;
  lines.reserve(hops.size() * 2);
  for (const auto& [payer, payee] : hops) {
    lines.emplace_back(payee, payer); // payee extends credit to payer
    lines.emplace_back(payer, payee); // debt the payer may have paid down
  }
  return trustline_patches(s, eq, lines);
}

std::vector<NodePatch> node_patches(ILedgerSession& s, const Currency& eq, const std::vector<Pid>& pids) {
  if (pids.empty()) return {};

  std::map<Pid, Amount> net;
  for (const auto& pid : pids) net.emplace(pid, 0);
  for (const auto& d : s.debts()) {
    if (d.currency != eq) continue;
    if (auto it = net.find(d.creditor); it != net.end()) it->second += d.amount;
    if (auto it = net.find(d.debtor); it != net.end()) it->second -= d.amount;
  }

  std::vector<NodePatch> out;
  out.reserve(net.size());
  for (const auto& [pid, balance] : net) {
    const auto p = s.find_participant(pid);
    if (!p) continue;
    out.push_back(NodePatch{pid, balance, p->status});
  }
  return out;
}

} // namespace mcsim
