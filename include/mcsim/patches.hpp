#pragma once
#include <vector>

#include "mcsim/events.hpp"
#include "mcsim/ledger.hpp"

namespace mcsim {

// Patches for trust lines given as (creditor, debtor). Missing lines are skipped.
std::vector<EdgePatch> trustline_patches(ILedgerSession& s, const Currency& eq, const std::vector<EdgeRef>& lines);

// Patches for the trust lines a payment route passed through. Hops are given
// in payment direction (payer, payee); both lines of a pair are included when
// present.
std::vector<EdgePatch> route_patches(ILedgerSession& s, const Currency& eq, const std::vector<EdgeRef>& hops);

std::vector<NodePatch> node_patches(ILedgerSession& s, const Currency& eq, const std::vector<Pid>& pids);

} // namespace mcsim
