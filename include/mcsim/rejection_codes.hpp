#pragma once
#include <string>

#include "mcsim/ledger.hpp"

namespace mcsim {

// Stable labels for client-side payment rejections.
inline constexpr const char* kPaymentRejected = "PAYMENT_REJECTED";
inline constexpr const char* kRoutingNoCapacity = "ROUTING_NO_CAPACITY";

// Maps a ledger diagnostic to a stable rejection code. Unknown shapes map
// to PAYMENT_REJECTED.
std::string map_rejection_code(const LedgerError& err);

} // namespace mcsim
