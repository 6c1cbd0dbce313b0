#include "mcsim/rejection_codes.hpp"

#include <algorithm>
#include <cctype>

namespace mcsim {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string map_rejection_code(const LedgerError& err) {
  switch (err.kind) {
    case LedgerErrorKind::Routing:
      if (err.code == "E002") return kRoutingNoCapacity;
      if (err.code == "E001") return "ROUTING_NO_ROUTE";
      return "ROUTING_REJECTED";

    case LedgerErrorKind::TrustLine:
      if (err.code == "E003") return "TRUSTLINE_LIMIT_EXCEEDED";
      if (err.code == "E004") return "TRUSTLINE_NOT_ACTIVE";
      return "TRUSTLINE_REJECTED";

    case LedgerErrorKind::NotFound: {
      const std::string m = lower(err.message);
      if (m.find("equivalent") != std::string::npos) return "EQUIVALENT_NOT_FOUND";
      if (m.find("participant") != std::string::npos) return "PARTICIPANT_NOT_FOUND";
      if (m.find("transaction") != std::string::npos || m.find("tx") != std::string::npos) return "TX_NOT_FOUND";
      return kPaymentRejected;
    }

    case LedgerErrorKind::BadRequest:       return "INVALID_INPUT";
    case LedgerErrorKind::Conflict:         return "CONFLICT";
    case LedgerErrorKind::Unauthorized:     return "UNAUTHORIZED";
    case LedgerErrorKind::Forbidden:        return "FORBIDDEN";
    case LedgerErrorKind::InvalidSignature: return "INVALID_SIGNATURE";
    case LedgerErrorKind::Internal:         break;
  }
  return kPaymentRejected;
}

} // namespace mcsim
