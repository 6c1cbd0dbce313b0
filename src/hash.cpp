#include "mcsim/hash.hpp"

namespace mcsim {

uint64_t fnv1a64(std::string_view text) noexcept {
  uint64_t h = 0xcbf29ce484222325ull;
  for (const unsigned char c : text) {
    h ^= static_cast<uint64_t>(c);
    h *= 0x100000001b3ull;
  }
  return h;
}

std::string to_hex(uint64_t v) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = digits[v & 0xF];
    v >>= 4;
  }
  return out;
}

} // namespace mcsim
