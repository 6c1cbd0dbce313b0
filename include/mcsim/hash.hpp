#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace mcsim {

// 64-bit FNV-1a. Stable across processes, used for idempotency keys and seeds.
uint64_t fnv1a64(std::string_view text) noexcept;

// 16 lower-case hex digits
std::string to_hex(uint64_t v);

} // namespace mcsim
