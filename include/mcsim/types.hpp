#pragma once
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

namespace mcsim {

using Amount   = int64_t;      // hundredths of a currency unit
using Pid      = std::string;  // participant id
using Currency = std::string;  // equivalent code, upper case
using Tick     = int64_t;
using SimMs    = int64_t;      // simulated milliseconds since run start

inline constexpr Amount kCentsPerUnit = 100;

enum class ParticipantStatus : uint8_t { Active = 0, Suspended, Left, Deleted };
enum class ParticipantKind : uint8_t { Person = 0, Business, Hub };
enum class TrustLineStatus : uint8_t { Active = 0, Frozen, Closed };

// created running -> {paused <-> running} -> stopping -> stopped, or -> error
enum class RunState : uint8_t { Running = 0, Paused, Stopping, Stopped, Error };

inline constexpr bool is_terminal(RunState s) noexcept {
  return s == RunState::Stopped || s == RunState::Error;
}

// Truncates toward zero at 2 decimals. The epsilon absorbs binary noise
// such as 0.29 * 100 == 28.999999999999996.
inline Amount trunc2(double units) noexcept {
  if (!std::isfinite(units)) return 0;
  const double cents = units * static_cast<double>(kCentsPerUnit);
  if (cents >= 0.0) return static_cast<Amount>(std::floor(cents + 1e-7));
  return -static_cast<Amount>(std::floor(-cents + 1e-7));
}

inline constexpr double to_units(Amount a) noexcept {
  return static_cast<double>(a) / static_cast<double>(kCentsPerUnit);
}

inline constexpr Amount from_units(int64_t units) noexcept {
  return units * kCentsPerUnit;
}

// "123.45", "-0.50"
inline std::string format_amount(Amount a) {
  const bool neg = a < 0;
  const uint64_t v = neg ? static_cast<uint64_t>(-(a + 1)) + 1u : static_cast<uint64_t>(a);
  std::string out = neg ? "-" : "";
  out += std::to_string(v / 100u);
  out += '.';
  const uint64_t frac = v % 100u;
  if (frac < 10u) out += '0';
  out += std::to_string(frac);
  return out;
}

inline std::string_view to_string(ParticipantStatus s) noexcept {
  switch (s) {
    case ParticipantStatus::Active:    return "active";
    case ParticipantStatus::Suspended: return "suspended";
    case ParticipantStatus::Left:      return "left";
    case ParticipantStatus::Deleted:   return "deleted";
  }
  return "unknown";
}

inline std::string_view to_string(ParticipantKind k) noexcept {
  switch (k) {
    case ParticipantKind::Person:   return "person";
    case ParticipantKind::Business: return "business";
    case ParticipantKind::Hub:      return "hub";
  }
  return "unknown";
}

inline std::string_view to_string(TrustLineStatus s) noexcept {
  switch (s) {
    case TrustLineStatus::Active: return "active";
    case TrustLineStatus::Frozen: return "frozen";
    case TrustLineStatus::Closed: return "closed";
  }
  return "unknown";
}

inline std::string_view to_string(RunState s) noexcept {
  switch (s) {
    case RunState::Running:  return "running";
    case RunState::Paused:   return "paused";
    case RunState::Stopping: return "stopping";
    case RunState::Stopped:  return "stopped";
    case RunState::Error:    return "error";
  }
  return "unknown";
}

} // namespace mcsim
