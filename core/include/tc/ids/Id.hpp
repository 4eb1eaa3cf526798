#pragma once
#include <cstdint>
#include <string>

namespace tc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Accepts a decimal string ID (commands may carry IDs as strings).
// Returns false on empty input, non-digit characters or overflow.
inline bool parseIdString(const std::string& s, Id& out) {
  if (s.empty()) return false;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (v > (UINT64_MAX - digit) / 10) return false;
    v = v * 10 + digit;
  }
  out = static_cast<Id>(v);
  return true;
}

} // namespace tc
