#pragma once
#include "tc/core/ChartResult.hpp"

#include <cstdint>
#include <string>

namespace tc {

inline constexpr std::int64_t kSecondsPerMinute = 60;
inline constexpr std::int64_t kSecondsPerHour   = 3600;
inline constexpr std::int64_t kSecondsPerDay    = 86400;
inline constexpr std::int64_t kSecondsPerWeek   = 604800;

struct IntervalResult {
  bool ok{false};
  std::int64_t seconds{0};
  ChartError err{};
};

// Timeframe token -> bucket duration in seconds.
// Grammar: <positive decimal magnitude><unit>, unit one of m, h, d, w
// (H, D, W accepted as aliases; "M" is rejected as ambiguous with month).
// Unknown or malformed tokens fail with ErrorCode::InvalidInterval; there is
// no implicit fallback duration.
IntervalResult resolveInterval(const std::string& token);

} // namespace tc
