#include "tc/data/Interval.hpp"

#include <limits>

namespace tc {

static IntervalResult invalid(const std::string& token, const char* why) {
  IntervalResult r;
  r.ok = false;
  r.err.code = ErrorCode::InvalidInterval;
  r.err.message = "interval \"" + token + "\": " + why;
  return r;
}

static std::int64_t unitSeconds(char unit) {
  switch (unit) {
    case 'm':            return kSecondsPerMinute;
    case 'h': case 'H':  return kSecondsPerHour;
    case 'd': case 'D':  return kSecondsPerDay;
    case 'w': case 'W':  return kSecondsPerWeek;
    default:             return 0;
  }
}

IntervalResult resolveInterval(const std::string& token) {
  if (token.size() < 2) return invalid(token, "expected <magnitude><unit>");

  const char unit = token.back();
  const std::int64_t perUnit = unitSeconds(unit);
  if (perUnit == 0) return invalid(token, "unknown unit");

  const std::int64_t limit = std::numeric_limits<std::int64_t>::max() / perUnit;
  std::int64_t magnitude = 0;
  for (std::size_t i = 0; i + 1 < token.size(); ++i) {
    char c = token[i];
    if (c < '0' || c > '9') return invalid(token, "magnitude must be decimal digits");
    magnitude = magnitude * 10 + (c - '0');
    if (magnitude > limit) return invalid(token, "magnitude out of range");
  }

  if (magnitude <= 0) return invalid(token, "magnitude must be positive");

  IntervalResult r;
  r.ok = true;
  r.seconds = magnitude * perUnit;
  return r;
}

} // namespace tc
