#pragma once
#include <cmath>
#include <cstdint>

namespace tc {

// Largest accepted |epoch millis| (ECMAScript Date range, +/-1e8 days).
inline constexpr double kMaxTimestampMillis = 8.64e15;

// One OHLCV bucket. `time` is the aligned bucket start in epoch seconds.
struct Candle {
  std::int64_t time{0};
  double open{0};
  double high{0};
  double low{0};
  double close{0};
  double volume{0};
};

inline bool isFinite(const Candle& c) {
  return std::isfinite(c.open) && std::isfinite(c.high) &&
         std::isfinite(c.low) && std::isfinite(c.close) &&
         std::isfinite(c.volume);
}

inline bool isUp(const Candle& c) { return c.close >= c.open; }

inline bool operator==(const Candle& a, const Candle& b) {
  return a.time == b.time && a.open == b.open && a.high == b.high &&
         a.low == b.low && a.close == b.close && a.volume == b.volume;
}

inline bool operator!=(const Candle& a, const Candle& b) { return !(a == b); }

} // namespace tc
