#pragma once
#include <cmath>
#include <cstdint>

namespace tc {

// Maps candle times to x in bar units: x = (time - origin) / interval.
// Keeping x small lets vertex data stay in 32-bit floats.
struct TimeAxis {
  std::int64_t origin{0};
  std::int64_t interval{3600};

  double x(std::int64_t time) const {
    return static_cast<double>(time - origin) / static_cast<double>(interval);
  }

  double xOf(double timeSeconds) const {
    return (timeSeconds - static_cast<double>(origin)) / static_cast<double>(interval);
  }

  double timeAt(double xBars) const {
    return static_cast<double>(origin) + xBars * static_cast<double>(interval);
  }
};

} // namespace tc
