#pragma once

namespace tc {

// Pixel <-> (time, price) mapping of the price pane. Every call returns
// false and leaves `out` untouched when the mapping is unavailable (no
// surface, no series, or no data yet).
class CoordinateMapper {
public:
  virtual ~CoordinateMapper() = default;

  virtual bool priceAtPixel(double y, double& price) const = 0;
  virtual bool pixelForPrice(double price, double& y) const = 0;
  virtual bool timeAtPixel(double x, double& timeSeconds) const = 0;
  virtual bool pixelForTime(double timeSeconds, double& x) const = 0;
};

} // namespace tc
