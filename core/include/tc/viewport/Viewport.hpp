#pragma once
#include "tc/layout/PaneLayout.hpp"
#include "tc/scene/Types.hpp"

namespace tc {

struct DataRange {
  double xMin{0}, xMax{1}, yMin{0}, yMax{1};
};

// Maps one band of the surface between data space, clip space and pixels
// (origin top-left, y down).
class Viewport {
public:
  void setDataRange(double xMin, double xMax, double yMin, double yMax);
  void setClipRegion(const PaneRegion& region);
  void setPixelViewport(int fbWidth, int fbHeight);

  void pixelToClip(double px, double py, double& cx, double& cy) const;
  void clipToPixel(double cx, double cy, double& px, double& py) const;
  void clipToData(double cx, double cy, double& dx, double& dy) const;
  void dataToClip(double dx, double dy, double& cx, double& cy) const;
  void pixelToData(double px, double py, double& dx, double& dy) const;
  void dataToPixel(double dx, double dy, double& px, double& py) const;

  // Transform for draw items in this band: clip = data * s + t.
  TransformParams computeTransformParams() const;

  const DataRange& dataRange() const { return data_; }
  const PaneRegion& clipRegion() const { return clip_; }

private:
  DataRange data_{0, 1, 0, 1};
  PaneRegion clip_{-1.0f, 1.0f, -1.0f, 1.0f};
  int fbW_{800};
  int fbH_{600};
};

} // namespace tc
