#include "tc/viewport/Viewport.hpp"

namespace tc {

void Viewport::setDataRange(double xMin, double xMax, double yMin, double yMax) {
  // Degenerate ranges would divide by zero in every mapping below.
  if (xMax <= xMin) xMax = xMin + 1.0;
  if (yMax <= yMin) {
    double pad = (yMin == 0.0) ? 1.0 : (yMin < 0 ? -yMin : yMin) * 0.01;
    yMin -= pad;
    yMax = yMin + 2.0 * pad;
  }
  data_.xMin = xMin;
  data_.xMax = xMax;
  data_.yMin = yMin;
  data_.yMax = yMax;
}

void Viewport::setClipRegion(const PaneRegion& region) {
  clip_ = region;
}

void Viewport::setPixelViewport(int fbWidth, int fbHeight) {
  fbW_ = fbWidth > 0 ? fbWidth : 1;
  fbH_ = fbHeight > 0 ? fbHeight : 1;
}

void Viewport::pixelToClip(double px, double py, double& cx, double& cy) const {
  cx = px / static_cast<double>(fbW_) * 2.0 - 1.0;
  cy = 1.0 - py / static_cast<double>(fbH_) * 2.0; // Y flipped
}

void Viewport::clipToPixel(double cx, double cy, double& px, double& py) const {
  px = (cx + 1.0) * 0.5 * static_cast<double>(fbW_);
  py = (1.0 - cy) * 0.5 * static_cast<double>(fbH_);
}

void Viewport::clipToData(double cx, double cy, double& dx, double& dy) const {
  double clipW = static_cast<double>(clip_.clipXMax) - static_cast<double>(clip_.clipXMin);
  double clipH = static_cast<double>(clip_.clipYMax) - static_cast<double>(clip_.clipYMin);

  double tx = (cx - static_cast<double>(clip_.clipXMin)) / clipW;
  double ty = (cy - static_cast<double>(clip_.clipYMin)) / clipH;

  dx = data_.xMin + tx * (data_.xMax - data_.xMin);
  dy = data_.yMin + ty * (data_.yMax - data_.yMin);
}

void Viewport::dataToClip(double dx, double dy, double& cx, double& cy) const {
  double tx = (dx - data_.xMin) / (data_.xMax - data_.xMin);
  double ty = (dy - data_.yMin) / (data_.yMax - data_.yMin);

  cx = static_cast<double>(clip_.clipXMin) + tx * (static_cast<double>(clip_.clipXMax) - static_cast<double>(clip_.clipXMin));
  cy = static_cast<double>(clip_.clipYMin) + ty * (static_cast<double>(clip_.clipYMax) - static_cast<double>(clip_.clipYMin));
}

void Viewport::pixelToData(double px, double py, double& dx, double& dy) const {
  double cx, cy;
  pixelToClip(px, py, cx, cy);
  clipToData(cx, cy, dx, dy);
}

void Viewport::dataToPixel(double dx, double dy, double& px, double& py) const {
  double cx, cy;
  dataToClip(dx, dy, cx, cy);
  clipToPixel(cx, cy, px, py);
}

TransformParams Viewport::computeTransformParams() const {
  double clipW = static_cast<double>(clip_.clipXMax) - static_cast<double>(clip_.clipXMin);
  double clipH = static_cast<double>(clip_.clipYMax) - static_cast<double>(clip_.clipYMin);
  double dataW = data_.xMax - data_.xMin;
  double dataH = data_.yMax - data_.yMin;

  float sx = static_cast<float>(clipW / dataW);
  float sy = static_cast<float>(clipH / dataH);
  float tx = static_cast<float>(static_cast<double>(clip_.clipXMin) - data_.xMin * (clipW / dataW));
  float ty = static_cast<float>(static_cast<double>(clip_.clipYMin) - data_.yMin * (clipH / dataH));

  return TransformParams{tx, ty, sx, sy};
}

} // namespace tc
