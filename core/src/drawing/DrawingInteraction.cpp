#include "tc/drawing/DrawingInteraction.hpp"

namespace tc {

const char* toString(DrawingTool tool) {
  switch (tool) {
    case DrawingTool::Cursor:         return "cursor";
    case DrawingTool::Trendline:      return "trendline";
    case DrawingTool::HorizontalLine: return "horizontal_line";
    case DrawingTool::Brush:          return "brush";
    case DrawingTool::Text:           return "text";
  }
  return "unknown";
}

bool parseDrawingTool(const std::string& s, DrawingTool& out) {
  for (DrawingTool t : {DrawingTool::Cursor, DrawingTool::Trendline,
                        DrawingTool::HorizontalLine, DrawingTool::Brush,
                        DrawingTool::Text}) {
    if (s == toString(t)) { out = t; return true; }
  }
  return false;
}

void DrawingInteraction::setTool(DrawingTool tool) {
  tool_ = tool;
  hasAnchor_ = false;
  stroking_ = false;
  stroke_.clear();
}

void DrawingInteraction::finish() {
  setTool(DrawingTool::Cursor);
}

bool DrawingInteraction::resolve(double px, double py, const CoordinateMapper& mapper,
                                 AnnotationPoint& out) {
  double t = 0, p = 0;
  if (!mapper.timeAtPixel(px, t)) return false;
  if (!mapper.priceAtPixel(py, p)) return false;
  out.time = t;
  out.price = p;
  return true;
}

std::uint32_t DrawingInteraction::onClick(double px, double py,
                                          const CoordinateMapper& mapper,
                                          AnnotationStore& store) {
  switch (tool_) {
    case DrawingTool::Cursor:
    case DrawingTool::Brush:
      return 0;

    case DrawingTool::HorizontalLine: {
      double price = 0;
      if (!mapper.priceAtPixel(py, price)) return 0;
      double time = 0;
      mapper.timeAtPixel(px, time);  // anchor only; 0 when unavailable
      auto id = store.addHorizontalLine(price, time);
      finish();
      return id;
    }

    case DrawingTool::Trendline: {
      AnnotationPoint pt;
      if (!resolve(px, py, mapper, pt)) return 0;
      if (!hasAnchor_) {
        anchor_ = pt;
        hasAnchor_ = true;
        return 0;
      }
      auto id = store.addTrendline(anchor_.time, anchor_.price, pt.time, pt.price);
      finish();
      return id;
    }

    case DrawingTool::Text: {
      AnnotationPoint pt;
      if (!resolve(px, py, mapper, pt)) return 0;
      auto id = store.addText(pt.time, pt.price, pendingText_);
      finish();
      return id;
    }
  }
  return 0;
}

void DrawingInteraction::onPointerDown(double px, double py,
                                       const CoordinateMapper& mapper) {
  if (tool_ != DrawingTool::Brush) return;
  AnnotationPoint pt;
  if (!resolve(px, py, mapper, pt)) return;
  stroke_.clear();
  stroke_.push_back(pt);
  stroking_ = true;
}

void DrawingInteraction::onPointerMove(double px, double py,
                                       const CoordinateMapper& mapper) {
  if (!stroking_) return;
  AnnotationPoint pt;
  if (resolve(px, py, mapper, pt)) stroke_.push_back(pt);
}

std::uint32_t DrawingInteraction::onPointerUp(double px, double py,
                                              const CoordinateMapper& mapper,
                                              AnnotationStore& store) {
  if (!stroking_) return 0;
  AnnotationPoint pt;
  if (resolve(px, py, mapper, pt)) stroke_.push_back(pt);
  stroking_ = false;

  if (stroke_.size() < 2) {
    stroke_.clear();
    return 0;  // a tap is not a stroke; keep the brush armed
  }
  auto id = store.addBrush(stroke_);
  finish();
  return id;
}

void DrawingInteraction::clearAll(AnnotationStore& store) {
  store.clear();
  finish();
}

} // namespace tc
