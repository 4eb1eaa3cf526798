#pragma once
#include "tc/drawing/AnnotationStore.hpp"
#include "tc/drawing/CoordinateMapper.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

enum class DrawingTool : std::uint8_t {
  Cursor = 0,
  Trendline,
  HorizontalLine,
  Brush,
  Text
};

const char* toString(DrawingTool tool);
bool parseDrawingTool(const std::string& s, DrawingTool& out);

// Tool state machine. Exactly one tool is active; completing a drawing
// resets to Cursor. A click whose coordinates cannot be resolved leaves the
// tool armed and creates nothing.
class DrawingInteraction {
public:
  // Drops any in-progress placement (trendline anchor, brush stroke).
  void setTool(DrawingTool tool);
  DrawingTool tool() const { return tool_; }

  // Label used by the next Text placement.
  void setPendingText(const std::string& text) { pendingText_ = text; }
  const std::string& pendingText() const { return pendingText_; }

  // Returns the created annotation id, or 0.
  std::uint32_t onClick(double px, double py, const CoordinateMapper& mapper,
                        AnnotationStore& store);

  // Brush strokes. Up commits strokes of at least 2 points.
  void onPointerDown(double px, double py, const CoordinateMapper& mapper);
  void onPointerMove(double px, double py, const CoordinateMapper& mapper);
  std::uint32_t onPointerUp(double px, double py, const CoordinateMapper& mapper,
                            AnnotationStore& store);

  void clearAll(AnnotationStore& store);

  bool hasTrendlineAnchor() const { return hasAnchor_; }
  bool isStroking() const { return stroking_; }
  const std::vector<AnnotationPoint>& strokePoints() const { return stroke_; }

private:
  static bool resolve(double px, double py, const CoordinateMapper& mapper,
                      AnnotationPoint& out);
  void finish();

  DrawingTool tool_{DrawingTool::Cursor};
  std::string pendingText_{"Text"};

  bool hasAnchor_{false};
  AnnotationPoint anchor_;

  bool stroking_{false};
  std::vector<AnnotationPoint> stroke_;
};

} // namespace tc
