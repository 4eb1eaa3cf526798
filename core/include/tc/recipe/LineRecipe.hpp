#pragma once
#include "tc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace tc {

// A line recipe creates: buffer, geometry, drawItem, and binds to line2d@1.
// Used for the close-price line, the SMA overlays and the RSI line.
// Requires a pane and layer to already exist.
//
// ID layout (offsets from idBase):
//   0: Buffer (segment list, 2 vertices per segment)
//   1: Geometry
//   2: DrawItem
struct LineRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float color[4] = {0.3f, 0.5f, 1.0f, 1.0f};
  float lineWidth{1.5f};
};

class LineRecipe : public Recipe {
public:
  LineRecipe(Id idBase, const LineRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;
  static constexpr std::uint32_t kSegmentBytes = 16;  // 2 x pos2

  static void writeSegment(float out[4], float x0, float y0, float x1, float y1);

  // Polyline through `pointCount` (x, y) pairs -> pointCount-1 segments.
  static std::vector<float> computeSegments(const float* xy, std::size_t pointCount);

private:
  LineRecipeConfig config_;
};

} // namespace tc
