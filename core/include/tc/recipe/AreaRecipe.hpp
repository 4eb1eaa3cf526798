#pragma once
#include "tc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace tc {

// Area chart: a triSolid fill between the close line and a flat baseline,
// plus a line2d outline along the closes.
//
// ID layout (offsets from idBase):
//   0: Fill buffer (2 triangles per segment)
//   1: Fill geometry
//   2: Fill drawItem
//   3: Line buffer (segment list)
//   4: Line geometry
//   5: Line drawItem
struct AreaRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float lineColor[4] = {0.16f, 0.38f, 1.0f, 1.0f};
  float fillColor[4] = {0.16f, 0.38f, 1.0f, 0.25f};
  float lineWidth{2.0f};
};

class AreaRecipe : public Recipe {
public:
  AreaRecipe(Id idBase, const AreaRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {fillDrawItemId(), lineDrawItemId()}; }

  Id fillBufferId() const    { return rid(0); }
  Id fillGeometryId() const  { return rid(1); }
  Id fillDrawItemId() const  { return rid(2); }
  Id lineBufferId() const    { return rid(3); }
  Id lineGeometryId() const  { return rid(4); }
  Id lineDrawItemId() const  { return rid(5); }

  static constexpr std::uint32_t ID_SLOTS = 6;
  static constexpr std::uint32_t kQuadBytes = 48;  // 6 x pos2

  // Two triangles covering (x0,y0)-(x1,y1) down (or up) to `baseline`.
  static void writeQuad(float out[12], float x0, float y0, float x1, float y1,
                        float baseline);

  static std::vector<float> computeFill(const float* xy, std::size_t pointCount,
                                        float baseline);

private:
  AreaRecipeConfig config_;
};

} // namespace tc
