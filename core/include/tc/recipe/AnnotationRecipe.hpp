#pragma once
#include "tc/drawing/AnnotationStore.hpp"
#include "tc/recipe/Recipe.hpp"
#include "tc/render/TimeAxis.hpp"
#include <string>
#include <vector>

namespace tc {

// Annotation overlay: one line2d draw item holding the segments of every
// horizontal line, trendline and brush stroke. Text notes carry no geometry;
// the host draws their labels.
//
// ID layout (offsets from idBase):
//   0: Buffer (segment list)
//   1: Geometry
//   2: DrawItem
struct AnnotationRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float color[4] = {0.16f, 0.38f, 1.0f, 1.0f};
  float lineWidth{2.0f};
};

class AnnotationRecipe : public Recipe {
public:
  AnnotationRecipe(Id idBase, const AnnotationRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  // Horizontal lines span [xMin, xMax] (the visible bar range).
  static std::vector<float> computeSegments(const std::vector<Annotation>& annotations,
                                            const TimeAxis& axis,
                                            double xMin, double xMax);

private:
  AnnotationRecipeConfig config_;
};

} // namespace tc
