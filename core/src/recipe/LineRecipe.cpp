#include "tc/recipe/LineRecipe.hpp"

namespace tc {

LineRecipe::LineRecipe(Id idBase, const LineRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult LineRecipe::build() const {
  RecipeBuildResult result;
  emitSeries(result, bufferId(), geometryId(), drawItemId(), config_.layerId,
             config_.name, VertexFormat::Pos2_Clip, "line2d@1", config_.transformId);
  result.createCommands.push_back(
    makeColorStyleCmd(drawItemId(), config_.color, config_.lineWidth));
  return result;
}

void LineRecipe::writeSegment(float out[4], float x0, float y0, float x1, float y1) {
  out[0] = x0; out[1] = y0;
  out[2] = x1; out[3] = y1;
}

std::vector<float> LineRecipe::computeSegments(const float* xy, std::size_t pointCount) {
  std::vector<float> out;
  if (pointCount < 2) return out;
  out.resize((pointCount - 1) * 4);
  for (std::size_t i = 0; i + 1 < pointCount; i++) {
    writeSegment(&out[i * 4], xy[i * 2], xy[i * 2 + 1], xy[i * 2 + 2], xy[i * 2 + 3]);
  }
  return out;
}

} // namespace tc
