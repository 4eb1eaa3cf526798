#include "tc/recipe/AreaRecipe.hpp"

namespace tc {

AreaRecipe::AreaRecipe(Id idBase, const AreaRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult AreaRecipe::build() const {
  RecipeBuildResult result;

  // Fill first so the outline draws on top.
  emitSeries(result, fillBufferId(), fillGeometryId(), fillDrawItemId(),
             config_.layerId, config_.name + "Fill", VertexFormat::Pos2_Clip,
             "triSolid@1", config_.transformId);
  emitSeries(result, lineBufferId(), lineGeometryId(), lineDrawItemId(),
             config_.layerId, config_.name + "Line", VertexFormat::Pos2_Clip,
             "line2d@1", config_.transformId);

  result.createCommands.push_back(
    makeColorStyleCmd(fillDrawItemId(), config_.fillColor, 1.0f));
  result.createCommands.push_back(
    makeColorStyleCmd(lineDrawItemId(), config_.lineColor, config_.lineWidth));
  return result;
}

void AreaRecipe::writeQuad(float out[12], float x0, float y0, float x1, float y1,
                           float baseline) {
  // tri 1
  out[0] = x0;  out[1] = baseline;
  out[2] = x0;  out[3] = y0;
  out[4] = x1;  out[5] = y1;
  // tri 2
  out[6] = x0;  out[7] = baseline;
  out[8] = x1;  out[9] = y1;
  out[10] = x1; out[11] = baseline;
}

std::vector<float> AreaRecipe::computeFill(const float* xy, std::size_t pointCount,
                                           float baseline) {
  std::vector<float> out;
  if (pointCount < 2) return out;
  out.resize((pointCount - 1) * 12);
  for (std::size_t i = 0; i + 1 < pointCount; i++) {
    writeQuad(&out[i * 12], xy[i * 2], xy[i * 2 + 1], xy[i * 2 + 2], xy[i * 2 + 3],
              baseline);
  }
  return out;
}

} // namespace tc
