#include "tc/recipe/AnnotationRecipe.hpp"
#include "tc/recipe/LineRecipe.hpp"

namespace tc {

AnnotationRecipe::AnnotationRecipe(Id idBase, const AnnotationRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult AnnotationRecipe::build() const {
  RecipeBuildResult result;
  emitSeries(result, bufferId(), geometryId(), drawItemId(), config_.layerId,
             config_.name, VertexFormat::Pos2_Clip, "line2d@1", config_.transformId);
  result.createCommands.push_back(
    makeColorStyleCmd(drawItemId(), config_.color, config_.lineWidth));
  return result;
}

std::vector<float> AnnotationRecipe::computeSegments(
    const std::vector<Annotation>& annotations, const TimeAxis& axis,
    double xMin, double xMax) {
  std::vector<float> out;
  float seg[4];
  auto push = [&](double x0, double y0, double x1, double y1) {
    LineRecipe::writeSegment(seg, static_cast<float>(x0), static_cast<float>(y0),
                             static_cast<float>(x1), static_cast<float>(y1));
    out.insert(out.end(), seg, seg + 4);
  };

  for (const auto& a : annotations) {
    switch (a.kind) {
      case AnnotationKind::HorizontalLine:
        push(xMin, a.price, xMax, a.price);
        break;
      case AnnotationKind::Trendline:
        push(axis.xOf(a.time), a.price, axis.xOf(a.time1), a.price1);
        break;
      case AnnotationKind::Brush:
        for (std::size_t i = 0; i + 1 < a.points.size(); i++) {
          push(axis.xOf(a.points[i].time), a.points[i].price,
               axis.xOf(a.points[i + 1].time), a.points[i + 1].price);
        }
        break;
      case AnnotationKind::Text:
        break;
    }
  }
  return out;
}

} // namespace tc
