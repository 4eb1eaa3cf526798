#include "tc/recipe/CandleRecipe.hpp"

namespace tc {

CandleRecipe::CandleRecipe(Id idBase, const CandleRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult CandleRecipe::build() const {
  RecipeBuildResult result;
  emitSeries(result, bufferId(), geometryId(), drawItemId(), config_.layerId,
             config_.name, VertexFormat::Candle6, "instancedCandle@1",
             config_.transformId);
  result.createCommands.push_back(
    makeUpDownStyleCmd(drawItemId(), config_.colorUp, config_.colorDown));
  return result;
}

void CandleRecipe::writeCandle6(float out[6], const Candle& c, const TimeAxis& axis,
                                float halfWidth) {
  out[0] = static_cast<float>(axis.x(c.time));
  out[1] = static_cast<float>(c.open);
  out[2] = static_cast<float>(c.high);
  out[3] = static_cast<float>(c.low);
  out[4] = static_cast<float>(c.close);
  out[5] = halfWidth;
}

std::vector<float> CandleRecipe::computeCandles(const std::vector<Candle>& candles,
                                                const TimeAxis& axis, float halfWidth) {
  std::vector<float> out(candles.size() * 6);
  for (std::size_t i = 0; i < candles.size(); i++) {
    writeCandle6(&out[i * 6], candles[i], axis, halfWidth);
  }
  return out;
}

} // namespace tc
