#include "tc/recipe/VolumeRecipe.hpp"

namespace tc {

VolumeRecipe::VolumeRecipe(Id idBase, const VolumeRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult VolumeRecipe::build() const {
  RecipeBuildResult result;
  emitSeries(result, bufferId(), geometryId(), drawItemId(), config_.layerId,
             config_.name, VertexFormat::Candle6, "instancedCandle@1",
             config_.transformId);
  result.createCommands.push_back(
    makeUpDownStyleCmd(drawItemId(), config_.colorUp, config_.colorDown));
  return result;
}

void VolumeRecipe::writeBar(float out[6], const Candle& c, const TimeAxis& axis,
                            float halfWidth) {
  float vol = static_cast<float>(c.volume > 0.0 ? c.volume : 0.0);
  bool up = isUp(c);
  out[0] = static_cast<float>(axis.x(c.time));
  out[1] = up ? 0.0f : vol;   // open
  out[2] = vol;               // high
  out[3] = 0.0f;              // low
  out[4] = up ? vol : 0.0f;   // close
  out[5] = halfWidth;
}

std::vector<float> VolumeRecipe::computeVolumeBars(const std::vector<Candle>& candles,
                                                   const TimeAxis& axis,
                                                   float halfWidth) {
  std::vector<float> out(candles.size() * 6);
  for (std::size_t i = 0; i < candles.size(); i++) {
    writeBar(&out[i * 6], candles[i], axis, halfWidth);
  }
  return out;
}

} // namespace tc
