#pragma once
#include "tc/data/Candle.hpp"
#include "tc/recipe/Recipe.hpp"
#include "tc/render/TimeAxis.hpp"
#include <string>
#include <vector>

namespace tc {

// Volume bar recipe. Uses instancedCandle@1 to get up/down coloring for
// free: each bar is a candle6 record with low = 0 and high = volume, and
// open/close ordered so the bar takes the direction of its source candle
// (up when close >= open).
//
// ID layout (3 slots):
//   0: Buffer (candle6 data)
//   1: Geometry
//   2: DrawItem
struct VolumeRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float colorUp[4]   = {0.0f, 0.6f, 0.3f, 0.6f};
  float colorDown[4] = {0.7f, 0.15f, 0.15f, 0.6f};
};

class VolumeRecipe : public Recipe {
public:
  VolumeRecipe(Id idBase, const VolumeRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;
  static constexpr std::uint32_t kRecordBytes = 24;

  static void writeBar(float out[6], const Candle& c, const TimeAxis& axis,
                       float halfWidth);

  static std::vector<float> computeVolumeBars(const std::vector<Candle>& candles,
                                              const TimeAxis& axis, float halfWidth);

private:
  VolumeRecipeConfig config_;
};

} // namespace tc
