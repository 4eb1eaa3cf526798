#pragma once
#include "tc/data/Candle.hpp"
#include "tc/recipe/Recipe.hpp"
#include "tc/render/TimeAxis.hpp"
#include <string>
#include <vector>

namespace tc {

// A candlestick recipe creates: buffer, geometry, drawItem, and binds to
// instancedCandle@1.
//
// ID layout (offsets from idBase):
//   0: Buffer (candle6 data)
//   1: Geometry
//   2: DrawItem
struct CandleRecipeConfig {
  Id layerId{0};
  Id transformId{0};   // shared band transform, owned by the caller
  std::string name;
  float colorUp[4]   = {0.0f, 0.8f, 0.4f, 1.0f};
  float colorDown[4] = {0.9f, 0.2f, 0.2f, 1.0f};
};

class CandleRecipe : public Recipe {
public:
  CandleRecipe(Id idBase, const CandleRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;
  static constexpr std::uint32_t kRecordBytes = 24;  // candle6

  // {x, open, high, low, close, halfWidth}
  static void writeCandle6(float out[6], const Candle& c, const TimeAxis& axis,
                           float halfWidth);

  // One candle6 record per candle.
  static std::vector<float> computeCandles(const std::vector<Candle>& candles,
                                           const TimeAxis& axis, float halfWidth);

private:
  CandleRecipeConfig config_;
};

} // namespace tc
