#pragma once
#include "tc/commands/CommandProcessor.hpp"
#include "tc/core/ChartResult.hpp"
#include "tc/data/Candle.hpp"
#include "tc/drawing/AnnotationStore.hpp"
#include "tc/drawing/CoordinateMapper.hpp"
#include "tc/math/IndicatorEngine.hpp"
#include "tc/render/BufferStore.hpp"
#include "tc/render/TimeAxis.hpp"
#include "tc/scene/ResourceRegistry.hpp"
#include "tc/scene/Scene.hpp"
#include "tc/style/Theme.hpp"
#include "tc/viewport/Viewport.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tc {

class Recipe;

enum class ChartType : std::uint8_t {
  Candlestick = 0,
  Area,
  Line
};

const char* toString(ChartType type);
bool parseChartType(const std::string& s, ChartType& out);

struct SeriesRendererConfig {
  int pixelWidth{1280};
  int pixelHeight{720};
  int visibleBars{120};
  float candleHalfWidth{0.4f};     // in bars
  double priceMargin{0.05};        // fraction of the high/low span, each side
  float volumeBandFraction{0.2f};  // bottom share of the price pane
  float rsiPaneFraction{0.25f};
  // Initial overlay visibility, indexed by IndicatorKind.
  bool overlayVisible[kIndicatorKindCount] = {true, true, true, false};
};

// Text note resolved to pixels for the host to draw.
struct AnnotationLabel {
  std::uint32_t annotationId{0};
  double px{0}, py{0};
  std::string text;
};

// Owns one chart surface: the scene graph, CPU vertex buffers, band
// viewports and the recipes for the main series, volume histogram, indicator
// overlays and annotation layer. All scene mutations go through the command
// processor.
//
// Scene ID layout:
//   1: price pane     2: series layer   3: overlay layer   4: annotation layer
//   5: RSI pane       6: RSI layer
//   7: price transform   8: volume transform   9: RSI transform
//   100: volume recipe   200: main series recipe
//   300/310/320: SMA-20/50/200   400: RSI   500: annotations
class SeriesRenderer : public CoordinateMapper {
public:
  static constexpr Id kPricePaneId = 1;
  static constexpr Id kSeriesLayerId = 2;
  static constexpr Id kOverlayLayerId = 3;
  static constexpr Id kAnnotationLayerId = 4;
  static constexpr Id kRsiPaneId = 5;
  static constexpr Id kRsiLayerId = 6;
  static constexpr Id kPriceTransformId = 7;
  static constexpr Id kVolumeTransformId = 8;
  static constexpr Id kRsiTransformId = 9;
  static constexpr Id kVolumeBase = 100;
  static constexpr Id kMainBase = 200;
  static constexpr Id kSmaBase = 300;      // + 10 * kind
  static constexpr Id kRsiBase = 400;
  static constexpr Id kAnnotationBase = 500;

  explicit SeriesRenderer(const SeriesRendererConfig& config = {});
  ~SeriesRenderer() override;

  SeriesRenderer(const SeriesRenderer&) = delete;
  SeriesRenderer& operator=(const SeriesRenderer&) = delete;

  // ---- lifecycle ----
  ChartResult createSurface();
  void destroySurface();
  bool hasSurface() const { return surface_; }

  // Destroys and recreates the main series, then repopulates it from the
  // last data set.
  ChartResult setChartType(ChartType type);
  ChartType chartType() const { return type_; }

  // ---- data ----
  // Bucket width used for x placement. Clears the data set.
  void setInterval(std::int64_t seconds);
  std::int64_t intervalSeconds() const { return axis_.interval; }

  void setData(const std::vector<Candle>& candles);
  // Same time as the last candle: amend in place. Newer: append one point.
  // Older: ignored (OutOfOrderTick).
  ChartResult update(const Candle& candle);

  void setIndicatorData(IndicatorKind kind, const std::vector<IndicatorPoint>& points);
  void updateIndicatorTail(IndicatorKind kind, const IndicatorPoint& point);

  // Toggles the overlay draw item; the series and its data stay alive.
  void setOverlayVisible(IndicatorKind kind, bool visible);
  bool overlayVisible(IndicatorKind kind) const {
    return overlayVisible_[static_cast<std::size_t>(kind)];
  }

  void setAnnotations(const AnnotationStore& store);
  std::vector<AnnotationLabel> annotationLabels() const;

  // ---- presentation ----
  void setTheme(const Theme& theme);
  const Theme& theme() const { return theme_; }

  void setPixelSize(int width, int height);
  void setVisibleBars(int bars);
  int visibleBars() const { return config_.visibleBars; }

  // ---- CoordinateMapper (price pane) ----
  bool priceAtPixel(double y, double& price) const override;
  bool pixelForPrice(double price, double& y) const override;
  bool timeAtPixel(double x, double& timeSeconds) const override;
  bool pixelForTime(double timeSeconds, double& x) const override;

  // ---- introspection ----
  const Scene& scene() const { return scene_; }
  const BufferStore& buffers() const { return buffers_; }
  BufferStore& buffers() { return buffers_; }
  CommandProcessor& commands() { return cp_; }

  const Viewport& priceViewport() const { return priceVp_; }
  const Viewport& volumeViewport() const { return volumeVp_; }
  const Viewport& rsiViewport() const { return rsiVp_; }
  const TimeAxis& timeAxis() const { return axis_; }

  const std::vector<Candle>& candles() const { return candles_; }

  // Buffer that carries the main series' primary geometry: candle6 records,
  // the close line, or the area outline.
  Id mainBufferId() const;
  std::vector<Id> mainDrawItemIds() const;
  Id volumeDrawItemId() const;
  Id volumeBufferId() const;
  Id overlayDrawItemId(IndicatorKind kind) const;
  Id overlayBufferId(IndicatorKind kind) const;
  Id annotationDrawItemId() const;
  Id annotationBufferId() const;

private:
  struct LineSeries {
    Id bufferId{0};
    Id geometryId{0};
  };

  bool apply(const std::string& cmd);
  void applyAll(const std::vector<std::string>& cmds);

  void buildMain();
  void disposeMain();
  void buildRecipe(const Recipe& recipe);

  // Full rewrite of the main, volume and overlay buffers.
  void writeMain();
  void writeVolume();
  void writeOverlay(IndicatorKind kind);
  void writeAnnotations();

  void writeLine(const LineSeries& line, const std::vector<float>& xy);
  void setVertexCount(Id geometryId, std::uint32_t count);

  void amendMainTail(bool appended);
  void amendLineTail(const LineSeries& line, std::size_t pointCount, const float* lastXY,
                     const float* prevXY, bool appended);

  bool mappable() const { return surface_ && !candles_.empty(); }

  void relayout();
  void autoscale();                  // rescan the visible window
  void extendRange(const Candle& c); // in-place tail update: ranges only grow
  void applyRanges(double xMin, double xMax);
  void pushTransforms();

  std::vector<float> closeXY() const;
  std::vector<float> indicatorXY(IndicatorKind kind) const;
  LineSeries overlayLine(IndicatorKind kind) const;
  ThemeTarget themeTarget() const;

  SeriesRendererConfig config_;
  Theme theme_;

  Scene scene_;
  ResourceRegistry registry_;
  CommandProcessor cp_;
  BufferStore buffers_;

  Viewport priceVp_;
  Viewport volumeVp_;
  Viewport rsiVp_;

  bool surface_{false};
  ChartType type_{ChartType::Candlestick};
  TimeAxis axis_;

  std::vector<Candle> candles_;
  std::array<std::vector<IndicatorPoint>, kIndicatorKindCount> indicators_;
  std::array<bool, kIndicatorKindCount> overlayVisible_{};
  std::vector<Annotation> annotations_;

  std::vector<std::string> mainDispose_;
  std::vector<std::string> surfaceDispose_;  // volume, overlays, annotations

  float areaBaseline_{0.0f};

  // Raw (unmargined) extremes over the visible window.
  double visLow_{0}, visHigh_{0}, visVolume_{0};
};

} // namespace tc
