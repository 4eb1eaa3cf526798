#include "tc/render/SeriesRenderer.hpp"

#include "tc/layout/PaneLayout.hpp"
#include "tc/recipe/AnnotationRecipe.hpp"
#include "tc/recipe/AreaRecipe.hpp"
#include "tc/recipe/CandleRecipe.hpp"
#include "tc/recipe/LineRecipe.hpp"
#include "tc/recipe/VolumeRecipe.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace tc {

const char* toString(ChartType type) {
  switch (type) {
    case ChartType::Candlestick: return "candlestick";
    case ChartType::Area:        return "area";
    case ChartType::Line:        return "line";
  }
  return "unknown";
}

bool parseChartType(const std::string& s, ChartType& out) {
  for (ChartType t : {ChartType::Candlestick, ChartType::Area, ChartType::Line}) {
    if (s == toString(t)) { out = t; return true; }
  }
  return false;
}

// Recipes only carry deterministic IDs; these throwaway instances answer
// "which id is slot N" without keeping recipe objects around.
static CandleRecipe candleIds() { return CandleRecipe(SeriesRenderer::kMainBase, {}); }
static AreaRecipe areaIds() { return AreaRecipe(SeriesRenderer::kMainBase, {}); }
static LineRecipe lineIds(Id base) { return LineRecipe(base, {}); }
static VolumeRecipe volumeIds() { return VolumeRecipe(SeriesRenderer::kVolumeBase, {}); }
static AnnotationRecipe annotationIds() {
  return AnnotationRecipe(SeriesRenderer::kAnnotationBase, {});
}

static Id overlayBase(IndicatorKind kind) {
  if (kind == IndicatorKind::Rsi14) return SeriesRenderer::kRsiBase;
  return SeriesRenderer::kSmaBase + 10 * static_cast<Id>(kind);
}

SeriesRenderer::SeriesRenderer(const SeriesRendererConfig& config)
  : config_(config), theme_(darkTheme()), cp_(scene_, registry_) {
  for (std::size_t i = 0; i < kIndicatorKindCount; i++) {
    overlayVisible_[i] = config_.overlayVisible[i];
  }
  if (config_.visibleBars < 2) config_.visibleBars = 2;
  setPixelSize(config_.pixelWidth, config_.pixelHeight);
  relayout();
  autoscale();
}

SeriesRenderer::~SeriesRenderer() {
  destroySurface();
}

// -------------------- command plumbing --------------------

bool SeriesRenderer::apply(const std::string& cmd) {
  CmdResult r = cp_.applyJsonText(cmd);
  if (!r.ok) {
    std::fprintf(stderr, "[SeriesRenderer] command failed: %s %s %s\n",
                 r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
  }
  return r.ok;
}

void SeriesRenderer::applyAll(const std::vector<std::string>& cmds) {
  for (const auto& c : cmds) apply(c);
}

void SeriesRenderer::buildRecipe(const Recipe& recipe) {
  RecipeBuildResult r = recipe.build();
  applyAll(r.createCommands);
  surfaceDispose_.insert(surfaceDispose_.end(), r.disposeCommands.begin(),
                         r.disposeCommands.end());
}

// -------------------- lifecycle --------------------

ChartResult SeriesRenderer::createSurface() {
  if (surface_) return chartOk();

  const std::uint64_t before = cp_.appliedCount();
  std::vector<std::string> cmds = {
    R"({"cmd":"createPane","id":1,"name":"price"})",
    R"({"cmd":"createLayer","id":2,"paneId":1,"name":"series"})",
    R"({"cmd":"createLayer","id":3,"paneId":1,"name":"overlays"})",
    R"({"cmd":"createLayer","id":4,"paneId":1,"name":"annotations"})",
    R"({"cmd":"createPane","id":5,"name":"rsi"})",
    R"({"cmd":"createLayer","id":6,"paneId":5,"name":"rsi"})",
    R"({"cmd":"createTransform","id":7})",
    R"({"cmd":"createTransform","id":8})",
    R"({"cmd":"createTransform","id":9})"
  };
  applyAll(cmds);
  if (cp_.appliedCount() - before != cmds.size()) {
    return chartFail(ErrorCode::InvalidArgument, "createSurface: scene skeleton rejected");
  }

  VolumeRecipeConfig vol;
  vol.layerId = kSeriesLayerId;
  vol.transformId = kVolumeTransformId;
  vol.name = "volume";
  std::copy(theme_.volumeUp, theme_.volumeUp + 4, vol.colorUp);
  std::copy(theme_.volumeDown, theme_.volumeDown + 4, vol.colorDown);
  buildRecipe(VolumeRecipe(kVolumeBase, vol));

  for (IndicatorKind kind : kAllIndicatorKinds) {
    LineRecipeConfig lc;
    bool rsi = (kind == IndicatorKind::Rsi14);
    lc.layerId = rsi ? kRsiLayerId : kOverlayLayerId;
    lc.transformId = rsi ? kRsiTransformId : kPriceTransformId;
    lc.name = toString(kind);
    const float* color = rsi ? theme_.rsiColor
                             : theme_.smaColors[static_cast<std::size_t>(kind)];
    std::copy(color, color + 4, lc.color);
    lc.lineWidth = theme_.overlayLineWidth;
    buildRecipe(LineRecipe(overlayBase(kind), lc));
  }

  AnnotationRecipeConfig ac;
  ac.layerId = kAnnotationLayerId;
  ac.transformId = kPriceTransformId;
  ac.name = "annotations";
  std::copy(theme_.annotationColor, theme_.annotationColor + 4, ac.color);
  ac.lineWidth = theme_.annotationLineWidth;
  buildRecipe(AnnotationRecipe(kAnnotationBase, ac));

  surface_ = true;
  buildMain();

  for (IndicatorKind kind : kAllIndicatorKinds) {
    apply(makeVisibleCmd(overlayDrawItemId(kind), overlayVisible(kind)));
  }

  relayout();
  writeMain();
  writeVolume();
  for (IndicatorKind kind : kAllIndicatorKinds) writeOverlay(kind);
  autoscale();
  writeAnnotations();
  buffers_.syncBufferLengths(scene_);
  return chartOk();
}

void SeriesRenderer::destroySurface() {
  if (!surface_) return;

  disposeMain();
  applyAll(surfaceDispose_);
  surfaceDispose_.clear();

  // Panes cascade their layers; transforms are standalone.
  apply(R"({"cmd":"delete","id":9})");
  apply(R"({"cmd":"delete","id":8})");
  apply(R"({"cmd":"delete","id":7})");
  apply(R"({"cmd":"delete","id":5})");
  apply(R"({"cmd":"delete","id":1})");

  buffers_.clear();
  surface_ = false;
}

void SeriesRenderer::buildMain() {
  RecipeBuildResult r;
  switch (type_) {
    case ChartType::Candlestick: {
      CandleRecipeConfig cfg;
      cfg.layerId = kSeriesLayerId;
      cfg.transformId = kPriceTransformId;
      cfg.name = "candles";
      std::copy(theme_.candleUp, theme_.candleUp + 4, cfg.colorUp);
      std::copy(theme_.candleDown, theme_.candleDown + 4, cfg.colorDown);
      r = CandleRecipe(kMainBase, cfg).build();
      break;
    }
    case ChartType::Area: {
      AreaRecipeConfig cfg;
      cfg.layerId = kSeriesLayerId;
      cfg.transformId = kPriceTransformId;
      cfg.name = "area";
      std::copy(theme_.lineColor, theme_.lineColor + 4, cfg.lineColor);
      std::copy(theme_.areaFill, theme_.areaFill + 4, cfg.fillColor);
      cfg.lineWidth = theme_.lineWidth;
      r = AreaRecipe(kMainBase, cfg).build();
      break;
    }
    case ChartType::Line: {
      LineRecipeConfig cfg;
      cfg.layerId = kSeriesLayerId;
      cfg.transformId = kPriceTransformId;
      cfg.name = "line";
      std::copy(theme_.lineColor, theme_.lineColor + 4, cfg.color);
      cfg.lineWidth = theme_.lineWidth;
      r = LineRecipe(kMainBase, cfg).build();
      break;
    }
  }
  applyAll(r.createCommands);
  mainDispose_ = std::move(r.disposeCommands);
}

void SeriesRenderer::disposeMain() {
  applyAll(mainDispose_);
  mainDispose_.clear();
  if (type_ == ChartType::Area) {
    buffers_.remove(areaIds().fillBufferId());
    buffers_.remove(areaIds().lineBufferId());
  } else {
    buffers_.remove(kMainBase);  // slot 0 for candle and line recipes
  }
}

ChartResult SeriesRenderer::setChartType(ChartType type) {
  if (!surface_) {
    type_ = type;
    return chartOk();
  }
  if (type == type_) return chartOk();

  disposeMain();
  type_ = type;
  buildMain();
  writeMain();
  buffers_.syncBufferLengths(scene_);
  return chartOk();
}

// -------------------- data --------------------

void SeriesRenderer::setInterval(std::int64_t seconds) {
  if (seconds <= 0) return;
  axis_.interval = seconds;
  setData({});
  for (IndicatorKind kind : kAllIndicatorKinds) setIndicatorData(kind, {});
}

void SeriesRenderer::setData(const std::vector<Candle>& candles) {
  candles_ = candles;
  axis_.origin = candles_.empty() ? 0 : candles_.front().time;

  areaBaseline_ = 0.0f;
  if (!candles_.empty()) {
    double lo = candles_.front().low;
    for (const auto& c : candles_) lo = std::min(lo, c.low);
    areaBaseline_ = static_cast<float>(lo);
  }

  if (!surface_) {
    autoscale();
    return;
  }
  writeMain();
  writeVolume();
  // The x origin may have moved: overlays are re-placed as well.
  for (IndicatorKind kind : kAllIndicatorKinds) writeOverlay(kind);
  autoscale();
  writeAnnotations();
  buffers_.syncBufferLengths(scene_);
}

ChartResult SeriesRenderer::update(const Candle& candle) {
  if (candles_.empty()) {
    setData({candle});
    return chartOk();
  }

  Candle& last = candles_.back();
  bool appended;
  if (candle.time == last.time) {
    last = candle;
    appended = false;
  } else if (candle.time > last.time) {
    candles_.push_back(candle);
    appended = true;
  } else {
    return chartFail(ErrorCode::OutOfOrderTick,
                     "renderer update older than last point: " + std::to_string(candle.time));
  }

  if (!surface_) {
    if (appended) autoscale(); else extendRange(candle);
    return chartOk();
  }

  amendMainTail(appended);

  // Volume tail
  {
    const std::size_t n = candles_.size();
    float rec[6];
    VolumeRecipe::writeBar(rec, candles_.back(), axis_, config_.candleHalfWidth);
    const Id buf = volumeBufferId();
    if (appended) {
      buffers_.append(buf, rec, VolumeRecipe::kRecordBytes);
      setVertexCount(volumeIds().geometryId(), static_cast<std::uint32_t>(n));
    } else if (!buffers_.updateRange(buf, static_cast<std::uint32_t>((n - 1) * VolumeRecipe::kRecordBytes),
                                     rec, VolumeRecipe::kRecordBytes)) {
      writeVolume();
    }
  }

  if (appended) autoscale(); else extendRange(candle);
  buffers_.syncBufferLengths(scene_);
  return chartOk();
}

void SeriesRenderer::amendMainTail(bool appended) {
  const std::size_t n = candles_.size();
  const Candle& c = candles_.back();

  if (type_ == ChartType::Candlestick) {
    float rec[6];
    CandleRecipe::writeCandle6(rec, c, axis_, config_.candleHalfWidth);
    const Id buf = candleIds().bufferId();
    if (appended) {
      buffers_.append(buf, rec, CandleRecipe::kRecordBytes);
      setVertexCount(candleIds().geometryId(), static_cast<std::uint32_t>(n));
    } else if (!buffers_.updateRange(buf, static_cast<std::uint32_t>((n - 1) * CandleRecipe::kRecordBytes),
                                     rec, CandleRecipe::kRecordBytes)) {
      writeMain();
    }
    return;
  }

  if (type_ == ChartType::Area && static_cast<float>(c.low) < areaBaseline_) {
    // New low under the fill: every quad changes.
    areaBaseline_ = static_cast<float>(c.low);
    writeMain();
    return;
  }

  float last[2] = {static_cast<float>(axis_.x(c.time)), static_cast<float>(c.close)};
  float prev[2] = {0.0f, 0.0f};
  if (n >= 2) {
    const Candle& p = candles_[n - 2];
    prev[0] = static_cast<float>(axis_.x(p.time));
    prev[1] = static_cast<float>(p.close);
  }

  if (type_ == ChartType::Line) {
    LineRecipe ids = lineIds(kMainBase);
    amendLineTail({ids.bufferId(), ids.geometryId()}, n, last, prev, appended);
    return;
  }

  AreaRecipe ids = areaIds();
  amendLineTail({ids.lineBufferId(), ids.lineGeometryId()}, n, last, prev, appended);
  if (n < 2) return;
  float quad[12];
  AreaRecipe::writeQuad(quad, prev[0], prev[1], last[0], last[1], areaBaseline_);
  if (appended) {
    buffers_.append(ids.fillBufferId(), quad, AreaRecipe::kQuadBytes);
    setVertexCount(ids.fillGeometryId(), static_cast<std::uint32_t>(6 * (n - 1)));
  } else if (!buffers_.updateRange(ids.fillBufferId(),
                                   static_cast<std::uint32_t>((n - 2) * AreaRecipe::kQuadBytes),
                                   quad, AreaRecipe::kQuadBytes)) {
    writeMain();
  }
}

void SeriesRenderer::amendLineTail(const LineSeries& line, std::size_t pointCount,
                                   const float* lastXY, const float* prevXY,
                                   bool appended) {
  if (pointCount < 2) return;  // a single point has no segment yet
  float seg[4];
  LineRecipe::writeSegment(seg, prevXY[0], prevXY[1], lastXY[0], lastXY[1]);
  if (appended) {
    buffers_.append(line.bufferId, seg, LineRecipe::kSegmentBytes);
    setVertexCount(line.geometryId, static_cast<std::uint32_t>(2 * (pointCount - 1)));
    return;
  }
  const auto offset = static_cast<std::uint32_t>((pointCount - 2) * LineRecipe::kSegmentBytes);
  if (!buffers_.updateRange(line.bufferId, offset, seg, LineRecipe::kSegmentBytes)) {
    std::fprintf(stderr, "[SeriesRenderer] tail segment out of range for buffer %llu\n",
                 static_cast<unsigned long long>(line.bufferId));
  }
}

void SeriesRenderer::setIndicatorData(IndicatorKind kind,
                                      const std::vector<IndicatorPoint>& points) {
  indicators_[static_cast<std::size_t>(kind)] = points;
  if (!surface_) return;
  writeOverlay(kind);
  buffers_.syncBufferLengths(scene_);
}

void SeriesRenderer::updateIndicatorTail(IndicatorKind kind, const IndicatorPoint& point) {
  auto& pts = indicators_[static_cast<std::size_t>(kind)];
  bool appended;
  if (pts.empty() || point.time > pts.back().time) {
    pts.push_back(point);
    appended = true;
  } else if (point.time == pts.back().time) {
    pts.back() = point;
    appended = false;
  } else {
    return;
  }
  if (!surface_) return;

  const std::size_t n = pts.size();
  float last[2] = {static_cast<float>(axis_.x(point.time)), static_cast<float>(point.value)};
  float prev[2] = {0.0f, 0.0f};
  if (n >= 2) {
    prev[0] = static_cast<float>(axis_.x(pts[n - 2].time));
    prev[1] = static_cast<float>(pts[n - 2].value);
  }
  amendLineTail(overlayLine(kind), n, last, prev, appended);
  buffers_.syncBufferLengths(scene_);
}

void SeriesRenderer::setOverlayVisible(IndicatorKind kind, bool visible) {
  overlayVisible_[static_cast<std::size_t>(kind)] = visible;
  if (!surface_) return;
  apply(makeVisibleCmd(overlayDrawItemId(kind), visible));
  if (kind == IndicatorKind::Rsi14) relayout();
}

void SeriesRenderer::setAnnotations(const AnnotationStore& store) {
  annotations_ = store.annotations();
  if (!surface_) return;
  writeAnnotations();
  buffers_.syncBufferLengths(scene_);
}

std::vector<AnnotationLabel> SeriesRenderer::annotationLabels() const {
  std::vector<AnnotationLabel> out;
  for (const auto& a : annotations_) {
    if (a.kind != AnnotationKind::Text) continue;
    AnnotationLabel l;
    if (!pixelForTime(a.time, l.px) || !pixelForPrice(a.price, l.py)) continue;
    l.annotationId = a.id;
    l.text = a.text;
    out.push_back(std::move(l));
  }
  return out;
}

// -------------------- buffer writers --------------------

std::vector<float> SeriesRenderer::closeXY() const {
  std::vector<float> xy;
  xy.reserve(candles_.size() * 2);
  for (const auto& c : candles_) {
    xy.push_back(static_cast<float>(axis_.x(c.time)));
    xy.push_back(static_cast<float>(c.close));
  }
  return xy;
}

std::vector<float> SeriesRenderer::indicatorXY(IndicatorKind kind) const {
  const auto& pts = indicators_[static_cast<std::size_t>(kind)];
  std::vector<float> xy;
  xy.reserve(pts.size() * 2);
  for (const auto& p : pts) {
    xy.push_back(static_cast<float>(axis_.x(p.time)));
    xy.push_back(static_cast<float>(p.value));
  }
  return xy;
}

void SeriesRenderer::setVertexCount(Id geometryId, std::uint32_t count) {
  apply(makeVertexCountCmd(geometryId, count));
}

void SeriesRenderer::writeLine(const LineSeries& line, const std::vector<float>& xy) {
  std::vector<float> segs = LineRecipe::computeSegments(xy.data(), xy.size() / 2);
  buffers_.setBufferData(line.bufferId, segs.data(),
                         static_cast<std::uint32_t>(segs.size() * sizeof(float)));
  setVertexCount(line.geometryId, static_cast<std::uint32_t>(segs.size() / 2));
}

void SeriesRenderer::writeMain() {
  switch (type_) {
    case ChartType::Candlestick: {
      std::vector<float> data = CandleRecipe::computeCandles(candles_, axis_,
                                                             config_.candleHalfWidth);
      buffers_.setBufferData(candleIds().bufferId(), data.data(),
                             static_cast<std::uint32_t>(data.size() * sizeof(float)));
      setVertexCount(candleIds().geometryId(), static_cast<std::uint32_t>(candles_.size()));
      break;
    }
    case ChartType::Line: {
      LineRecipe ids = lineIds(kMainBase);
      writeLine({ids.bufferId(), ids.geometryId()}, closeXY());
      break;
    }
    case ChartType::Area: {
      AreaRecipe ids = areaIds();
      std::vector<float> xy = closeXY();
      writeLine({ids.lineBufferId(), ids.lineGeometryId()}, xy);
      std::vector<float> fill = AreaRecipe::computeFill(xy.data(), xy.size() / 2,
                                                        areaBaseline_);
      buffers_.setBufferData(ids.fillBufferId(), fill.data(),
                             static_cast<std::uint32_t>(fill.size() * sizeof(float)));
      setVertexCount(ids.fillGeometryId(), static_cast<std::uint32_t>(fill.size() / 2));
      break;
    }
  }
}

void SeriesRenderer::writeVolume() {
  std::vector<float> data = VolumeRecipe::computeVolumeBars(candles_, axis_,
                                                            config_.candleHalfWidth);
  buffers_.setBufferData(volumeBufferId(), data.data(),
                         static_cast<std::uint32_t>(data.size() * sizeof(float)));
  setVertexCount(volumeIds().geometryId(), static_cast<std::uint32_t>(candles_.size()));
}

void SeriesRenderer::writeOverlay(IndicatorKind kind) {
  writeLine(overlayLine(kind), indicatorXY(kind));
}

void SeriesRenderer::writeAnnotations() {
  if (!surface_) return;
  const DataRange& r = priceVp_.dataRange();
  std::vector<float> segs = AnnotationRecipe::computeSegments(annotations_, axis_,
                                                              r.xMin, r.xMax);
  buffers_.setBufferData(annotationBufferId(), segs.data(),
                         static_cast<std::uint32_t>(segs.size() * sizeof(float)));
  setVertexCount(annotationIds().geometryId(), static_cast<std::uint32_t>(segs.size() / 2));
}

// -------------------- layout / scaling --------------------

void SeriesRenderer::relayout() {
  const bool rsi = overlayVisible(IndicatorKind::Rsi14);
  std::vector<PaneRegion> regions = rsi
    ? computePaneLayout({1.0f - config_.rsiPaneFraction, config_.rsiPaneFraction})
    : computePaneLayout({1.0f});

  priceVp_.setClipRegion(regions[0]);
  volumeVp_.setClipRegion(bottomBand(regions[0], config_.volumeBandFraction));
  if (rsi) rsiVp_.setClipRegion(regions[1]);
  pushTransforms();
}

void SeriesRenderer::autoscale() {
  const double bars = static_cast<double>(config_.visibleBars);
  if (candles_.empty()) {
    visLow_ = 0.0;
    visHigh_ = 0.0;
    visVolume_ = 0.0;
    applyRanges(0.0, bars);
    return;
  }

  // One bar of air right of the last candle center.
  const double xMax = axis_.x(candles_.back().time) + 1.0;
  const double xMin = xMax - bars;

  visLow_ = candles_.back().low;
  visHigh_ = candles_.back().high;
  visVolume_ = 0.0;
  for (auto it = candles_.rbegin(); it != candles_.rend(); ++it) {
    if (axis_.x(it->time) + config_.candleHalfWidth < xMin) break;
    visLow_ = std::min(visLow_, it->low);
    visHigh_ = std::max(visHigh_, it->high);
    visVolume_ = std::max(visVolume_, it->volume);
  }
  applyRanges(xMin, xMax);
}

void SeriesRenderer::extendRange(const Candle& c) {
  if (c.high <= visHigh_ && c.low >= visLow_ && c.volume <= visVolume_) return;
  visHigh_ = std::max(visHigh_, c.high);
  visLow_ = std::min(visLow_, c.low);
  visVolume_ = std::max(visVolume_, c.volume);
  const DataRange& r = priceVp_.dataRange();
  applyRanges(r.xMin, r.xMax);
}

void SeriesRenderer::applyRanges(double xMin, double xMax) {
  const DataRange before = priceVp_.dataRange();

  double lo = visLow_, hi = visHigh_;
  double margin = (hi - lo) * config_.priceMargin;
  if (margin <= 0.0) margin = std::max(std::fabs(hi) * config_.priceMargin, 1e-6);
  if (candles_.empty()) { lo = 0.0; hi = 1.0; margin = 0.0; }

  priceVp_.setDataRange(xMin, xMax, lo - margin, hi + margin);
  volumeVp_.setDataRange(xMin, xMax, 0.0, visVolume_ > 0.0 ? visVolume_ : 1.0);
  rsiVp_.setDataRange(xMin, xMax, 0.0, 100.0);
  pushTransforms();

  // Horizontal lines span the visible x range.
  if (!annotations_.empty() &&
      (before.xMin != priceVp_.dataRange().xMin || before.xMax != priceVp_.dataRange().xMax)) {
    writeAnnotations();
  }
}

void SeriesRenderer::pushTransforms() {
  if (!surface_) return;
  apply(makeSetTransformCmd(kPriceTransformId, priceVp_.computeTransformParams()));
  apply(makeSetTransformCmd(kVolumeTransformId, volumeVp_.computeTransformParams()));
  apply(makeSetTransformCmd(kRsiTransformId, rsiVp_.computeTransformParams()));
}

// -------------------- presentation --------------------

void SeriesRenderer::setTheme(const Theme& theme) {
  theme_ = theme;
  if (!surface_) return;
  applyAll(generateThemeCommands(theme_, themeTarget()));
}

ThemeTarget SeriesRenderer::themeTarget() const {
  ThemeTarget t;
  switch (type_) {
    case ChartType::Candlestick:
      t.candleDrawItemIds.push_back(candleIds().drawItemId());
      break;
    case ChartType::Area:
      t.areaFillDrawItemIds.push_back(areaIds().fillDrawItemId());
      t.lineDrawItemIds.push_back(areaIds().lineDrawItemId());
      break;
    case ChartType::Line:
      t.lineDrawItemIds.push_back(lineIds(kMainBase).drawItemId());
      break;
  }
  t.volumeDrawItemIds.push_back(volumeDrawItemId());
  for (int i = 0; i < 3; ++i) {
    t.smaDrawItemIds[i] = overlayDrawItemId(static_cast<IndicatorKind>(i));
  }
  t.rsiDrawItemId = overlayDrawItemId(IndicatorKind::Rsi14);
  t.annotationDrawItemId = annotationDrawItemId();
  return t;
}

void SeriesRenderer::setPixelSize(int width, int height) {
  config_.pixelWidth = width;
  config_.pixelHeight = height;
  priceVp_.setPixelViewport(width, height);
  volumeVp_.setPixelViewport(width, height);
  rsiVp_.setPixelViewport(width, height);
}

void SeriesRenderer::setVisibleBars(int bars) {
  config_.visibleBars = std::max(bars, 2);
  autoscale();
  buffers_.syncBufferLengths(scene_);
}

// -------------------- CoordinateMapper --------------------

bool SeriesRenderer::priceAtPixel(double y, double& price) const {
  if (!mappable()) return false;
  double dx, dy;
  priceVp_.pixelToData(0.0, y, dx, dy);
  price = dy;
  return true;
}

bool SeriesRenderer::pixelForPrice(double price, double& y) const {
  if (!mappable()) return false;
  double px, py;
  priceVp_.dataToPixel(priceVp_.dataRange().xMin, price, px, py);
  y = py;
  return true;
}

bool SeriesRenderer::timeAtPixel(double x, double& timeSeconds) const {
  if (!mappable()) return false;
  double dx, dy;
  priceVp_.pixelToData(x, 0.0, dx, dy);
  timeSeconds = axis_.timeAt(dx);
  return true;
}

bool SeriesRenderer::pixelForTime(double timeSeconds, double& x) const {
  if (!mappable()) return false;
  double px, py;
  priceVp_.dataToPixel(axis_.xOf(timeSeconds), priceVp_.dataRange().yMin, px, py);
  x = px;
  return true;
}

// -------------------- IDs --------------------

Id SeriesRenderer::mainBufferId() const {
  switch (type_) {
    case ChartType::Candlestick: return candleIds().bufferId();
    case ChartType::Area:        return areaIds().lineBufferId();
    case ChartType::Line:        return lineIds(kMainBase).bufferId();
  }
  return 0;
}

std::vector<Id> SeriesRenderer::mainDrawItemIds() const {
  switch (type_) {
    case ChartType::Candlestick: return candleIds().drawItemIds();
    case ChartType::Area:        return areaIds().drawItemIds();
    case ChartType::Line:        return lineIds(kMainBase).drawItemIds();
  }
  return {};
}

Id SeriesRenderer::volumeDrawItemId() const { return volumeIds().drawItemId(); }
Id SeriesRenderer::volumeBufferId() const { return volumeIds().bufferId(); }

SeriesRenderer::LineSeries SeriesRenderer::overlayLine(IndicatorKind kind) const {
  LineRecipe ids = lineIds(overlayBase(kind));
  return {ids.bufferId(), ids.geometryId()};
}

Id SeriesRenderer::overlayDrawItemId(IndicatorKind kind) const {
  return lineIds(overlayBase(kind)).drawItemId();
}

Id SeriesRenderer::overlayBufferId(IndicatorKind kind) const {
  return lineIds(overlayBase(kind)).bufferId();
}

Id SeriesRenderer::annotationDrawItemId() const { return annotationIds().drawItemId(); }
Id SeriesRenderer::annotationBufferId() const { return annotationIds().bufferId(); }

} // namespace tc
