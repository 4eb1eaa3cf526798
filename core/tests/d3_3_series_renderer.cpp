// D3.3 - Series renderer test (pure C++)
// Tests: surface lifecycle, data upload, tail updates touch only the tail,
// chart type switching, overlays, autoscale, coordinate mapping.

#include "tc/render/SeriesRenderer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static std::vector<tc::Candle> makeCandles(int n, std::int64_t start, std::int64_t interval) {
  std::vector<tc::Candle> out;
  double price = 100.0;
  for (int i = 0; i < n; ++i) {
    tc::Candle c;
    c.time = start + i * interval;
    c.open = price;
    price += (i % 3 == 0) ? -1.0 : 1.5;
    c.close = price;
    c.high = std::fmax(c.open, c.close) + 0.5;
    c.low = std::fmin(c.open, c.close) - 0.5;
    c.volume = 100.0 + i;
    out.push_back(c);
  }
  return out;
}

static std::vector<std::uint8_t> bytesOf(const tc::SeriesRenderer& r, tc::Id buf) {
  const std::uint8_t* p = r.buffers().getBufferData(buf);
  std::uint32_t n = r.buffers().getBufferSize(buf);
  if (!p) return {};
  return std::vector<std::uint8_t>(p, p + n);
}

static std::uint32_t vertexCount(const tc::SeriesRenderer& r, tc::Id geom) {
  const tc::Geometry* g = r.scene().getGeometry(geom);
  return g ? g->vertexCount : 0xFFFFFFFFu;
}

int main() {
  const std::int64_t kInterval = 60;
  const std::int64_t kStart = 1700000000 - (1700000000 % 60);

  // --- Test 1: surface lifecycle ---
  {
    tc::SeriesRenderer r;
    requireTrue(!r.hasSurface(), "no surface yet");
    requireTrue(r.createSurface().ok, "createSurface");
    requireTrue(r.hasSurface(), "surface up");
    requireTrue(r.scene().hasPane(tc::SeriesRenderer::kPricePaneId), "price pane");
    requireTrue(r.scene().hasPane(tc::SeriesRenderer::kRsiPaneId), "rsi pane");
    requireTrue(r.scene().hasDrawItem(r.volumeDrawItemId()), "volume item");
    requireTrue(r.scene().hasDrawItem(r.annotationDrawItemId()), "annotation item");
    for (tc::IndicatorKind k : tc::kAllIndicatorKinds) {
      requireTrue(r.scene().hasDrawItem(r.overlayDrawItemId(k)), "overlay item");
    }
    requireTrue(r.scene().getDrawItem(r.overlayDrawItemId(tc::IndicatorKind::Sma20))->visible,
                "SMA20 visible by default");
    requireTrue(!r.scene().getDrawItem(r.overlayDrawItemId(tc::IndicatorKind::Rsi14))->visible,
                "RSI hidden by default");
    requireTrue(r.mainDrawItemIds().size() == 1, "candlestick main item");
    requireTrue(r.createSurface().ok, "createSurface is idempotent");

    r.destroySurface();
    requireTrue(!r.hasSurface(), "destroyed");
    requireTrue(r.scene().paneIds().empty() && r.scene().drawItemIds().empty(), "scene empty");
    requireTrue(r.createSurface().ok, "surface can be recreated");
    requireTrue(r.scene().drawItemIds().size() == 7, "7 draw items after recreate");
    std::printf("  Test 1 (lifecycle): PASS\n");
  }

  // --- Test 2: setData uploads main + volume ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    std::vector<tc::Candle> cs = makeCandles(50, kStart, kInterval);
    r.setData(cs);

    requireTrue(r.timeAxis().origin == kStart, "origin = first candle");
    requireTrue(r.buffers().getBufferSize(r.mainBufferId()) == 50 * 24, "50 candle6 records");
    requireTrue(r.buffers().getBufferSize(r.volumeBufferId()) == 50 * 24, "50 volume bars");
    requireTrue(vertexCount(r, tc::SeriesRenderer::kMainBase + 1) == 50, "candle instance count");
    requireTrue(r.scene().getBuffer(r.mainBufferId())->byteLength == 50 * 24,
                "scene byteLength synced");

    float last[6];
    std::memcpy(last, r.buffers().getBufferData(r.mainBufferId()) + 49 * 24, 24);
    requireClose(last[0], 49.0, 1e-6, "last candle at x = 49");
    requireClose(last[4], cs.back().close, 1e-4, "last close");

    const tc::DataRange& dr = r.priceViewport().dataRange();
    requireClose(dr.xMax, 50.0, 1e-9, "x range ends one bar past last");
    requireClose(dr.xMax - dr.xMin, 120.0, 1e-9, "120 visible bars");
    double lo = 1e9, hi = -1e9;
    for (const auto& c : cs) { lo = std::fmin(lo, c.low); hi = std::fmax(hi, c.high); }
    requireTrue(dr.yMin < lo && dr.yMax > hi, "price range covers the data with margin");
    std::printf("  Test 2 (setData): PASS\n");
  }

  // --- Test 3: tail updates are O(1) writes ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    std::vector<tc::Candle> cs = makeCandles(500, kStart, kInterval);
    r.setData(cs);

    tc::Candle tail = cs.back();
    tail.close += 0.25;
    tail.high = std::fmax(tail.high, tail.close);
    r.buffers().resetStats();
    requireTrue(r.update(tail).ok, "in-place update");
    requireTrue(r.buffers().stats().writes == 2, "main + volume tail writes");
    requireTrue(r.buffers().stats().bytesWritten == 48, "one record each");
    requireTrue(r.candles().size() == 500, "no growth");

    tc::Candle next = tail;
    next.time += kInterval;
    next.open = tail.close;
    r.buffers().resetStats();
    requireTrue(r.update(next).ok, "append");
    requireTrue(r.buffers().stats().bytesWritten == 48, "append writes one record each");
    requireTrue(r.buffers().getBufferSize(r.mainBufferId()) == 501 * 24, "grew by one");
    requireTrue(vertexCount(r, tc::SeriesRenderer::kMainBase + 1) == 501, "count bumped");

    // Same result as a full upload.
    std::vector<std::uint8_t> incremental = bytesOf(r, r.mainBufferId());
    std::vector<tc::Candle> full = r.candles();
    r.setData(full);
    requireTrue(bytesOf(r, r.mainBufferId()) == incremental, "incremental == full rewrite");

    tc::Candle old = cs[10];
    tc::ChartResult res = r.update(old);
    requireTrue(!res.ok && res.err.code == tc::ErrorCode::OutOfOrderTick, "older point rejected");
    requireTrue(r.candles().size() == 501, "unchanged");
    std::printf("  Test 3 (tail updates): PASS\n");
  }

  // --- Test 4: chart type switching reproduces vertex output ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    std::vector<tc::Candle> cs = makeCandles(40, kStart, kInterval);
    r.setData(cs);
    std::vector<std::uint8_t> candles = bytesOf(r, r.mainBufferId());

    requireTrue(r.setChartType(tc::ChartType::Line).ok, "to line");
    requireTrue(r.chartType() == tc::ChartType::Line, "type is line");
    requireTrue(r.buffers().getBufferSize(r.mainBufferId()) == 39 * 16, "39 segments");
    requireTrue(r.scene().getDrawItem(r.mainDrawItemIds()[0])->pipeline == "line2d@1",
                "line pipeline");
    std::vector<std::uint8_t> line = bytesOf(r, r.mainBufferId());

    requireTrue(r.setChartType(tc::ChartType::Area).ok, "to area");
    requireTrue(r.mainDrawItemIds().size() == 2, "fill + outline");
    requireTrue(bytesOf(r, r.mainBufferId()) == line, "area outline == line");

    requireTrue(r.setChartType(tc::ChartType::Candlestick).ok, "back to candles");
    requireTrue(bytesOf(r, r.mainBufferId()) == candles, "same candle bytes after round trip");
    r.setData(cs);
    requireTrue(bytesOf(r, r.mainBufferId()) == candles, "same bytes after setData");
    requireTrue(r.scene().drawItemIds().size() == 7, "no leaked draw items");

    tc::ChartType parsed;
    requireTrue(tc::parseChartType("area", parsed) && parsed == tc::ChartType::Area, "parse");
    requireTrue(!tc::parseChartType("renko", parsed), "unknown type");
    std::printf("  Test 4 (chart type): PASS\n");
  }

  // --- Test 5: line/area tails ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    r.setChartType(tc::ChartType::Area);
    std::vector<tc::Candle> cs = makeCandles(30, kStart, kInterval);
    r.setData(cs);

    tc::Candle tail = cs.back();
    tail.close += 0.1;
    r.update(tail);
    tc::Candle next = tail;
    next.time += kInterval;
    r.update(next);

    std::vector<std::uint8_t> outline = bytesOf(r, r.mainBufferId());
    std::vector<std::uint8_t> fill = bytesOf(r, tc::SeriesRenderer::kMainBase);
    r.setData(r.candles());
    requireTrue(bytesOf(r, r.mainBufferId()) == outline, "outline tail == rewrite");
    requireTrue(bytesOf(r, tc::SeriesRenderer::kMainBase) == fill, "fill tail == rewrite");
    requireTrue(vertexCount(r, tc::SeriesRenderer::kMainBase + 1) == 6 * 30, "30 quads");
    std::printf("  Test 5 (line/area tails): PASS\n");
  }

  // --- Test 6: overlays ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    std::vector<tc::Candle> cs = makeCandles(40, kStart, kInterval);
    r.setData(cs);

    std::vector<tc::IndicatorPoint> pts;
    for (int i = 19; i < 40; ++i) pts.push_back({cs[static_cast<std::size_t>(i)].time, 100.0 + i});
    r.setIndicatorData(tc::IndicatorKind::Sma20, pts);
    tc::Id buf = r.overlayBufferId(tc::IndicatorKind::Sma20);
    requireTrue(r.buffers().getBufferSize(buf) == 20 * 16, "21 points -> 20 segments");

    r.buffers().resetStats();
    r.updateIndicatorTail(tc::IndicatorKind::Sma20, {cs.back().time, 150.0});
    requireTrue(r.buffers().stats().bytesWritten == 16, "tail segment only");
    r.updateIndicatorTail(tc::IndicatorKind::Sma20, {cs.back().time + kInterval, 151.0});
    requireTrue(r.buffers().getBufferSize(buf) == 21 * 16, "appended segment");

    float seg[4];
    std::memcpy(seg, r.buffers().getBufferData(buf) + 20 * 16, 16);
    requireClose(seg[1], 150.0, 1e-4, "segment starts at amended tail");
    requireClose(seg[2], 40.0, 1e-6, "segment ends at next bar");

    tc::Id rsiItem = r.overlayDrawItemId(tc::IndicatorKind::Rsi14);
    double priceHeight = r.priceViewport().clipRegion().clipYMax -
                         r.priceViewport().clipRegion().clipYMin;
    r.setOverlayVisible(tc::IndicatorKind::Rsi14, true);
    requireTrue(r.scene().getDrawItem(rsiItem)->visible, "RSI shown");
    requireTrue(r.priceViewport().clipRegion().clipYMax -
                r.priceViewport().clipRegion().clipYMin < priceHeight, "price pane shrinks");
    requireTrue(r.volumeViewport().clipRegion().clipYMin == r.priceViewport().clipRegion().clipYMin &&
                r.volumeViewport().clipRegion().clipYMax < r.priceViewport().clipRegion().clipYMax,
                "volume band follows the price pane");
    requireTrue(r.rsiViewport().dataRange().yMin == 0.0 &&
                r.rsiViewport().dataRange().yMax == 100.0, "RSI band 0..100");

    r.setOverlayVisible(tc::IndicatorKind::Sma20, false);
    requireTrue(!r.scene().getDrawItem(r.overlayDrawItemId(tc::IndicatorKind::Sma20))->visible,
                "SMA20 hidden");
    requireTrue(r.buffers().getBufferSize(buf) == 21 * 16, "hidden overlay keeps its data");
    std::printf("  Test 6 (overlays): PASS\n");
  }

  // --- Test 7: coordinate mapping ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    double price = 0, px = 0;
    requireTrue(!r.priceAtPixel(100.0, price), "no surface -> unresolved");
    r.createSurface();
    requireTrue(!r.priceAtPixel(100.0, price), "no data -> unresolved");
    requireTrue(!r.pixelForTime(static_cast<double>(kStart), px), "no data -> unresolved");

    std::vector<tc::Candle> cs = makeCandles(60, kStart, kInterval);
    r.setData(cs);

    double y = 0;
    requireTrue(r.pixelForPrice(cs[30].close, y), "price -> pixel");
    requireTrue(r.priceAtPixel(y, price), "pixel -> price");
    requireClose(price, cs[30].close, 1e-6, "price round trip");

    double t = static_cast<double>(cs[30].time);
    requireTrue(r.pixelForTime(t, px), "time -> pixel");
    double back = 0;
    requireTrue(r.timeAtPixel(px, back), "pixel -> time");
    requireClose(back, t, 1e-3, "time round trip");

    double pxLater = 0;
    r.pixelForTime(static_cast<double>(cs[40].time), pxLater);
    requireTrue(pxLater > px, "later time is further right");
    double yHigh = 0;
    r.pixelForPrice(cs[30].close + 1.0, yHigh);
    requireTrue(yHigh < y, "higher price is further up");
    std::printf("  Test 7 (mapping): PASS\n");
  }

  // --- Test 8: annotations + labels ---
  {
    tc::SeriesRenderer r;
    r.setInterval(kInterval);
    r.createSurface();
    std::vector<tc::Candle> cs = makeCandles(20, kStart, kInterval);
    r.setData(cs);

    tc::AnnotationStore store;
    store.addHorizontalLine(101.0);
    store.addTrendline(static_cast<double>(cs[2].time), 100.0,
                       static_cast<double>(cs[8].time), 104.0);
    std::uint32_t textId = store.addText(static_cast<double>(cs[5].time), 102.0, "breakout");
    r.setAnnotations(store);

    requireTrue(r.buffers().getBufferSize(r.annotationBufferId()) == 2 * 16,
                "two segments (text has no geometry)");
    requireTrue(vertexCount(r, tc::SeriesRenderer::kAnnotationBase + 1) == 4, "4 vertices");

    std::vector<tc::AnnotationLabel> labels = r.annotationLabels();
    requireTrue(labels.size() == 1 && labels[0].annotationId == textId &&
                labels[0].text == "breakout", "text label");
    double expectY = 0;
    r.pixelForPrice(102.0, expectY);
    requireClose(labels[0].py, expectY, 1e-9, "label y at its price");

    // Appending a bar scrolls the view; the horizontal line follows.
    tc::Candle next = cs.back();
    next.time += kInterval;
    r.update(next);
    float seg[4];
    std::memcpy(seg, r.buffers().getBufferData(r.annotationBufferId()), 16);
    requireClose(seg[2], r.priceViewport().dataRange().xMax, 1e-4, "line spans new range");
    std::printf("  Test 8 (annotations): PASS\n");
  }

  // --- Test 9: theme ---
  {
    tc::SeriesRenderer r;
    r.createSurface();
    r.setTheme(tc::lightTheme());
    requireTrue(r.theme().name == "Light", "theme stored");
    const tc::DrawItem* candle = r.scene().getDrawItem(r.mainDrawItemIds()[0]);
    requireTrue(candle->colorUp[0] == tc::lightTheme().candleUp[0], "candle colors themed");
    r.setChartType(tc::ChartType::Line);
    const tc::DrawItem* line = r.scene().getDrawItem(r.mainDrawItemIds()[0]);
    requireTrue(line->color[2] == tc::lightTheme().lineColor[2], "rebuilt series keeps theme");
    std::printf("  Test 9 (theme): PASS\n");
  }

  std::printf("\nD3.3 series renderer: ALL PASS\n");
  return 0;
}
