// D4.2 - Drawing tool state machine test (pure C++)
// Tests: horizontal line, trendline, text, brush, unresolved coordinates,
// tool switching, clear.

#include "tc/drawing/DrawingInteraction.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

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

// 1 px = 1 second across x; y maps 0..500 px to price 200..100.
struct LinearMapper : tc::CoordinateMapper {
  bool ready{true};

  bool priceAtPixel(double y, double& price) const override {
    if (!ready) return false;
    price = 200.0 - y * 0.2;
    return true;
  }
  bool pixelForPrice(double price, double& y) const override {
    if (!ready) return false;
    y = (200.0 - price) / 0.2;
    return true;
  }
  bool timeAtPixel(double x, double& t) const override {
    if (!ready) return false;
    t = 1000.0 + x;
    return true;
  }
  bool pixelForTime(double t, double& x) const override {
    if (!ready) return false;
    x = t - 1000.0;
    return true;
  }
};

int main() {
  // --- Test 1: horizontal line creates one annotation and resets ---
  {
    LinearMapper m;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;
    di.setTool(tc::DrawingTool::HorizontalLine);

    std::uint32_t id = di.onClick(10.0, 250.0, m, store);
    requireTrue(id != 0, "created");
    requireTrue(store.count() == 1, "exactly one annotation");
    requireClose(store.get(id)->price, 150.0, 1e-9, "price at click");
    requireTrue(di.tool() == tc::DrawingTool::Cursor, "reset to cursor");

    requireTrue(di.onClick(10.0, 250.0, m, store) == 0, "cursor click creates nothing");
    requireTrue(store.count() == 1, "still one");
    std::printf("  Test 1 (horizontal line): PASS\n");
  }

  // --- Test 2: unresolved coordinates create nothing, tool stays armed ---
  {
    LinearMapper m;
    m.ready = false;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;

    for (tc::DrawingTool tool : {tc::DrawingTool::HorizontalLine, tc::DrawingTool::Trendline,
                                 tc::DrawingTool::Text}) {
      di.setTool(tool);
      requireTrue(di.onClick(5.0, 5.0, m, store) == 0, "nothing created");
      requireTrue(di.tool() == tool, "tool still armed");
    }
    requireTrue(!di.hasTrendlineAnchor(), "no anchor from an unresolved click");

    di.setTool(tc::DrawingTool::Brush);
    di.onPointerDown(1, 1, m);
    requireTrue(!di.isStroking(), "unresolved pointer down starts nothing");
    requireTrue(store.count() == 0, "store empty");

    m.ready = true;
    di.setTool(tc::DrawingTool::HorizontalLine);
    requireTrue(di.onClick(0.0, 0.0, m, store) != 0, "works once data is there");
    std::printf("  Test 2 (unresolved): PASS\n");
  }

  // --- Test 3: trendline needs two clicks ---
  {
    LinearMapper m;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;
    di.setTool(tc::DrawingTool::Trendline);

    requireTrue(di.onClick(0.0, 0.0, m, store) == 0, "first click anchors");
    requireTrue(di.hasTrendlineAnchor(), "anchor held");
    std::uint32_t id = di.onClick(100.0, 500.0, m, store);
    requireTrue(id != 0, "second click commits");
    const tc::Annotation* a = store.get(id);
    requireTrue(a->kind == tc::AnnotationKind::Trendline, "trendline");
    requireClose(a->time, 1000.0, 1e-9, "t0");
    requireClose(a->price, 200.0, 1e-9, "p0");
    requireClose(a->time1, 1100.0, 1e-9, "t1");
    requireClose(a->price1, 100.0, 1e-9, "p1");
    requireTrue(di.tool() == tc::DrawingTool::Cursor && !di.hasTrendlineAnchor(), "reset");

    di.setTool(tc::DrawingTool::Trendline);
    di.onClick(0.0, 0.0, m, store);
    di.setTool(tc::DrawingTool::Trendline);
    requireTrue(!di.hasTrendlineAnchor(), "re-selecting a tool drops the anchor");
    std::printf("  Test 3 (trendline): PASS\n");
  }

  // --- Test 4: text ---
  {
    LinearMapper m;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;
    di.setTool(tc::DrawingTool::Text);
    di.setPendingText("support");
    std::uint32_t id = di.onClick(50.0, 100.0, m, store);
    requireTrue(id != 0 && store.get(id)->text == "support", "label stored");
    requireClose(store.get(id)->time, 1050.0, 1e-9, "time");
    requireClose(store.get(id)->price, 180.0, 1e-9, "price");
    requireTrue(di.tool() == tc::DrawingTool::Cursor, "reset");
    std::printf("  Test 4 (text): PASS\n");
  }

  // --- Test 5: brush ---
  {
    LinearMapper m;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;
    di.setTool(tc::DrawingTool::Brush);

    requireTrue(di.onClick(1, 1, m, store) == 0, "click does nothing for brush");

    // Down and up both resolve, so a tap still records two points.
    di.onPointerDown(0, 0, m);
    requireTrue(di.onPointerUp(0, 0, m, store) != 0, "tap commits");
    requireTrue(store.count() == 1, "one stroke");
    requireTrue(di.tool() == tc::DrawingTool::Cursor, "reset after stroke");

    di.setTool(tc::DrawingTool::Brush);
    di.onPointerDown(0, 0, m);
    di.onPointerMove(10, 10, m);
    di.onPointerMove(20, 5, m);
    requireTrue(di.isStroking() && di.strokePoints().size() == 3, "collecting");
    std::uint32_t id = di.onPointerUp(30, 0, m, store);
    requireTrue(id != 0, "stroke committed");
    requireTrue(store.get(id)->points.size() == 4, "4 points");
    requireTrue(!di.isStroking(), "stroke closed");

    di.setTool(tc::DrawingTool::Brush);
    di.onPointerDown(0, 0, m);
    m.ready = false;
    requireTrue(di.onPointerUp(5, 5, m, store) == 0, "one resolved point is not a stroke");
    requireTrue(di.tool() == tc::DrawingTool::Brush, "brush stays armed");
    std::printf("  Test 5 (brush): PASS\n");
  }

  // --- Test 6: clearAll + tool names ---
  {
    LinearMapper m;
    tc::AnnotationStore store;
    tc::DrawingInteraction di;
    di.setTool(tc::DrawingTool::HorizontalLine);
    di.onClick(0, 0, m, store);
    di.setTool(tc::DrawingTool::Trendline);
    di.onClick(0, 0, m, store);
    di.clearAll(store);
    requireTrue(store.count() == 0, "cleared");
    requireTrue(di.tool() == tc::DrawingTool::Cursor && !di.hasTrendlineAnchor(), "reset");

    tc::DrawingTool t;
    requireTrue(tc::parseDrawingTool("horizontal_line", t) && t == tc::DrawingTool::HorizontalLine,
                "parse");
    requireTrue(!tc::parseDrawingTool("lasso", t), "unknown tool");
    std::printf("  Test 6 (clearAll): PASS\n");
  }

  std::printf("\nD4.2 drawing interaction: ALL PASS\n");
  return 0;
}
