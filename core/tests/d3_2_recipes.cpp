// D3.2 - Recipe test (pure C++)
// Tests: deterministic ids, create/dispose commands apply cleanly, vertex
// writers for candles, volume bars, lines, area fill and annotations.

#include "tc/commands/CommandProcessor.hpp"
#include "tc/recipe/AnnotationRecipe.hpp"
#include "tc/recipe/AreaRecipe.hpp"
#include "tc/recipe/CandleRecipe.hpp"
#include "tc/recipe/LineRecipe.hpp"
#include "tc/recipe/VolumeRecipe.hpp"
#include "tc/scene/ResourceRegistry.hpp"
#include "tc/scene/Scene.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireOk(const tc::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static void applyAll(tc::CommandProcessor& cp, const std::vector<tc::CmdString>& cmds,
                     const char* ctx) {
  for (const auto& c : cmds) requireOk(cp.applyJsonText(c), ctx);
}

static tc::Candle mk(std::int64_t t, double o, double h, double l, double c, double v) {
  tc::Candle k;
  k.time = t; k.open = o; k.high = h; k.low = l; k.close = c; k.volume = v;
  return k;
}

int main() {
  // --- Test 1: build and dispose every recipe against a live scene ---
  {
    tc::Scene scene;
    tc::ResourceRegistry reg;
    tc::CommandProcessor cp(scene, reg);
    requireOk(cp.applyJsonText(R"({"cmd":"createPane","id":1})"), "pane");
    requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":2,"paneId":1})"), "layer");
    requireOk(cp.applyJsonText(R"({"cmd":"createTransform","id":7})"), "transform");

    tc::CandleRecipeConfig cc;
    cc.layerId = 2; cc.transformId = 7; cc.name = "candles";
    tc::CandleRecipe candle(100, cc);

    tc::VolumeRecipeConfig vc;
    vc.layerId = 2; vc.transformId = 7; vc.name = "volume";
    tc::VolumeRecipe volume(110, vc);

    tc::LineRecipeConfig lc;
    lc.layerId = 2; lc.transformId = 7; lc.name = "sma20";
    tc::LineRecipe line(120, lc);

    tc::AreaRecipeConfig ac;
    ac.layerId = 2; ac.transformId = 7; ac.name = "area";
    tc::AreaRecipe area(130, ac);

    tc::AnnotationRecipeConfig nc;
    nc.layerId = 2; nc.transformId = 7; nc.name = "annotations";
    tc::AnnotationRecipe notes(140, nc);

    requireTrue(candle.bufferId() == 100 && candle.geometryId() == 101 &&
                candle.drawItemId() == 102, "candle id layout");
    requireTrue(area.fillDrawItemId() == 132 && area.lineBufferId() == 133 &&
                area.lineDrawItemId() == 135, "area id layout");

    const tc::Recipe* all[] = {&candle, &volume, &line, &area, &notes};
    std::vector<tc::RecipeBuildResult> built;
    for (const tc::Recipe* r : all) {
      built.push_back(r->build());
      applyAll(cp, built.back().createCommands, "create");
    }

    const tc::DrawItem* di = scene.getDrawItem(102);
    requireTrue(di && di->pipeline == "instancedCandle@1" && di->transformId == 7,
                "candle item bound + attached");
    requireTrue(scene.getDrawItem(112)->pipeline == "instancedCandle@1", "volume uses candle pipeline");
    requireTrue(scene.getDrawItem(122)->pipeline == "line2d@1", "line pipeline");
    requireTrue(scene.getDrawItem(132)->pipeline == "triSolid@1", "area fill pipeline");
    requireTrue(scene.getDrawItem(135)->pipeline == "line2d@1", "area outline pipeline");
    requireTrue(scene.getDrawItem(142)->lineWidth == 2.0f, "annotation style applied");
    requireTrue(scene.getDrawItem(102)->colorUp[1] == cc.colorUp[1], "up color applied");

    for (const auto& b : built) applyAll(cp, b.disposeCommands, "dispose");
    requireTrue(scene.drawItemIds().empty(), "all draw items disposed");
    requireTrue(!scene.hasBuffer(100) && !scene.hasGeometry(131), "buffers/geometries disposed");
    requireTrue(scene.hasTransform(7), "shared transform untouched");
    std::printf("  Test 1 (build/dispose): PASS\n");
  }

  // --- Test 2: candle6 and volume records ---
  {
    tc::TimeAxis axis;
    axis.origin = 600;
    axis.interval = 60;

    float rec[6];
    tc::CandleRecipe::writeCandle6(rec, mk(720, 10, 12, 9, 11, 5), axis, 0.4f);
    requireClose(rec[0], 2.0f, 1e-6f, "x = (720-600)/60");
    requireTrue(rec[1] == 10.0f && rec[2] == 12.0f && rec[3] == 9.0f && rec[4] == 11.0f,
                "OHLC");
    requireClose(rec[5], 0.4f, 1e-6f, "halfWidth");

    tc::VolumeRecipe::writeBar(rec, mk(600, 10, 12, 9, 11, 250), axis, 0.4f);
    requireTrue(rec[1] == 0.0f && rec[4] == 250.0f, "up bar: open 0, close vol");
    requireTrue(rec[2] == 250.0f && rec[3] == 0.0f, "bar spans 0..vol");

    tc::VolumeRecipe::writeBar(rec, mk(600, 11, 12, 9, 10, 250), axis, 0.4f);
    requireTrue(rec[1] == 250.0f && rec[4] == 0.0f, "down bar: open vol, close 0");

    std::vector<tc::Candle> cs = {mk(600, 1, 2, 0, 1, 1), mk(660, 1, 2, 0, 1, 1),
                                  mk(720, 1, 2, 0, 1, 1)};
    requireTrue(tc::CandleRecipe::computeCandles(cs, axis, 0.4f).size() == 18, "3 x 6 floats");
    requireTrue(tc::VolumeRecipe::computeVolumeBars(cs, axis, 0.4f).size() == 18, "3 x 6 floats");
    std::printf("  Test 2 (candle6/volume): PASS\n");
  }

  // --- Test 3: line segments and area fill ---
  {
    float xy[] = {0, 10, 1, 12, 2, 11};
    std::vector<float> segs = tc::LineRecipe::computeSegments(xy, 3);
    requireTrue(segs.size() == 8, "3 points -> 2 segments");
    requireTrue(segs[4] == 1.0f && segs[5] == 12.0f && segs[6] == 2.0f && segs[7] == 11.0f,
                "second segment");
    requireTrue(tc::LineRecipe::computeSegments(xy, 1).empty(), "1 point -> nothing");

    std::vector<float> fill = tc::AreaRecipe::computeFill(xy, 3, 5.0f);
    requireTrue(fill.size() == 24, "2 quads x 12 floats");
    requireTrue(fill[1] == 5.0f && fill[3] == 10.0f && fill[11] == 5.0f, "quad to baseline");
    std::printf("  Test 3 (line/area): PASS\n");
  }

  // --- Test 4: annotation segments ---
  {
    tc::TimeAxis axis;
    axis.origin = 0;
    axis.interval = 60;

    std::vector<tc::Annotation> notes(4);
    notes[0].kind = tc::AnnotationKind::HorizontalLine;
    notes[0].price = 100.0;
    notes[1].kind = tc::AnnotationKind::Trendline;
    notes[1].time = 60; notes[1].price = 1; notes[1].time1 = 180; notes[1].price1 = 3;
    notes[2].kind = tc::AnnotationKind::Text;
    notes[2].text = "hello";
    notes[3].kind = tc::AnnotationKind::Brush;
    notes[3].points = {{0, 1}, {30, 2}, {60, 3}};

    std::vector<float> segs = tc::AnnotationRecipe::computeSegments(notes, axis, -5.0, 20.0);
    requireTrue(segs.size() == 4 * 4, "1 + 1 + 0 + 2 segments");
    requireTrue(segs[0] == -5.0f && segs[2] == 20.0f && segs[1] == 100.0f,
                "horizontal line spans visible x");
    requireTrue(segs[4] == 1.0f && segs[6] == 3.0f, "trendline x in bars");
    requireClose(segs[10], 0.5f, 1e-6f, "brush mid point at half a bar");
    std::printf("  Test 4 (annotations): PASS\n");
  }

  std::printf("\nD3.2 recipes: ALL PASS\n");
  return 0;
}
