// Live chart demo (headless)
// Synthetic history + FakeTickSource feeding a ChartEngine. Prints the
// series state once per second, then exercises a timeframe switch, a
// horizontal-line drawing and a state round trip.
//
// Usage: tc_live_demo [seconds] [timeframe]

#include "tc/data/FakeTickSource.hpp"
#include "tc/data/HistoryProvider.hpp"
#include "tc/data/Interval.hpp"
#include "tc/session/ChartEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {

// Builds `limit` candles ending at the current bucket with a sine drift.
class SyntheticHistory : public tc::HistoryProvider {
public:
  explicit SyntheticHistory(double basePrice) : base_(basePrice) {}

  void fetch(const tc::HistoryRequest& req, tc::HistoryCallback done) override {
    tc::HistoryResponse resp;
    resp.generation = req.generation;

    tc::IntervalResult ir = tc::resolveInterval(req.timeframe);
    if (!ir.ok) {
      resp.ok = false;
      resp.error = ir.err.message;
      done(resp);
      return;
    }

    auto nowSec = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::int64_t last = tc::CandleAggregator::bucketStart(nowSec, ir.seconds);
    double prevClose = base_;
    for (std::uint32_t i = 0; i < req.limit; ++i) {
      std::int64_t t = last - static_cast<std::int64_t>(req.limit - 1 - i) * ir.seconds;
      double close = base_ + 5.0 * std::sin(static_cast<double>(i) * 0.07) +
                     0.01 * static_cast<double>(i);
      tc::Candle c;
      c.time = t;
      c.open = prevClose;
      c.close = close;
      c.high = std::max(c.open, c.close) + 0.4;
      c.low = std::min(c.open, c.close) - 0.4;
      c.volume = 100.0 + static_cast<double>(i % 17) * 10.0;
      resp.candles.push_back(c);
      prevClose = close;
    }
    done(resp);
  }

private:
  double base_;
};

void printState(const tc::ChartEngine& engine) {
  const auto& agg = engine.aggregator();
  const tc::Candle* last = agg.last();
  if (!last) {
    std::printf("  [%s %s] no candles\n", engine.symbol().c_str(), engine.timeframe().c_str());
    return;
  }
  const auto& sma20 = engine.indicators().series(tc::IndicatorKind::Sma20);
  const auto& rsi = engine.indicators().series(tc::IndicatorKind::Rsi14);
  std::printf("  [%s %s] candles=%zu last={t=%lld o=%.2f h=%.2f l=%.2f c=%.2f} "
              "sma20=%.2f rsi14=%.1f ticks=%llu\n",
              engine.symbol().c_str(), engine.timeframe().c_str(), agg.size(),
              static_cast<long long>(last->time), last->open, last->high, last->low,
              last->close,
              sma20.empty() ? 0.0 : sma20.back().value,
              rsi.empty() ? 0.0 : rsi.back().value,
              static_cast<unsigned long long>(engine.stats().ticksAccepted));
}

} // namespace

int main(int argc, char** argv) {
  int seconds = (argc > 1) ? std::atoi(argv[1]) : 3;
  std::string timeframe = (argc > 2) ? argv[2] : "1m";
  if (seconds <= 0) seconds = 3;

  SyntheticHistory history(100.0);

  tc::FakeTickSourceConfig feedCfg;
  feedCfg.tickIntervalMs = 50;
  tc::FakeTickSource feed(feedCfg);

  tc::ChartEngineConfig cfg;
  cfg.symbol = "BTC/USD";
  cfg.timeframe = timeframe;
  cfg.historyLimit = 300;

  tc::ChartEngine engine(cfg, &history, &feed);
  engine.onPriceUpdate([](double) {});

  tc::ChartResult r = engine.start();
  if (!r.ok) {
    std::fprintf(stderr, "start failed: %s %s\n", tc::toString(r.err.code),
                 r.err.message.c_str());
    return 1;
  }

  std::printf("Live chart demo: %s %s for %ds\n", cfg.symbol.c_str(),
              timeframe.c_str(), seconds);
  for (int s = 0; s < seconds; ++s) {
    for (int i = 0; i < 10; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      engine.pumpFeed();
    }
    printState(engine);
  }

  engine.setIndicatorVisibility(tc::IndicatorKind::Rsi14, true);
  engine.setToolState(tc::DrawingTool::HorizontalLine);
  std::uint32_t lineId = engine.onClick(640.0, 200.0);
  std::printf("Horizontal line id=%u annotations=%zu\n", lineId,
              engine.annotations().count());

  std::string saved = engine.saveState();
  std::printf("Saved state: %s\n", saved.c_str());

  r = engine.setTimeframe("5m");
  std::printf("Switch to 5m: %s\n", r.ok ? "ok" : r.err.message.c_str());
  engine.pumpFeed();
  printState(engine);

  r = engine.setChartType(tc::ChartType::Area);
  std::printf("Area chart: %s, main buffer %u bytes\n", r.ok ? "ok" : "failed",
              engine.renderer().buffers().getBufferSize(engine.renderer().mainBufferId()));

  engine.stop();
  return 0;
}
