// D2.2 - Indicator engine test (pure C++)
// Tests: wiring to the aggregator, incremental tail updates match a
// wholesale recompute, listener notifications.

#include "tc/data/CandleAggregator.hpp"
#include "tc/math/IndicatorEngine.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::vector<tc::Candle> makeHistory(int n, std::int64_t interval) {
  std::vector<tc::Candle> out;
  double price = 100.0;
  for (int i = 0; i < n; ++i) {
    tc::Candle c;
    c.time = i * interval;
    c.open = price;
    price += std::sin(i * 0.3) * 2.0;
    c.close = price;
    c.high = std::fmax(c.open, c.close) + 0.5;
    c.low = std::fmin(c.open, c.close) - 0.5;
    c.volume = 10.0;
    out.push_back(c);
  }
  return out;
}

static void requireSameSeries(const std::vector<tc::IndicatorPoint>& a,
                              const std::vector<tc::IndicatorPoint>& b, const char* msg) {
  if (a.size() != b.size()) {
    std::fprintf(stderr, "ASSERT FAIL: %s (size %zu vs %zu)\n", msg, a.size(), b.size());
    std::exit(1);
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].time != b[i].time || std::fabs(a[i].value - b[i].value) > 1e-9) {
      std::fprintf(stderr, "ASSERT FAIL: %s (index %zu: t=%lld v=%.12f vs t=%lld v=%.12f)\n",
                   msg, i, static_cast<long long>(a[i].time), a[i].value,
                   static_cast<long long>(b[i].time), b[i].value);
      std::exit(1);
    }
  }
}

int main() {
  // --- Test 1: attach computes from existing candles, aligned times ---
  {
    tc::CandleAggregator agg;
    agg.setInterval(60);
    agg.loadHistory(makeHistory(250, 60));

    tc::IndicatorEngine eng;
    eng.attach(agg);
    const auto& sma20 = eng.series(tc::IndicatorKind::Sma20);
    const auto& sma200 = eng.series(tc::IndicatorKind::Sma200);
    const auto& rsi = eng.series(tc::IndicatorKind::Rsi14);
    requireTrue(sma20.size() == 231, "250 candles -> 231 SMA20 points");
    requireTrue(sma200.size() == 51, "250 candles -> 51 SMA200 points");
    requireTrue(rsi.size() == 236, "250 candles -> 236 RSI points");
    requireTrue(sma20.front().time == 19 * 60, "SMA20 starts at candle 19");
    requireTrue(rsi.front().time == 14 * 60, "RSI starts at candle 14");
    requireTrue(sma20.back().time == 249 * 60, "last point at last candle");
    for (const auto& p : rsi) requireTrue(p.value >= 0.0 && p.value <= 100.0, "RSI in range");
    std::printf("  Test 1 (attach): PASS\n");
  }

  // --- Test 2: incremental ticks equal wholesale recompute ---
  {
    tc::CandleAggregator agg;
    agg.setInterval(60);
    agg.loadHistory(makeHistory(5, 60));

    tc::IndicatorEngine eng;
    eng.attach(agg);

    // Walk the series through every short-length edge (RSI warm-up at
    // 15/16 candles, SMA200 warm-up at 200).
    std::uint32_t seed = 7;
    double price = agg.last()->close;
    double ts = 5 * 60 * 1000.0;
    for (int i = 0; i < 2500; ++i) {
      seed = seed * 1103515245u + 12345u;
      double r = static_cast<double>((seed >> 16) & 0x7FFF) / 32768.0;
      price = std::fmax(1.0, price + (r - 0.5) * 3.0);
      ts += r * 15000.0;
      agg.applyTick(price, ts);

      if (i % 97 == 0 || i == 2499) {
        tc::IndicatorEngine fresh;
        fresh.recompute(agg.candles());
        for (tc::IndicatorKind k : tc::kAllIndicatorKinds) {
          requireSameSeries(eng.series(k), fresh.series(k), tc::toString(k));
        }
      }
    }
    requireTrue(agg.size() > 210, "walk long enough to warm up SMA200");
    requireTrue(!eng.series(tc::IndicatorKind::Sma200).empty(), "SMA200 populated");
    std::printf("  Test 2 (incremental == wholesale): PASS\n");
  }

  // --- Test 3: listener notifications ---
  {
    tc::CandleAggregator agg;
    agg.setInterval(60);
    agg.loadHistory(makeHistory(30, 60));

    tc::IndicatorEngine eng;
    int resets = 0, appended = 0, updated = 0;
    eng.setListener([&](tc::IndicatorKind, tc::IndicatorChange ch) {
      if (ch == tc::IndicatorChange::Reset) ++resets;
      if (ch == tc::IndicatorChange::TailAppended) ++appended;
      if (ch == tc::IndicatorChange::TailUpdated) ++updated;
    });
    eng.attach(agg);
    requireTrue(resets == 4, "attach resets all four series");

    double last = agg.last()->close;
    agg.applyTick(last + 1.0, 29 * 60 * 1000.0 + 5000.0);  // same bucket
    // SMA20 and RSI14 exist at 30 candles; SMA50/200 do not.
    requireTrue(updated == 2 && appended == 0, "in-bucket tick updates SMA20 + RSI");

    agg.applyTick(last + 2.0, 30 * 60 * 1000.0);           // new bucket
    requireTrue(appended == 2, "new bucket appends SMA20 + RSI");
    requireTrue(eng.series(tc::IndicatorKind::Sma20).back().time == 30 * 60, "tail time");

    agg.loadHistory(makeHistory(10, 60));
    requireTrue(resets == 8, "history reload resets");
    requireTrue(eng.series(tc::IndicatorKind::Sma20).empty(), "short history -> empty SMA20");
    requireTrue(eng.series(tc::IndicatorKind::Rsi14).empty(), "short history -> empty RSI");

    eng.detach();
    agg.loadHistory(makeHistory(30, 60));
    requireTrue(resets == 8, "detached engine hears nothing");
    std::printf("  Test 3 (listener): PASS\n");
  }

  // --- Test 4: kind names ---
  {
    for (tc::IndicatorKind k : tc::kAllIndicatorKinds) {
      tc::IndicatorKind parsed;
      requireTrue(tc::parseIndicatorKind(tc::toString(k), parsed) && parsed == k, "name round trip");
    }
    tc::IndicatorKind parsed;
    requireTrue(!tc::parseIndicatorKind("ema9", parsed), "unknown kind");
    requireTrue(tc::periodOf(tc::IndicatorKind::Sma200) == 200, "sma200 period");
    requireTrue(tc::periodOf(tc::IndicatorKind::Rsi14) == 14, "rsi period");
    std::printf("  Test 4 (kind names): PASS\n");
  }

  std::printf("\nD2.2 indicator engine: ALL PASS\n");
  return 0;
}
