// D2.1 - SMA / RSI math test (pure C++)
// Tests: output lengths and alignment, constant series, monotonic RSI,
// zero-division policy, known values.

#include "tc/math/Indicators.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

int main() {
  // --- Test 1: SMA basics ---
  {
    double closes[] = {1, 2, 3, 4, 5, 6};
    std::vector<double> sma = tc::computeSMA(closes, 6, 3);
    requireTrue(sma.size() == 4, "6 closes, period 3 -> 4 values");
    requireClose(sma[0], 2.0, 1e-12, "mean(1,2,3)");
    requireClose(sma[3], 5.0, 1e-12, "mean(4,5,6)");

    requireTrue(tc::computeSMA(closes, 2, 3).empty(), "too short -> empty");
    requireTrue(tc::computeSMA(closes, 6, 0).empty(), "period 0 -> empty");
    requireTrue(tc::computeSMA(closes, 3, 3).size() == 1, "exactly period -> 1 value");
    std::printf("  Test 1 (SMA basics): PASS\n");
  }

  // --- Test 2: SMA of a constant series is the constant ---
  {
    std::vector<double> closes(300, 42.5);
    for (int period : {20, 50, 200}) {
      std::vector<double> sma = tc::computeSMA(closes.data(), 300, period);
      requireTrue(sma.size() == static_cast<std::size_t>(300 - period + 1), "length");
      for (double v : sma) requireClose(v, 42.5, 1e-9, "constant SMA");
    }
    std::printf("  Test 2 (constant SMA): PASS\n");
  }

  // --- Test 3: RSI on monotonic and flat series ---
  {
    std::vector<double> up, down, flat;
    for (int i = 0; i < 40; ++i) {
      up.push_back(100.0 + i);
      down.push_back(100.0 - i);
      flat.push_back(7.0);
    }
    std::vector<double> rUp = tc::computeRSI(up.data(), 40, 14);
    std::vector<double> rDown = tc::computeRSI(down.data(), 40, 14);
    std::vector<double> rFlat = tc::computeRSI(flat.data(), 40, 14);
    requireTrue(rUp.size() == 26, "40 closes -> 26 RSI values");
    for (double v : rUp) requireClose(v, 100.0, 1e-9, "rising -> 100");
    for (double v : rDown) requireClose(v, 0.0, 1e-9, "falling -> 0");
    for (double v : rFlat) requireClose(v, 50.0, 1e-9, "flat -> 50");

    requireTrue(tc::computeRSI(up.data(), 14, 14).empty(), "needs period+1 closes");
    requireTrue(tc::computeRSI(up.data(), 15, 14).size() == 1, "period+1 -> 1 value");
    std::printf("  Test 3 (RSI extremes): PASS\n");
  }

  // --- Test 4: RSI known value, alternating series ---
  {
    // +1, -1 alternating: seed over 14 deltas has 7 gains and 7 losses.
    std::vector<double> closes;
    for (int i = 0; i < 15; ++i) closes.push_back((i % 2 == 0) ? 10.0 : 11.0);
    std::vector<double> rsi = tc::computeRSI(closes.data(), 15, 14);
    requireTrue(rsi.size() == 1, "one value");
    requireClose(rsi[0], 50.0, 1e-9, "balanced -> 50");

    // Two gains of 2, one loss of 1 over period 3: RS = (4/3)/(1/3) = 4 -> 80.
    double c2[] = {10, 12, 14, 13};
    std::vector<double> r2 = tc::computeRSI(c2, 4, 3);
    requireClose(r2[0], 80.0, 1e-9, "RS 4 -> 80");
    std::printf("  Test 4 (RSI known values): PASS\n");
  }

  // --- Test 5: Wilder step and zero-division policy ---
  {
    tc::WilderAverages a{2.0, 1.0};
    tc::WilderAverages b = tc::wilderStep(a, 3.0, 14);
    requireClose(b.avgGain, (2.0 * 13 + 3.0) / 14, 1e-12, "gain step");
    requireClose(b.avgLoss, 13.0 / 14, 1e-12, "loss step");

    requireClose(tc::rsiFromAverages({0.0, 0.0}), 50.0, 0.0, "no movement -> 50");
    requireClose(tc::rsiFromAverages({1.0, 0.0}), 100.0, 0.0, "only gains -> 100");
    requireClose(tc::rsiFromAverages({0.0, 1.0}), 0.0, 0.0, "only losses -> 0");
    std::printf("  Test 5 (Wilder step): PASS\n");
  }

  std::printf("\nD2.1 indicators: ALL PASS\n");
  return 0;
}
