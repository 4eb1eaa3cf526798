#pragma once
#include <vector>

namespace tc {

// Simple moving average over `period` closes.
// Output has count - period + 1 values; value[k] is the mean of
// closes[k .. k+period-1]. Empty when count < period or period < 1.
std::vector<double> computeSMA(const double* closes, int count, int period);

// RSI with Wilder smoothing.
// Output has count - period values, aligned to closes[period .. count-1].
// Empty when count < period + 1 or period < 1. Never NaN.
std::vector<double> computeRSI(const double* closes, int count, int period = 14);

struct WilderAverages {
  double avgGain{0};
  double avgLoss{0};
};

// Seed from the first `period` deltas (closes[0..period]).
WilderAverages wilderSeed(const double* closes, int period);

// One smoothing step: avg = (avg*(period-1) + x) / period.
WilderAverages wilderStep(const WilderAverages& prev, double delta, int period);

// 100 when only gains, 50 when there was no movement at all.
double rsiFromAverages(const WilderAverages& avg);

} // namespace tc
