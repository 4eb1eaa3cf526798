#include "tc/math/Indicators.hpp"

namespace tc {

std::vector<double> computeSMA(const double* closes, int count, int period) {
  std::vector<double> out;
  if (period < 1 || count < period) return out;
  out.reserve(static_cast<std::size_t>(count - period + 1));

  double sum = 0.0;
  for (int i = 0; i < period; i++) sum += closes[i];
  out.push_back(sum / period);

  for (int i = period; i < count; i++) {
    sum += closes[i] - closes[i - period];
    out.push_back(sum / period);
  }
  return out;
}

WilderAverages wilderSeed(const double* closes, int period) {
  WilderAverages avg;
  for (int i = 1; i <= period; i++) {
    double change = closes[i] - closes[i - 1];
    if (change > 0) avg.avgGain += change;
    else avg.avgLoss -= change;
  }
  avg.avgGain /= period;
  avg.avgLoss /= period;
  return avg;
}

WilderAverages wilderStep(const WilderAverages& prev, double delta, int period) {
  double gain = (delta > 0) ? delta : 0.0;
  double loss = (delta < 0) ? -delta : 0.0;
  WilderAverages next;
  next.avgGain = (prev.avgGain * (period - 1) + gain) / period;
  next.avgLoss = (prev.avgLoss * (period - 1) + loss) / period;
  return next;
}

double rsiFromAverages(const WilderAverages& avg) {
  if (avg.avgLoss == 0.0) {
    return (avg.avgGain == 0.0) ? 50.0 : 100.0;
  }
  double rs = avg.avgGain / avg.avgLoss;
  return 100.0 - 100.0 / (1.0 + rs);
}

std::vector<double> computeRSI(const double* closes, int count, int period) {
  std::vector<double> out;
  if (period < 1 || count < period + 1) return out;
  out.reserve(static_cast<std::size_t>(count - period));

  WilderAverages avg = wilderSeed(closes, period);
  out.push_back(rsiFromAverages(avg));

  for (int i = period + 1; i < count; i++) {
    avg = wilderStep(avg, closes[i] - closes[i - 1], period);
    out.push_back(rsiFromAverages(avg));
  }
  return out;
}

} // namespace tc
