#include "tc/math/IndicatorEngine.hpp"

namespace tc {

int periodOf(IndicatorKind kind) {
  switch (kind) {
    case IndicatorKind::Sma20:  return 20;
    case IndicatorKind::Sma50:  return 50;
    case IndicatorKind::Sma200: return 200;
    case IndicatorKind::Rsi14:  return 14;
  }
  return 0;
}

const char* toString(IndicatorKind kind) {
  switch (kind) {
    case IndicatorKind::Sma20:  return "sma20";
    case IndicatorKind::Sma50:  return "sma50";
    case IndicatorKind::Sma200: return "sma200";
    case IndicatorKind::Rsi14:  return "rsi14";
  }
  return "unknown";
}

bool parseIndicatorKind(const std::string& s, IndicatorKind& out) {
  for (IndicatorKind k : kAllIndicatorKinds) {
    if (s == toString(k)) { out = k; return true; }
  }
  return false;
}

IndicatorEngine::~IndicatorEngine() {
  detach();
}

void IndicatorEngine::attach(CandleAggregator& agg) {
  detach();
  agg_ = &agg;
  listenerId_ = agg.subscribe([this](const CandleEvent& ev) { onEvent(ev); });
  recompute(agg.candles());
}

void IndicatorEngine::detach() {
  if (agg_) {
    agg_->unsubscribe(listenerId_);
    agg_ = nullptr;
    listenerId_ = 0;
  }
}

void IndicatorEngine::onEvent(const CandleEvent& ev) {
  if (!agg_) return;
  switch (ev.kind) {
    case CandleEventKind::HistoryLoaded:
      recompute(agg_->candles());
      break;
    case CandleEventKind::CandleAppended:
      onTail(agg_->candles(), true);
      break;
    case CandleEventKind::CandleUpdated:
      onTail(agg_->candles(), false);
      break;
  }
}

static std::vector<double> closesOf(const std::vector<Candle>& candles) {
  std::vector<double> closes;
  closes.reserve(candles.size());
  for (const auto& c : candles) closes.push_back(c.close);
  return closes;
}

void IndicatorEngine::recompute(const std::vector<Candle>& candles) {
  std::vector<double> closes = closesOf(candles);
  int count = static_cast<int>(closes.size());

  for (IndicatorKind kind : {IndicatorKind::Sma20, IndicatorKind::Sma50, IndicatorKind::Sma200}) {
    int period = periodOf(kind);
    std::vector<double> values = computeSMA(closes.data(), count, period);
    auto& out = series_[static_cast<std::size_t>(kind)];
    out.clear();
    out.reserve(values.size());
    for (std::size_t k = 0; k < values.size(); k++) {
      out.push_back({candles[k + static_cast<std::size_t>(period) - 1].time, values[k]});
    }
    notify(kind, IndicatorChange::Reset);
  }

  rebuildRsi(candles);
  notify(IndicatorKind::Rsi14, IndicatorChange::Reset);
}

void IndicatorEngine::rebuildRsi(const std::vector<Candle>& candles) {
  const int period = periodOf(IndicatorKind::Rsi14);
  auto& out = series_[static_cast<std::size_t>(IndicatorKind::Rsi14)];
  out.clear();
  rsiHavePrev_ = false;
  rsiPrev_ = WilderAverages{};
  rsiTip_ = WilderAverages{};

  int count = static_cast<int>(candles.size());
  if (count < period + 1) return;

  std::vector<double> closes = closesOf(candles);
  out.reserve(static_cast<std::size_t>(count - period));

  // Same recurrence as computeRSI, keeping the last two states.
  WilderAverages avg = wilderSeed(closes.data(), period);
  out.push_back({candles[static_cast<std::size_t>(period)].time, rsiFromAverages(avg)});
  for (int i = period + 1; i < count; i++) {
    rsiPrev_ = avg;
    rsiHavePrev_ = true;
    avg = wilderStep(avg, closes[i] - closes[i - 1], period);
    out.push_back({candles[static_cast<std::size_t>(i)].time, rsiFromAverages(avg)});
  }
  rsiTip_ = avg;
}

void IndicatorEngine::onTail(const std::vector<Candle>& candles, bool appended) {
  smaTail(IndicatorKind::Sma20, candles, appended);
  smaTail(IndicatorKind::Sma50, candles, appended);
  smaTail(IndicatorKind::Sma200, candles, appended);
  rsiTail(candles, appended);
}

void IndicatorEngine::smaTail(IndicatorKind kind, const std::vector<Candle>& candles,
                              bool appended) {
  const std::size_t period = static_cast<std::size_t>(periodOf(kind));
  const std::size_t count = candles.size();
  if (count < period) return;

  double sum = 0.0;
  for (std::size_t i = count - period; i < count; i++) sum += candles[i].close;
  IndicatorPoint p{candles.back().time, sum / static_cast<double>(period)};

  auto& out = series_[static_cast<std::size_t>(kind)];
  if (appended || out.empty()) {
    out.push_back(p);
    notify(kind, IndicatorChange::TailAppended);
  } else {
    out.back() = p;
    notify(kind, IndicatorChange::TailUpdated);
  }
}

void IndicatorEngine::rsiTail(const std::vector<Candle>& candles, bool appended) {
  const int period = periodOf(IndicatorKind::Rsi14);
  const int count = static_cast<int>(candles.size());
  if (count < period + 1) return;

  auto& out = series_[static_cast<std::size_t>(IndicatorKind::Rsi14)];

  // Too short for a committed previous state: recompute (at most 16 closes).
  if (count < period + 2 || (!appended && !rsiHavePrev_)) {
    std::size_t before = out.size();
    rebuildRsi(candles);
    notify(IndicatorKind::Rsi14, out.size() > before ? IndicatorChange::TailAppended
                                                     : IndicatorChange::TailUpdated);
    return;
  }

  const double delta = candles[static_cast<std::size_t>(count - 1)].close -
                       candles[static_cast<std::size_t>(count - 2)].close;
  if (appended) {
    rsiPrev_ = rsiTip_;
    rsiHavePrev_ = true;
  }
  rsiTip_ = wilderStep(rsiPrev_, delta, period);
  IndicatorPoint p{candles.back().time, rsiFromAverages(rsiTip_)};

  if (appended) {
    out.push_back(p);
    notify(IndicatorKind::Rsi14, IndicatorChange::TailAppended);
  } else {
    out.back() = p;
    notify(IndicatorKind::Rsi14, IndicatorChange::TailUpdated);
  }
}

void IndicatorEngine::notify(IndicatorKind kind, IndicatorChange change) {
  if (listener_) listener_(kind, change);
}

} // namespace tc
