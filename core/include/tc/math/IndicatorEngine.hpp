#pragma once
#include "tc/data/CandleAggregator.hpp"
#include "tc/math/Indicators.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tc {

enum class IndicatorKind : std::uint8_t {
  Sma20 = 0,
  Sma50,
  Sma200,
  Rsi14
};

inline constexpr std::size_t kIndicatorKindCount = 4;

inline constexpr IndicatorKind kAllIndicatorKinds[kIndicatorKindCount] = {
  IndicatorKind::Sma20, IndicatorKind::Sma50, IndicatorKind::Sma200, IndicatorKind::Rsi14
};

int periodOf(IndicatorKind kind);
const char* toString(IndicatorKind kind);
bool parseIndicatorKind(const std::string& s, IndicatorKind& out);

struct IndicatorPoint {
  std::int64_t time{0};
  double value{0};
};

enum class IndicatorChange : std::uint8_t {
  Reset,         // series recomputed wholesale
  TailUpdated,   // last point value changed
  TailAppended   // one point appended
};

// Keeps SMA-20/50/200 and RSI-14 in step with a CandleAggregator.
// History loads recompute every series; ticks touch only the tail. The
// incremental path matches a wholesale recompute within rounding.
class IndicatorEngine {
public:
  using Listener = std::function<void(IndicatorKind, IndicatorChange)>;

  IndicatorEngine() = default;
  ~IndicatorEngine();

  IndicatorEngine(const IndicatorEngine&) = delete;
  IndicatorEngine& operator=(const IndicatorEngine&) = delete;

  // Subscribes to `agg` and recomputes from its current candles.
  void attach(CandleAggregator& agg);
  void detach();

  void setListener(Listener listener) { listener_ = std::move(listener); }

  const std::vector<IndicatorPoint>& series(IndicatorKind kind) const {
    return series_[static_cast<std::size_t>(kind)];
  }

  // Wholesale recompute from an explicit candle sequence.
  void recompute(const std::vector<Candle>& candles);

private:
  void onEvent(const CandleEvent& ev);
  void onTail(const std::vector<Candle>& candles, bool appended);

  void smaTail(IndicatorKind kind, const std::vector<Candle>& candles, bool appended);
  void rsiTail(const std::vector<Candle>& candles, bool appended);
  void rebuildRsi(const std::vector<Candle>& candles);

  void notify(IndicatorKind kind, IndicatorChange change);

  CandleAggregator* agg_{nullptr};
  CandleAggregator::ListenerId listenerId_{0};
  Listener listener_;

  std::array<std::vector<IndicatorPoint>, kIndicatorKindCount> series_;

  // Wilder state: rsiPrev_ covers deltas up to the second-to-last candle,
  // rsiTip_ additionally includes the last candle.
  WilderAverages rsiPrev_;
  WilderAverages rsiTip_;
  bool rsiHavePrev_{false};
};

} // namespace tc
