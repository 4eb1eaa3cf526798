#pragma once
#include "tc/core/ChartResult.hpp"
#include "tc/data/Candle.hpp"
#include "tc/data/Interval.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace tc {

enum class CandleEventKind : std::uint8_t {
  HistoryLoaded,   // series replaced wholesale (also emitted on reset)
  CandleAppended,  // new trailing candle at `index`
  CandleUpdated    // trailing candle at `index` amended in place
};

struct CandleEvent {
  CandleEventKind kind{CandleEventKind::HistoryLoaded};
  std::size_t index{0};  // unused for HistoryLoaded
  Candle candle{};       // copy of the affected candle (unused for HistoryLoaded)
};

enum class TickOutcome : std::uint8_t {
  Appended,
  Updated,
  Seeded,     // first candle created from a tick (seedFromFirstTick only)
  Ignored,    // empty series, no baseline
  Rejected,   // bucket older than the last candle
  Malformed
};

struct TickResult {
  TickOutcome outcome{TickOutcome::Ignored};
  ChartError err{};

  bool accepted() const {
    return outcome == TickOutcome::Appended ||
           outcome == TickOutcome::Updated ||
           outcome == TickOutcome::Seeded;
  }
};

struct CandleAggregatorConfig {
  // When false (default) a tick arriving before any history is dropped.
  bool seedFromFirstTick{false};
};

// Ordered, deduplicated OHLCV sequence for one (symbol, timeframe) pair.
// Candle times are strictly increasing multiples of the interval; applyTick
// never rewrites history older than the trailing candle and never shrinks
// the series.
class CandleAggregator {
public:
  using Listener = std::function<void(const CandleEvent&)>;
  using ListenerId = std::uint32_t;

  explicit CandleAggregator(const CandleAggregatorConfig& config = {});

  // Changing the interval clears the series. Fails (state unchanged) on
  // seconds <= 0.
  ChartResult setInterval(std::int64_t seconds);
  std::int64_t intervalSeconds() const { return interval_; }

  const CandleAggregatorConfig& config() const { return config_; }

  // Replace the series from possibly unsorted, possibly duplicated input.
  // Entries are snapped to their bucket start and high/low widened to cover
  // open and close. Duplicate times (after snapping) keep the last-seen
  // entry; non-finite entries are dropped.
  // Returns the resulting candle count.
  std::size_t loadHistory(const std::vector<Candle>& candles);

  TickResult applyTick(double price, double timestampMillis);

  // Full symbol/timeframe reset.
  void reset();

  ListenerId subscribe(Listener listener);
  void unsubscribe(ListenerId id);

  const std::vector<Candle>& candles() const { return candles_; }
  std::size_t size() const { return candles_.size(); }
  bool empty() const { return candles_.empty(); }
  const Candle* last() const { return candles_.empty() ? nullptr : &candles_.back(); }

  // floor(tsSeconds / interval) * interval, rounding toward -inf.
  static std::int64_t bucketStart(std::int64_t tsSeconds, std::int64_t interval);

private:
  void emit(const CandleEvent& ev);

  CandleAggregatorConfig config_;
  std::int64_t interval_{kSecondsPerHour};
  std::vector<Candle> candles_;

  struct ListenerSlot {
    ListenerId id;
    Listener fn;
  };
  std::vector<ListenerSlot> listeners_;
  ListenerId nextListenerId_{1};
};

} // namespace tc
