#include "tc/data/CandleAggregator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace tc {

CandleAggregator::CandleAggregator(const CandleAggregatorConfig& config)
  : config_(config) {}

ChartResult CandleAggregator::setInterval(std::int64_t seconds) {
  if (seconds <= 0) {
    return chartFail(ErrorCode::InvalidInterval,
                     "interval must be positive, got " + std::to_string(seconds));
  }
  interval_ = seconds;
  reset();
  return chartOk();
}

std::int64_t CandleAggregator::bucketStart(std::int64_t tsSeconds, std::int64_t interval) {
  std::int64_t q = tsSeconds / interval;
  if ((tsSeconds % interval != 0) && (tsSeconds < 0)) --q;
  return q * interval;
}

std::size_t CandleAggregator::loadHistory(const std::vector<Candle>& input) {
  std::vector<Candle> sorted;
  sorted.reserve(input.size());

  std::size_t dropped = 0;
  std::size_t snapped = 0;
  for (const auto& in : input) {
    if (!isFinite(in)) { ++dropped; continue; }
    Candle c = in;
    const std::int64_t bucket = bucketStart(c.time, interval_);
    if (bucket != c.time) {
      c.time = bucket;
      ++snapped;
    }
    // Providers occasionally report a close outside the high/low envelope.
    c.high = std::max({c.high, c.open, c.close});
    c.low = std::min({c.low, c.open, c.close});
    sorted.push_back(c);
  }
  if (dropped > 0) {
    std::fprintf(stderr, "[CandleAggregator] dropped %zu non-finite history entries\n",
                 dropped);
  }
  if (snapped > 0) {
    std::fprintf(stderr, "[CandleAggregator] snapped %zu history entries to %llds buckets\n",
                 snapped, static_cast<long long>(interval_));
  }

  // Stable sort keeps arrival order among equal times so the last-seen
  // entry for a bucket ends up last in its run.
  std::stable_sort(sorted.begin(), sorted.end(),
    [](const Candle& a, const Candle& b) { return a.time < b.time; });

  candles_.clear();
  candles_.reserve(sorted.size());
  for (const auto& c : sorted) {
    if (!candles_.empty() && candles_.back().time == c.time) {
      candles_.back() = c;
    } else {
      candles_.push_back(c);
    }
  }

  CandleEvent ev;
  ev.kind = CandleEventKind::HistoryLoaded;
  emit(ev);
  return candles_.size();
}

TickResult CandleAggregator::applyTick(double price, double timestampMillis) {
  TickResult result;

  if (!std::isfinite(price) || !std::isfinite(timestampMillis) ||
      std::fabs(timestampMillis) > kMaxTimestampMillis) {
    result.outcome = TickOutcome::Malformed;
    result.err.code = ErrorCode::MalformedTick;
    result.err.message = "non-finite or out-of-range price/timestamp";
    return result;
  }

  const auto tsSeconds = static_cast<std::int64_t>(std::floor(timestampMillis / 1000.0));
  const std::int64_t bucket = bucketStart(tsSeconds, interval_);

  if (candles_.empty()) {
    if (!config_.seedFromFirstTick) {
      result.outcome = TickOutcome::Ignored;
      result.err.code = ErrorCode::EmptySeries;
      result.err.message = "tick before history baseline";
      return result;
    }
    Candle c;
    c.time = bucket;
    c.open = c.high = c.low = c.close = price;
    c.volume = 0.0;
    candles_.push_back(c);

    result.outcome = TickOutcome::Seeded;
    CandleEvent ev;
    ev.kind = CandleEventKind::CandleAppended;
    ev.index = 0;
    ev.candle = c;
    emit(ev);
    return result;
  }

  Candle& lastCandle = candles_.back();

  if (bucket > lastCandle.time) {
    // Open from the previous close so consecutive candles have no visual gap.
    Candle c;
    c.time = bucket;
    c.open = lastCandle.close;
    c.high = std::max(c.open, price);
    c.low = std::min(c.open, price);
    c.close = price;
    c.volume = 0.0;
    candles_.push_back(c);

    result.outcome = TickOutcome::Appended;
    CandleEvent ev;
    ev.kind = CandleEventKind::CandleAppended;
    ev.index = candles_.size() - 1;
    ev.candle = c;
    emit(ev);
    return result;
  }

  if (bucket < lastCandle.time) {
    result.outcome = TickOutcome::Rejected;
    result.err.code = ErrorCode::OutOfOrderTick;
    result.err.message = "tick bucket " + std::to_string(bucket) +
                         " older than last candle " + std::to_string(lastCandle.time);
    return result;
  }

  // Same bucket. Volume is carried forward: ticks carry no trade size.
  lastCandle.high = std::max(lastCandle.high, price);
  lastCandle.low = std::min(lastCandle.low, price);
  lastCandle.close = price;

  result.outcome = TickOutcome::Updated;
  CandleEvent ev;
  ev.kind = CandleEventKind::CandleUpdated;
  ev.index = candles_.size() - 1;
  ev.candle = lastCandle;
  emit(ev);
  return result;
}

void CandleAggregator::reset() {
  candles_.clear();
  CandleEvent ev;
  ev.kind = CandleEventKind::HistoryLoaded;
  emit(ev);
}

CandleAggregator::ListenerId CandleAggregator::subscribe(Listener listener) {
  ListenerId id = nextListenerId_++;
  listeners_.push_back({id, std::move(listener)});
  return id;
}

void CandleAggregator::unsubscribe(ListenerId id) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [id](const ListenerSlot& s) { return s.id == id; }),
    listeners_.end());
}

void CandleAggregator::emit(const CandleEvent& ev) {
  // A listener may subscribe further listeners while we iterate.
  for (std::size_t i = 0; i < listeners_.size(); ++i) {
    Listener fn = listeners_[i].fn;
    if (fn) fn(ev);
  }
}

} // namespace tc
