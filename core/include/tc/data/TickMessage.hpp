#pragma once
#include "tc/core/ChartResult.hpp"
#include "tc/data/Candle.hpp"

#include <string>
#include <vector>

namespace tc {

// One live price update, normalized from the transport.
struct Tick {
  double price{0};
  double timestampMillis{0};
};

// Accepted shapes:
//   {"price": 101.5, "timestampMillis": 1700000000000}
//   {"type": "update", "data": {"last": 101.5, "timestamp": 1700000000000}}
// where "data" may also be a JSON-encoded string, "last" is an alias for
// "price" (and wins when both are present) and "timestamp" for
// "timestampMillis". Anything else fails with
// ErrorCode::MalformedTick.
ChartResult parseTickMessage(const std::string& json, Tick& out);

// Historical fetch payload: {"candles": [...]} or a bare array of
// {time (epoch millis), open, high, low, close, volume}. Times are converted
// to epoch seconds. Entries missing OHLC fields are skipped; volume defaults
// to 0. Order and duplicates are left for CandleAggregator::loadHistory.
ChartResult parseHistoryJson(const std::string& json, std::vector<Candle>& out);

} // namespace tc
