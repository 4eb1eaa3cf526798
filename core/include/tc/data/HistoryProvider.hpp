#pragma once
#include "tc/data/Candle.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tc {

struct HistoryRequest {
  std::uint64_t generation{0};  // echoed back; stale generations are discarded
  std::string symbol;
  std::string timeframe;
  std::uint32_t limit{1000};
};

struct HistoryResponse {
  std::uint64_t generation{0};
  bool ok{true};
  std::string error;
  std::vector<Candle> candles;  // time in epoch seconds, any order
};

using HistoryCallback = std::function<void(const HistoryResponse&)>;

// Historical fetch seam. `done` must be invoked on the engine's thread
// (synchronously from fetch() is allowed) exactly once per request.
class HistoryProvider {
public:
  virtual ~HistoryProvider() = default;
  virtual void fetch(const HistoryRequest& request, HistoryCallback done) = 0;
};

} // namespace tc
