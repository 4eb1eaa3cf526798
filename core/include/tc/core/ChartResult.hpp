#pragma once
#include <cstdint>
#include <string>

namespace tc {

// Failure taxonomy shared by the aggregation, indicator and session layers.
// None of these are fatal: every failure degrades to "no visible update".
enum class ErrorCode : std::uint8_t {
  None = 0,
  InvalidInterval,    // unparseable timeframe token or non-positive duration
  MalformedTick,      // missing / non-finite price or timestamp
  StaleRequest,       // history result superseded by a newer request
  EmptySeries,        // operation needs at least one candle
  OutOfOrderTick,     // tick bucket older than the last candle
  InvalidArgument,
  NotFound,
  HistoryUnavailable  // provider reported a failed fetch
};

inline const char* toString(ErrorCode c) {
  switch (c) {
    case ErrorCode::None:               return "NONE";
    case ErrorCode::InvalidInterval:    return "INVALID_INTERVAL";
    case ErrorCode::MalformedTick:      return "MALFORMED_TICK";
    case ErrorCode::StaleRequest:       return "STALE_REQUEST";
    case ErrorCode::EmptySeries:        return "EMPTY_SERIES";
    case ErrorCode::OutOfOrderTick:     return "OUT_OF_ORDER_TICK";
    case ErrorCode::InvalidArgument:    return "INVALID_ARGUMENT";
    case ErrorCode::NotFound:           return "NOT_FOUND";
    case ErrorCode::HistoryUnavailable: return "HISTORY_UNAVAILABLE";
    default: return "UNKNOWN";
  }
}

struct ChartError {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

struct ChartResult {
  bool ok{true};
  ChartError err{};
};

inline ChartResult chartOk() {
  return ChartResult{};
}

inline ChartResult chartFail(ErrorCode code, std::string message) {
  ChartResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = std::move(message);
  return r;
}

} // namespace tc
