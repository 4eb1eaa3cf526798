#pragma once
#include <string>

namespace tc {

// Serializable chart configuration. Restoring it rebuilds the chart but not
// its data: candles come back from the history provider.
struct ChartState {
  std::string version{"1.0"};

  std::string symbol;        // e.g. "BTC/USD"
  std::string timeframe;     // e.g. "1h"
  std::string chartType{"candlestick"};

  // Indicator visibility, keyed the way the overlays are named.
  bool sma20{true};
  bool sma50{true};
  bool sma200{true};
  bool rsi14{false};

  std::string themeName;     // "Dark" or "Light"
  int visibleBars{120};

  std::string annotationsJSON;  // AnnotationStore::toJSON() output
};

// Serialize ChartState to a JSON string.
std::string serializeChartState(const ChartState& state);

// Deserialize a JSON string into ChartState. Missing members keep the
// values already in `out`. Returns false on error.
bool deserializeChartState(const std::string& json, ChartState& out);

} // namespace tc
