#pragma once
#include "tc/core/ChartResult.hpp"
#include "tc/data/CandleAggregator.hpp"
#include "tc/data/HistoryProvider.hpp"
#include "tc/data/TickSource.hpp"
#include "tc/drawing/AnnotationStore.hpp"
#include "tc/drawing/DrawingInteraction.hpp"
#include "tc/math/IndicatorEngine.hpp"
#include "tc/render/SeriesRenderer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tc {

struct ChartEngineConfig {
  std::string symbol{"BTC/USD"};
  std::string timeframe{"1h"};
  std::uint32_t historyLimit{1000};
  // Upper bound on messages handled per pumpFeed() call. 0 = drain all.
  std::size_t maxMessagesPerPump{0};
  CandleAggregatorConfig aggregator;
  SeriesRendererConfig renderer;
};

struct ChartEngineStats {
  std::uint64_t ticksAccepted{0};
  std::uint64_t ticksMalformed{0};
  std::uint64_t ticksRejected{0};   // out of order
  std::uint64_t ticksIgnored{0};    // no history yet
  std::uint64_t staleHistory{0};
};

// One chart instance: owns the aggregator, indicator engine, renderer,
// annotation store and drawing tool, and wires them together.
//
//   TickSource --pumpFeed--> CandleAggregator --events--> SeriesRenderer
//                                     |                         ^
//                                     +--> IndicatorEngine -----+
//
// Everything runs on the caller's thread. Only the tick source may own a
// background thread; its messages are drained by pumpFeed().
class ChartEngine {
public:
  using PriceCallback = std::function<void(double price)>;

  // `history` and `feed` may be null (no fetch / no live feed). Both must
  // outlive the engine.
  ChartEngine(const ChartEngineConfig& config, HistoryProvider* history,
              TickSource* feed);
  ~ChartEngine();

  ChartEngine(const ChartEngine&) = delete;
  ChartEngine& operator=(const ChartEngine&) = delete;

  // Creates the surface, requests history and subscribes the feed.
  ChartResult start();
  // Unsubscribes the feed and destroys the surface. Data is kept.
  void stop();
  bool started() const { return started_; }

  // ---- command surface ----
  ChartResult setSymbol(const std::string& symbol);
  // Invalid tokens fail with InvalidInterval and keep the current timeframe.
  ChartResult setTimeframe(const std::string& timeframe);
  ChartResult setChartType(ChartType type);
  void setIndicatorVisibility(IndicatorKind kind, bool visible);
  void setToolState(DrawingTool tool);
  void setPendingText(const std::string& text) { interaction_.setPendingText(text); }
  void clearAnnotations();
  ChartResult removeAnnotation(std::uint32_t id);
  // Fires for every well-formed tick, even while history is pending or
  // after a failed fetch left the series empty.
  void onPriceUpdate(PriceCallback cb) { priceCb_ = std::move(cb); }

  // Pointer input in surface pixels. Return the created annotation id or 0.
  std::uint32_t onClick(double px, double py);
  void onPointerDown(double px, double py);
  void onPointerMove(double px, double py);
  std::uint32_t onPointerUp(double px, double py);

  void setPixelSize(int width, int height) { renderer_.setPixelSize(width, height); }
  // "dark" / "light"
  ChartResult setTheme(const std::string& name);

  // ---- data ----
  // Drains the tick source in arrival order. Returns messages handled.
  std::size_t pumpFeed();
  ChartResult handleTickMessage(const std::string& json);

  // History completion. Results for anything but the latest request fail
  // with StaleRequest and leave the chart untouched.
  ChartResult deliverHistory(const HistoryResponse& response);
  // Same, from the raw REST payload.
  ChartResult deliverHistoryJson(std::uint64_t generation, const std::string& json);

  // ---- persistence ----
  std::string saveState() const;
  // Applies symbol, timeframe, chart type, overlays, theme, visible bars and
  // annotations. Returns InvalidArgument on malformed input (nothing applied).
  ChartResult restoreState(const std::string& json);

  // ---- accessors ----
  const std::string& symbol() const { return symbol_; }
  const std::string& timeframe() const { return timeframe_; }
  std::uint64_t generation() const { return generation_; }
  bool historyPending() const { return historyPending_; }
  double lastPrice() const { return lastPrice_; }
  const ChartEngineStats& stats() const { return stats_; }

  const CandleAggregator& aggregator() const { return aggregator_; }
  const IndicatorEngine& indicators() const { return indicators_; }
  SeriesRenderer& renderer() { return renderer_; }
  const SeriesRenderer& renderer() const { return renderer_; }
  const AnnotationStore& annotations() const { return store_; }
  const DrawingInteraction& interaction() const { return interaction_; }

private:
  void onCandleEvent(const CandleEvent& ev);
  void onIndicatorChange(IndicatorKind kind, IndicatorChange change);

  // Unsubscribe, bump generation, clear data, fetch, resubscribe.
  void reload();
  void requestHistory();
  void syncAnnotations();

  ChartEngineConfig config_;
  HistoryProvider* history_{nullptr};
  TickSource* feed_{nullptr};

  std::string symbol_;
  std::string timeframe_;

  // Declaration order matters: the indicator engine detaches from the
  // aggregator on destruction.
  SeriesRenderer renderer_;
  CandleAggregator aggregator_;
  IndicatorEngine indicators_;
  CandleAggregator::ListenerId rendererListener_{0};

  AnnotationStore store_;
  DrawingInteraction interaction_;

  PriceCallback priceCb_;
  double lastPrice_{0};

  std::uint64_t generation_{0};
  bool historyPending_{false};
  bool started_{false};
  ChartEngineStats stats_;

  // History callbacks hold a weak reference; a fetch completing after the
  // engine is gone is dropped.
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

} // namespace tc
