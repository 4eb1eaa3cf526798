#include "tc/session/ChartEngine.hpp"

#include "tc/data/Interval.hpp"
#include "tc/data/TickMessage.hpp"
#include "tc/session/ChartState.hpp"
#include "tc/style/Theme.hpp"

#include <cstdio>

namespace tc {

ChartEngine::ChartEngine(const ChartEngineConfig& config, HistoryProvider* history,
                         TickSource* feed)
  : config_(config),
    history_(history),
    feed_(feed),
    symbol_(config.symbol),
    timeframe_(config.timeframe),
    renderer_(config.renderer),
    aggregator_(config.aggregator) {
  IntervalResult ir = resolveInterval(timeframe_);
  if (ir.ok) {
    aggregator_.setInterval(ir.seconds);
    renderer_.setInterval(ir.seconds);
  } else {
    std::fprintf(stderr, "[ChartEngine] %s\n", ir.err.message.c_str());
  }

  // The renderer sees candle events before the indicator engine does, so
  // overlays are always placed against the current time axis.
  rendererListener_ = aggregator_.subscribe(
      [this](const CandleEvent& ev) { onCandleEvent(ev); });
  indicators_.setListener(
      [this](IndicatorKind kind, IndicatorChange change) { onIndicatorChange(kind, change); });
  indicators_.attach(aggregator_);
}

ChartEngine::~ChartEngine() {
  stop();
  indicators_.detach();
  aggregator_.unsubscribe(rendererListener_);
}

ChartResult ChartEngine::start() {
  if (started_) return chartOk();

  IntervalResult ir = resolveInterval(timeframe_);
  if (!ir.ok) return chartFail(ir.err.code, ir.err.message);

  ChartResult r = renderer_.createSurface();
  if (!r.ok) return r;

  started_ = true;
  reload();
  return chartOk();
}

void ChartEngine::stop() {
  if (!started_) return;
  if (feed_) feed_->unsubscribe();
  renderer_.destroySurface();
  started_ = false;
}

// -------------------- command surface --------------------

ChartResult ChartEngine::setSymbol(const std::string& symbol) {
  if (symbol.empty()) {
    return chartFail(ErrorCode::InvalidArgument, "setSymbol: empty symbol");
  }
  symbol_ = symbol;
  reload();
  return chartOk();
}

ChartResult ChartEngine::setTimeframe(const std::string& timeframe) {
  IntervalResult ir = resolveInterval(timeframe);
  if (!ir.ok) {
    std::fprintf(stderr, "[ChartEngine] setTimeframe rejected: %s\n", ir.err.message.c_str());
    return chartFail(ir.err.code, ir.err.message);
  }

  timeframe_ = timeframe;
  if (ir.seconds != aggregator_.intervalSeconds()) {
    renderer_.setInterval(ir.seconds);
    aggregator_.setInterval(ir.seconds);
  }
  reload();
  return chartOk();
}

ChartResult ChartEngine::setChartType(ChartType type) {
  return renderer_.setChartType(type);
}

void ChartEngine::setIndicatorVisibility(IndicatorKind kind, bool visible) {
  renderer_.setOverlayVisible(kind, visible);
}

void ChartEngine::setToolState(DrawingTool tool) {
  interaction_.setTool(tool);
}

void ChartEngine::clearAnnotations() {
  interaction_.clearAll(store_);
  syncAnnotations();
}

ChartResult ChartEngine::removeAnnotation(std::uint32_t id) {
  if (!store_.remove(id)) {
    return chartFail(ErrorCode::NotFound, "no annotation " + std::to_string(id));
  }
  syncAnnotations();
  return chartOk();
}

std::uint32_t ChartEngine::onClick(double px, double py) {
  std::uint32_t id = interaction_.onClick(px, py, renderer_, store_);
  if (id != 0) syncAnnotations();
  return id;
}

void ChartEngine::onPointerDown(double px, double py) {
  interaction_.onPointerDown(px, py, renderer_);
}

void ChartEngine::onPointerMove(double px, double py) {
  interaction_.onPointerMove(px, py, renderer_);
}

std::uint32_t ChartEngine::onPointerUp(double px, double py) {
  std::uint32_t id = interaction_.onPointerUp(px, py, renderer_, store_);
  if (id != 0) syncAnnotations();
  return id;
}

ChartResult ChartEngine::setTheme(const std::string& name) {
  Theme theme;
  if (!themeByName(name, theme)) {
    return chartFail(ErrorCode::InvalidArgument, "unknown theme: " + name);
  }
  renderer_.setTheme(theme);
  store_.setDefaultColor(theme.annotationColor);
  return chartOk();
}

// -------------------- data --------------------

std::size_t ChartEngine::pumpFeed() {
  if (!feed_) return 0;

  std::size_t handled = 0;
  std::string msg;
  while (config_.maxMessagesPerPump == 0 || handled < config_.maxMessagesPerPump) {
    if (!feed_->poll(msg)) break;
    // Failures are logged and counted in stats_.
    handleTickMessage(msg);
    ++handled;
  }
  return handled;
}

ChartResult ChartEngine::handleTickMessage(const std::string& json) {
  Tick tick;
  ChartResult pr = parseTickMessage(json, tick);
  if (!pr.ok) {
    ++stats_.ticksMalformed;
    std::fprintf(stderr, "[ChartEngine] dropped tick: %s\n", pr.err.message.c_str());
    return pr;
  }

  lastPrice_ = tick.price;
  if (priceCb_) {
    PriceCallback cb = priceCb_;
    cb(tick.price);
  }

  TickResult tr = aggregator_.applyTick(tick.price, tick.timestampMillis);
  if (!tr.accepted()) {
    switch (tr.outcome) {
      case TickOutcome::Rejected:  ++stats_.ticksRejected; break;
      case TickOutcome::Malformed: ++stats_.ticksMalformed; break;
      default:                     ++stats_.ticksIgnored; break;
    }
    std::fprintf(stderr, "[ChartEngine] dropped tick (%s): %s\n",
                 toString(tr.err.code), tr.err.message.c_str());
    return chartFail(tr.err.code, tr.err.message);
  }

  ++stats_.ticksAccepted;
  return chartOk();
}

ChartResult ChartEngine::deliverHistory(const HistoryResponse& response) {
  if (response.generation != generation_) {
    ++stats_.staleHistory;
    std::fprintf(stderr, "[ChartEngine] discarded stale history (generation %llu, current %llu)\n",
                 static_cast<unsigned long long>(response.generation),
                 static_cast<unsigned long long>(generation_));
    return chartFail(ErrorCode::StaleRequest, "history superseded by a newer request");
  }

  historyPending_ = false;
  if (!response.ok) {
    std::fprintf(stderr, "[ChartEngine] history fetch failed for %s %s: %s\n",
                 symbol_.c_str(), timeframe_.c_str(), response.error.c_str());
    return chartFail(ErrorCode::HistoryUnavailable, response.error);
  }

  std::size_t n = aggregator_.loadHistory(response.candles);
  if (n == 0) {
    return chartFail(ErrorCode::EmptySeries, "history contained no usable candles");
  }
  return chartOk();
}

ChartResult ChartEngine::deliverHistoryJson(std::uint64_t generation, const std::string& json) {
  HistoryResponse response;
  response.generation = generation;
  ChartResult pr = parseHistoryJson(json, response.candles);
  if (!pr.ok) {
    response.ok = false;
    response.error = pr.err.message;
  }
  return deliverHistory(response);
}

void ChartEngine::reload() {
  if (!started_) return;

  if (feed_) feed_->unsubscribe();
  ++generation_;
  aggregator_.reset();
  requestHistory();
  if (feed_) feed_->subscribe(symbol_);
}

void ChartEngine::requestHistory() {
  if (!history_) {
    historyPending_ = false;
    return;
  }

  HistoryRequest req;
  req.generation = generation_;
  req.symbol = symbol_;
  req.timeframe = timeframe_;
  req.limit = config_.historyLimit;

  historyPending_ = true;
  std::weak_ptr<bool> alive = alive_;
  history_->fetch(req, [this, alive](const HistoryResponse& response) {
    if (alive.expired()) return;
    // Outcome is logged inside deliverHistory.
    deliverHistory(response);
  });
}

void ChartEngine::onCandleEvent(const CandleEvent& ev) {
  switch (ev.kind) {
    case CandleEventKind::HistoryLoaded:
      renderer_.setData(aggregator_.candles());
      break;
    case CandleEventKind::CandleAppended:
    case CandleEventKind::CandleUpdated: {
      ChartResult r = renderer_.update(ev.candle);
      if (!r.ok) {
        std::fprintf(stderr, "[ChartEngine] renderer update failed: %s\n", r.err.message.c_str());
      }
      break;
    }
  }
}

void ChartEngine::onIndicatorChange(IndicatorKind kind, IndicatorChange change) {
  const auto& series = indicators_.series(kind);
  if (change == IndicatorChange::Reset || series.empty()) {
    renderer_.setIndicatorData(kind, series);
  } else {
    renderer_.updateIndicatorTail(kind, series.back());
  }
}

void ChartEngine::syncAnnotations() {
  renderer_.setAnnotations(store_);
}

// -------------------- persistence --------------------

std::string ChartEngine::saveState() const {
  ChartState st;
  st.symbol = symbol_;
  st.timeframe = timeframe_;
  st.chartType = toString(renderer_.chartType());
  st.sma20 = renderer_.overlayVisible(IndicatorKind::Sma20);
  st.sma50 = renderer_.overlayVisible(IndicatorKind::Sma50);
  st.sma200 = renderer_.overlayVisible(IndicatorKind::Sma200);
  st.rsi14 = renderer_.overlayVisible(IndicatorKind::Rsi14);
  st.themeName = renderer_.theme().name;
  st.visibleBars = renderer_.visibleBars();
  st.annotationsJSON = store_.toJSON();
  return serializeChartState(st);
}

ChartResult ChartEngine::restoreState(const std::string& json) {
  ChartState st;
  st.symbol = symbol_;
  st.timeframe = timeframe_;
  st.chartType = toString(renderer_.chartType());
  st.themeName = renderer_.theme().name;
  st.visibleBars = renderer_.visibleBars();
  if (!deserializeChartState(json, st)) {
    return chartFail(ErrorCode::InvalidArgument, "restoreState: malformed JSON");
  }

  // Validate everything before touching the chart.
  ChartType type;
  if (!parseChartType(st.chartType, type)) {
    return chartFail(ErrorCode::InvalidArgument, "restoreState: unknown chart type " + st.chartType);
  }
  Theme theme;
  if (!themeByName(st.themeName, theme)) {
    return chartFail(ErrorCode::InvalidArgument, "restoreState: unknown theme " + st.themeName);
  }
  IntervalResult ir = resolveInterval(st.timeframe);
  if (!ir.ok) return chartFail(ir.err.code, ir.err.message);
  if (st.symbol.empty()) {
    return chartFail(ErrorCode::InvalidArgument, "restoreState: empty symbol");
  }
  AnnotationStore restored;
  if (!st.annotationsJSON.empty() && !restored.loadJSON(st.annotationsJSON)) {
    return chartFail(ErrorCode::InvalidArgument, "restoreState: malformed annotations");
  }

  renderer_.setTheme(theme);
  store_.setDefaultColor(theme.annotationColor);
  renderer_.setOverlayVisible(IndicatorKind::Sma20, st.sma20);
  renderer_.setOverlayVisible(IndicatorKind::Sma50, st.sma50);
  renderer_.setOverlayVisible(IndicatorKind::Sma200, st.sma200);
  renderer_.setOverlayVisible(IndicatorKind::Rsi14, st.rsi14);
  renderer_.setVisibleBars(st.visibleBars);
  ChartResult tr = renderer_.setChartType(type);
  if (!tr.ok) return tr;

  store_.adopt(std::move(restored));
  interaction_.setTool(DrawingTool::Cursor);
  syncAnnotations();

  if (st.symbol != symbol_ || st.timeframe != timeframe_) {
    symbol_ = st.symbol;
    timeframe_ = st.timeframe;
    if (ir.seconds != aggregator_.intervalSeconds()) {
      renderer_.setInterval(ir.seconds);
      aggregator_.setInterval(ir.seconds);
    }
    reload();
  }
  return chartOk();
}

} // namespace tc
