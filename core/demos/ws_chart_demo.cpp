// WebSocket chart demo
// Subscribes a ChartEngine to a live price channel and prints every tick.
// The chart seeds its first candle from the feed (no history provider).
//
// Usage: tc_ws_demo [symbol] [baseUrl] [seconds]

#include "tc/data/WebSocketTickSource.hpp"
#include "tc/session/ChartEngine.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

int main(int argc, char** argv) {
  std::string symbol = (argc > 1) ? argv[1] : "BTC/USD";
  tc::WebSocketTickSourceConfig wsCfg;
  if (argc > 2) wsCfg.baseUrl = argv[2];
  int seconds = (argc > 3) ? std::atoi(argv[3]) : 30;

  tc::WebSocketTickSource feed(wsCfg);

  tc::ChartEngineConfig cfg;
  cfg.symbol = symbol;
  cfg.timeframe = "1m";
  cfg.aggregator.seedFromFirstTick = true;

  tc::ChartEngine engine(cfg, nullptr, &feed);
  engine.onPriceUpdate([&engine](double price) {
    std::printf("  %s %.4f (%zu candles)\n", engine.symbol().c_str(), price,
                engine.aggregator().size());
  });

  tc::ChartResult r = engine.start();
  if (!r.ok) {
    std::fprintf(stderr, "start failed: %s\n", r.err.message.c_str());
    return 1;
  }
  std::printf("Listening on %s for %ds\n",
              tc::WebSocketTickSource::buildUrl(wsCfg.baseUrl, symbol).c_str(), seconds);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (std::chrono::steady_clock::now() < deadline) {
    engine.pumpFeed();
    std::this_thread::sleep_for(std::chrono::milliseconds(16));
  }

  if (feed.status() != tc::WebSocketTickSource::Status::connected) {
    std::fprintf(stderr, "feed not connected at exit\n");
  }
  engine.stop();
  return 0;
}
