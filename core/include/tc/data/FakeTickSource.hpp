#pragma once
#include "tc/data/ThreadSafeQueue.hpp"
#include "tc/data/TickSource.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace tc {

struct FakeTickSourceConfig {
  int tickIntervalMs{250};          // wall-clock delay between messages
  double startPrice{100.0};
  double volatility{0.5};           // max absolute step per tick
  std::uint32_t seed{42};
  // Simulated clock. startTimeMillis == 0 stamps ticks with the wall clock;
  // otherwise each message advances it by stepMillis.
  double startTimeMillis{0};
  double stepMillis{1000};
  std::size_t maxQueueSize{1024};
};

// Random-walk tick generator producing the same JSON messages as the live
// backend ({"symbol", "price", "timestampMillis"}).
class FakeTickSource : public TickSource {
public:
  explicit FakeTickSource(const FakeTickSourceConfig& config = {});
  ~FakeTickSource() override;

  void subscribe(const std::string& symbol) override;
  void unsubscribe() override;
  bool poll(std::string& message) override;
  bool isRunning() const override;

  // Produces the next message synchronously (what the producer thread
  // pushes). Deterministic for a given seed and simulated clock.
  std::string nextMessage();

  double lastPrice() const;
  // Messages discarded because the consumer fell behind maxQueueSize.
  std::size_t droppedCount() const { return queue_.droppedCount(); }

private:
  void producerLoop();
  double nextRandom();

  FakeTickSourceConfig config_;
  ThreadSafeQueue<std::string> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex stateMtx_;
  std::string symbol_;
  std::uint32_t seed_;
  double price_;
  double clockMillis_;
};

} // namespace tc
