#pragma once
#include "tc/data/ThreadSafeQueue.hpp"
#include "tc/data/TickSource.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace tc {

struct WebSocketTickSourceConfig {
  // The symbol (with '/' removed) is appended: ws://.../market/BTCUSD
  std::string baseUrl{"ws://localhost:8000/api/v1/ws/market/"};
  int reconnectIntervalMs{3000};
  std::size_t maxQueueSize{1024};
};

// Live price feed over a WebSocket text channel (easywsclient). A background
// thread receives messages and queues them; the engine drains with poll().
class WebSocketTickSource : public TickSource {
public:
  explicit WebSocketTickSource(const WebSocketTickSourceConfig& config = {});
  ~WebSocketTickSource() override;

  void subscribe(const std::string& symbol) override;
  void unsubscribe() override;
  bool poll(std::string& message) override;
  bool isRunning() const override;

  enum class Status { disconnected, connecting, connected, error };
  Status status() const;

  // baseUrl + symbol with every '/' stripped.
  static std::string buildUrl(const std::string& baseUrl, const std::string& symbol);

private:
  void receiveLoop(std::string url);
  void waitReconnect();

  WebSocketTickSourceConfig config_;
  ThreadSafeQueue<std::string> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<Status> status_{Status::disconnected};
};

} // namespace tc
