#include "tc/data/WebSocketTickSource.hpp"
#include <easywsclient/easywsclient.hpp>

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

namespace tc {

WebSocketTickSource::WebSocketTickSource(const WebSocketTickSourceConfig& config)
    : config_(config), queue_(config.maxQueueSize) {}

WebSocketTickSource::~WebSocketTickSource() { unsubscribe(); }

std::string WebSocketTickSource::buildUrl(const std::string& baseUrl,
                                          const std::string& symbol) {
  std::string url = baseUrl;
  for (char c : symbol) {
    if (c != '/') url.push_back(c);
  }
  return url;
}

void WebSocketTickSource::subscribe(const std::string& symbol) {
  unsubscribe();
  running_.store(true);
  status_.store(Status::connecting);
  thread_ = std::thread(&WebSocketTickSource::receiveLoop, this,
                        buildUrl(config_.baseUrl, symbol));
}

void WebSocketTickSource::unsubscribe() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
  queue_.clear();
  status_.store(Status::disconnected);
}

bool WebSocketTickSource::poll(std::string& message) {
  return queue_.pop(message);
}

bool WebSocketTickSource::isRunning() const { return running_.load(); }

WebSocketTickSource::Status WebSocketTickSource::status() const {
  return status_.load();
}

void WebSocketTickSource::waitReconnect() {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.reconnectIntervalMs);
  while (running_.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

void WebSocketTickSource::receiveLoop(std::string url) {
  while (running_.load()) {
    status_.store(Status::connecting);
    std::fprintf(stderr, "[WebSocketTickSource] connecting to %s\n", url.c_str());

    std::unique_ptr<easywsclient::WebSocket> ws(
        easywsclient::WebSocket::from_url(url));

    if (!ws || ws->getReadyState() == easywsclient::WebSocket::CLOSED) {
      std::fprintf(stderr,
                   "[WebSocketTickSource] connection failed, retrying in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(Status::error);
      waitReconnect();
      continue;
    }

    status_.store(Status::connected);
    std::fprintf(stderr, "[WebSocketTickSource] connected\n");

    while (running_.load() &&
           ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      ws->poll(10);
      ws->dispatch([this](const std::string& msg) {
        if (!queue_.push(msg)) {
          std::fprintf(stderr, "[WebSocketTickSource] queue full, dropped oldest\n");
        }
      });
    }

    if (ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      ws->close();
      ws->poll(0);
    }

    if (running_.load()) {
      std::fprintf(stderr,
                   "[WebSocketTickSource] disconnected, reconnecting in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(Status::error);
      waitReconnect();
    }
  }

  status_.store(Status::disconnected);
}

} // namespace tc
