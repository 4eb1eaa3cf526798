#include "tc/data/FakeTickSource.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace tc {

FakeTickSource::FakeTickSource(const FakeTickSourceConfig& config)
    : config_(config), queue_(config.maxQueueSize), seed_(config.seed),
      price_(config.startPrice), clockMillis_(config.startTimeMillis) {}

FakeTickSource::~FakeTickSource() { unsubscribe(); }

void FakeTickSource::subscribe(const std::string& symbol) {
  unsubscribe();
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    symbol_ = symbol;
  }
  running_.store(true);
  thread_ = std::thread(&FakeTickSource::producerLoop, this);
}

void FakeTickSource::unsubscribe() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
  queue_.clear();
}

bool FakeTickSource::poll(std::string& message) {
  return queue_.pop(message);
}

bool FakeTickSource::isRunning() const { return running_.load(); }

double FakeTickSource::lastPrice() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return price_;
}

double FakeTickSource::nextRandom() {
  // LCG, uniform in [0, 1]
  seed_ = seed_ * 1103515245u + 12345u;
  return static_cast<double>((seed_ >> 16) & 0x7FFF) / 32767.0;
}

std::string FakeTickSource::nextMessage() {
  std::lock_guard<std::mutex> lock(stateMtx_);

  double step = (nextRandom() - 0.5) * config_.volatility * 2.0;
  price_ = std::max(0.01, price_ + step);

  double ts;
  if (config_.startTimeMillis == 0) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    ts = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  } else {
    clockMillis_ += config_.stepMillis;
    ts = clockMillis_;
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("symbol");          w.String(symbol_.c_str());
  w.Key("price");           w.Double(price_);
  w.Key("timestampMillis"); w.Double(ts);
  w.EndObject();
  return sb.GetString();
}

void FakeTickSource::producerLoop() {
  using Clock = std::chrono::steady_clock;
  auto nextTick = Clock::now();

  while (running_.load()) {
    queue_.push(nextMessage());
    nextTick += std::chrono::milliseconds(config_.tickIntervalMs);
    std::this_thread::sleep_until(nextTick);
  }
}

} // namespace tc
