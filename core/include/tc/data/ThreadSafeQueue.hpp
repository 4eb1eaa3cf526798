#pragma once
#include <cstddef>
#include <mutex>
#include <queue>

namespace tc {

// Bounded MPSC hand-off between a feed thread and the engine thread.
// When full, the oldest item is dropped.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 256)
      : maxCap_(maxCapacity) {}

  // Returns false if an older item had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (queue_.size() >= maxCap_) {
      queue_.pop();
      ++droppedCount_;
      dropped = true;
    }
    queue_.push(std::move(item));
    return !dropped;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  std::size_t droppedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return droppedCount_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::queue<T> empty;
    queue_.swap(empty);
  }

private:
  mutable std::mutex mtx_;
  std::queue<T> queue_;
  std::size_t maxCap_;
  std::size_t droppedCount_{0};
};

} // namespace tc
