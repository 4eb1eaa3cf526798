#pragma once
#include <string>

namespace tc {

// Live feed adapter seam. Implementations deliver raw transport messages;
// the engine normalizes them with parseTickMessage().
class TickSource {
public:
  virtual ~TickSource() = default;

  // Start (or restart) delivery for `symbol`. Any previous subscription is
  // torn down first.
  virtual void subscribe(const std::string& symbol) = 0;

  // Stop delivery and drop every message still queued from the old
  // subscription.
  virtual void unsubscribe() = 0;

  // Non-blocking: pops the oldest pending message.
  virtual bool poll(std::string& message) = 0;

  virtual bool isRunning() const = 0;
};

} // namespace tc
