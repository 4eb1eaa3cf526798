#pragma once
#include "tc/ids/Id.hpp"
#include "tc/scene/Scene.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tc {

struct BufferWriteStats {
  std::uint64_t writes{0};        // setBufferData + append + updateRange calls
  std::uint64_t bytesWritten{0};
};

// CPU-side vertex bytes per buffer id. The host uploads dirty buffers to
// the GPU; this side only tracks contents and what changed.
class BufferStore {
public:
  const std::uint8_t* getBufferData(Id id) const;
  std::uint32_t getBufferSize(Id id) const;
  bool hasBuffer(Id id) const { return buffers_.find(id) != buffers_.end(); }

  void setBufferData(Id id, const void* data, std::uint32_t len);
  void append(Id id, const void* data, std::uint32_t len);

  // Overwrite [offset, offset+len). Fails if the range is past the end.
  bool updateRange(Id id, std::uint32_t offset, const void* data, std::uint32_t len);

  void remove(Id id);
  void clear();

  // Copy CPU sizes into Scene buffer byteLength.
  void syncBufferLengths(Scene& scene) const;

  // Dirty tracking for upload.
  const std::vector<Id>& dirtyBuffers() const { return dirty_; }
  void clearDirty() { dirty_.clear(); }

  const BufferWriteStats& stats() const { return stats_; }
  void resetStats() { stats_ = BufferWriteStats{}; }

private:
  void markDirty(Id id);

  std::unordered_map<Id, std::vector<std::uint8_t>> buffers_;
  std::vector<Id> dirty_;
  BufferWriteStats stats_;
};

} // namespace tc
