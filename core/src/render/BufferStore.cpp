#include "tc/render/BufferStore.hpp"

#include <algorithm>
#include <cstring>

namespace tc {

const std::uint8_t* BufferStore::getBufferData(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return nullptr;
  return it->second.data();
}

std::uint32_t BufferStore::getBufferSize(Id id) const {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return 0;
  return static_cast<std::uint32_t>(it->second.size());
}

void BufferStore::setBufferData(Id id, const void* data, std::uint32_t len) {
  auto& buf = buffers_[id];
  const auto* p = static_cast<const std::uint8_t*>(data);
  buf.assign(p, p + len);
  stats_.writes++;
  stats_.bytesWritten += len;
  markDirty(id);
}

void BufferStore::append(Id id, const void* data, std::uint32_t len) {
  auto& buf = buffers_[id];
  const auto* p = static_cast<const std::uint8_t*>(data);
  buf.insert(buf.end(), p, p + len);
  stats_.writes++;
  stats_.bytesWritten += len;
  markDirty(id);
}

bool BufferStore::updateRange(Id id, std::uint32_t offset, const void* data,
                              std::uint32_t len) {
  auto it = buffers_.find(id);
  if (it == buffers_.end()) return false;
  auto& buf = it->second;
  if (static_cast<std::uint64_t>(offset) + len > buf.size()) return false;
  std::memcpy(buf.data() + offset, data, len);
  stats_.writes++;
  stats_.bytesWritten += len;
  markDirty(id);
  return true;
}

void BufferStore::remove(Id id) {
  buffers_.erase(id);
  dirty_.erase(std::remove(dirty_.begin(), dirty_.end(), id), dirty_.end());
}

void BufferStore::clear() {
  buffers_.clear();
  dirty_.clear();
}

void BufferStore::syncBufferLengths(Scene& scene) const {
  for (auto& [id, buf] : buffers_) {
    Buffer* b = scene.getBufferMutable(id);
    if (b) {
      b->byteLength = static_cast<std::uint32_t>(buf.size());
    }
  }
}

void BufferStore::markDirty(Id id) {
  if (std::find(dirty_.begin(), dirty_.end(), id) == dirty_.end()) {
    dirty_.push_back(id);
  }
}

} // namespace tc
