#include "tc/scene/ResourceRegistry.hpp"

namespace tc {

Id ResourceRegistry::allocate(ResourceKind kind) {
  for (;;) {
    Id id = next_++;
    if (id == kInvalidId) continue;
    if (kinds_.find(id) != kinds_.end()) continue;
    kinds_[id] = kind;
    return id;
  }
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  auto [it, inserted] = kinds_.emplace(id, kind);
  (void)it;
  return inserted;
}

bool ResourceRegistry::exists(Id id) const {
  return kinds_.find(id) != kinds_.end();
}

bool ResourceRegistry::kindOf(Id id, ResourceKind& out) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return false;
  out = it->second;
  return true;
}

bool ResourceRegistry::release(Id id) {
  return kinds_.erase(id) > 0;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  for (auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  return out;
}

} // namespace tc
