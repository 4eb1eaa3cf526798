#pragma once
#include "tc/scene/Types.hpp"
#include <unordered_map>
#include <vector>

namespace tc {

// Tracks existence + kind for IDs (and generates IDs if the client doesn't provide one).
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);               // auto-id
  bool reserve(Id id, ResourceKind kind);       // client-provided id (fails if taken)

  bool exists(Id id) const;
  bool kindOf(Id id, ResourceKind& out) const;

  bool release(Id id);

  std::vector<Id> list(ResourceKind kind) const;
  std::size_t size() const { return kinds_.size(); }

private:
  Id next_{1u << 20};  // auto IDs stay clear of the deterministic recipe ranges
  std::unordered_map<Id, ResourceKind> kinds_;
};

} // namespace tc
