#pragma once
#include "tc/ids/Id.hpp"
#include <string>

namespace tc {

enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry,
  Transform
};

inline const char* toString(ResourceKind k) {
  switch (k) {
    case ResourceKind::Pane: return "pane";
    case ResourceKind::Layer: return "layer";
    case ResourceKind::DrawItem: return "drawItem";
    case ResourceKind::Buffer: return "buffer";
    case ResourceKind::Geometry: return "geometry";
    case ResourceKind::Transform: return "transform";
    default: return "unknown";
  }
}

// Affine data -> clip mapping: clip = data * s + t.
struct TransformParams {
  float tx{0.0f};
  float ty{0.0f};
  float sx{1.0f};
  float sy{1.0f};
};

struct Transform {
  Id id{0};
  TransformParams params;
};

struct Pane {
  Id id{0};
  std::string name;
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  // bindings for pipeline execution
  std::string pipeline;  // e.g. "triSolid@1"
  Id geometryId{0};      // must refer to a Geometry resource
  Id transformId{0};     // 0 = identity

  bool visible{true};

  // style
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float colorUp[4] = {0.0f, 0.8f, 0.4f, 1.0f};    // instancedCandle@1 only
  float colorDown[4] = {0.9f, 0.2f, 0.2f, 1.0f};  // instancedCandle@1 only
  float lineWidth{1.0f};
};

} // namespace tc
