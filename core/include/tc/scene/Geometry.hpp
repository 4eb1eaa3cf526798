#pragma once
#include "tc/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace tc {

enum class VertexFormat : std::uint8_t {
  Pos2_Clip = 1, // vec2 position, transformed to clip space by the item transform
  Candle6 = 2    // {x, open, high, low, close, halfWidth}, one record per candle
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return "pos2_clip";
    case VertexFormat::Candle6: return "candle6";
    default: return "unknown";
  }
}

inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2_clip") { out = VertexFormat::Pos2_Clip; return true; }
  if (s == "candle6") { out = VertexFormat::Candle6; return true; }
  return false;
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2_Clip};
  std::uint32_t vertexCount{0}; // vertices, or instances for Candle6
};

} // namespace tc
