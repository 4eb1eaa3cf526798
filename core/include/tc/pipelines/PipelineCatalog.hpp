#pragma once
#include "tc/scene/Geometry.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace tc {

struct PipelineSpec {
  std::string name;   // "triSolid"
  int version{1};     // 1
  VertexFormat requiredVertexFormat{VertexFormat::Pos2_Clip};
  std::uint32_t vertexCountMultiple{1};  // 3 for triangles, 2 for line segments
};

inline std::string pipelineKey(const std::string& name, int version) {
  return name + "@" + std::to_string(version);
}

class PipelineCatalog {
public:
  PipelineCatalog();

  const PipelineSpec* find(const std::string& key) const;

private:
  void add(const std::string& name, int version, VertexFormat fmt,
           std::uint32_t multiple);

  std::unordered_map<std::string, PipelineSpec> specs_;
};

} // namespace tc
