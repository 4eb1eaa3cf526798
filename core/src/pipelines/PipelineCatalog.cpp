#include "tc/pipelines/PipelineCatalog.hpp"

namespace tc {

PipelineCatalog::PipelineCatalog() {
  add("triSolid", 1, VertexFormat::Pos2_Clip, 3);         // area fills, volume bars
  add("line2d", 1, VertexFormat::Pos2_Clip, 2);           // segment list
  add("instancedCandle", 1, VertexFormat::Candle6, 1);    // one instance per candle
}

void PipelineCatalog::add(const std::string& name, int version, VertexFormat fmt,
                          std::uint32_t multiple) {
  PipelineSpec spec;
  spec.name = name;
  spec.version = version;
  spec.requiredVertexFormat = fmt;
  spec.vertexCountMultiple = multiple;
  specs_.emplace(pipelineKey(name, version), std::move(spec));
}

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  auto it = specs_.find(key);
  return it == specs_.end() ? nullptr : &it->second;
}

} // namespace tc
