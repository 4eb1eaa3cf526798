#include "tc/recipe/Recipe.hpp"

#include <cstdio>
#include <string>

namespace tc {

void Recipe::emitSeries(RecipeBuildResult& out, Id bufferId, Id geometryId,
                        Id drawItemId, Id layerId, const std::string& name,
                        VertexFormat format, const char* pipeline, Id transformId) {
  auto idStr = [](Id id) { return std::to_string(id); };

  out.createCommands.push_back(
    R"({"cmd":"createBuffer","id":)" + idStr(bufferId) + R"(,"byteLength":0})");

  out.createCommands.push_back(
    R"({"cmd":"createGeometry","id":)" + idStr(geometryId) +
    R"(,"vertexBufferId":)" + idStr(bufferId) +
    R"(,"format":")" + toString(format) + R"(","vertexCount":0})");

  out.createCommands.push_back(
    R"({"cmd":"createDrawItem","id":)" + idStr(drawItemId) +
    R"(,"layerId":)" + idStr(layerId) +
    R"(,"name":")" + name + R"("})");

  out.createCommands.push_back(
    R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(drawItemId) +
    R"(,"pipeline":")" + pipeline + R"(","geometryId":)" + idStr(geometryId) + "}");

  if (transformId != 0) {
    out.createCommands.push_back(
      R"({"cmd":"attachTransform","drawItemId":)" + idStr(drawItemId) +
      R"(,"transformId":)" + idStr(transformId) + "}");
  }

  out.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(drawItemId) + "}");
  out.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(geometryId) + "}");
  out.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(bufferId) + "}");
}

CmdString makeColorStyleCmd(Id drawItemId, const float c[4], float lineWidth) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%llu,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g,"lineWidth":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(c[0]), static_cast<double>(c[1]),
    static_cast<double>(c[2]), static_cast<double>(c[3]),
    static_cast<double>(lineWidth));
  return buf;
}

CmdString makeUpDownStyleCmd(Id drawItemId, const float up[4], const float down[4]) {
  char buf[512];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%llu,)"
    R"("colorUpR":%.9g,"colorUpG":%.9g,"colorUpB":%.9g,"colorUpA":%.9g,)"
    R"("colorDownR":%.9g,"colorDownG":%.9g,"colorDownB":%.9g,"colorDownA":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(up[0]), static_cast<double>(up[1]),
    static_cast<double>(up[2]), static_cast<double>(up[3]),
    static_cast<double>(down[0]), static_cast<double>(down[1]),
    static_cast<double>(down[2]), static_cast<double>(down[3]));
  return buf;
}

CmdString makeVisibleCmd(Id drawItemId, bool visible) {
  return R"({"cmd":"setDrawItemVisible","drawItemId":)" + std::to_string(drawItemId) +
         R"(,"visible":)" + (visible ? "true" : "false") + "}";
}

CmdString makeVertexCountCmd(Id geometryId, std::uint32_t vertexCount) {
  return R"({"cmd":"setGeometryVertexCount","geometryId":)" + std::to_string(geometryId) +
         R"(,"vertexCount":)" + std::to_string(vertexCount) + "}";
}

CmdString makeSetTransformCmd(Id transformId, const TransformParams& tp) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setTransform","id":%llu,"tx":%.9g,"ty":%.9g,"sx":%.9g,"sy":%.9g})",
    static_cast<unsigned long long>(transformId),
    static_cast<double>(tp.tx), static_cast<double>(tp.ty),
    static_cast<double>(tp.sx), static_cast<double>(tp.sy));
  return buf;
}

} // namespace tc
