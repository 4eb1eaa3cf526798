#include "tc/commands/CommandProcessor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace tc {

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

CmdResult CommandProcessor::created(Id id) {
  CmdResult r;
  r.ok = true;
  r.createdId = id;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) {
    Id id = 0;
    if (parseIdString(v->GetString(), id)) return id;
  }
  return 0;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  CmdResult r = dispatch(cmdV->GetString(), obj);
  if (r.ok) applied_++;
  return r;
}

CmdResult CommandProcessor::dispatch(const std::string& cmd, const rapidjson::Value& obj) {
  if (cmd == "createPane") return cmdCreatePane(obj);
  if (cmd == "createLayer") return cmdCreateLayer(obj);
  if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
  if (cmd == "delete") return cmdDelete(obj);

  if (cmd == "createBuffer") return cmdCreateBuffer(obj);
  if (cmd == "createGeometry") return cmdCreateGeometry(obj);
  if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);
  if (cmd == "setGeometryVertexCount") return cmdSetGeometryVertexCount(obj);

  if (cmd == "createTransform") return cmdCreateTransform(obj);
  if (cmd == "attachTransform") return cmdAttachTransform(obj);
  if (cmd == "setTransform") return cmdSetTransform(obj);

  if (cmd == "setDrawItemVisible") return cmdSetDrawItemVisible(obj);
  if (cmd == "setDrawItemStyle") return cmdSetDrawItemStyle(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

CmdResult CommandProcessor::claimId(const rapidjson::Value& obj, ResourceKind kind,
                                    const char* cmdName, Id& out) {
  Id id = getIdOrZero(obj, "id");
  if (id != 0) {
    if (!reg_.reserve(id, kind)) {
      return fail("ID_TAKEN", std::string(cmdName) + ": id already exists",
                  std::string(R"({"id":)") + std::to_string(id) + "}");
    }
  } else {
    id = reg_.allocate(kind);
  }
  out = id;
  return created(id);
}

// -------------------- scene graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::Pane, "createPane", id);
  if (!r.ok) return r;

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));
  return r;
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId",
                std::string(R"({"field":"paneId","paneId":)") + std::to_string(paneId) + "}");
  }

  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::Layer, "createLayer", id);
  if (!r.ok) return r;

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return r;
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId",
                std::string(R"({"field":"layerId","layerId":)") + std::to_string(layerId) + "}");
  }

  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::DrawItem, "createDrawItem", id);
  if (!r.ok) return r;

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  // pipeline + geometry bindings default empty/0; set by bindDrawItem
  scene_.addDrawItem(std::move(d));
  return r;
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  ResourceKind kind;
  if (!reg_.kindOf(id, kind)) {
    return fail("NOT_FOUND",
                "delete: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  std::vector<Id> deleted;
  switch (kind) {
    case ResourceKind::Pane:      deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:     deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem:  deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:    deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry:  deleted = scene_.deleteGeometry(id); break;
    case ResourceKind::Transform: deleted = scene_.deleteTransform(id); break;
  }

  if (deleted.empty()) {
    return fail("DELETE_FAILED",
                "delete: failed",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return created(0);
}

// -------------------- buffers / geometry --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::Buffer, "createBuffer", id);
  if (!r.ok) return r;

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(b);
  return r;
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER",
                "createGeometry: invalid vertexBufferId",
                std::string(R"({"field":"vertexBufferId","vertexBufferId":)") + std::to_string(vb) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2_Clip;
  const std::string fmtStr = getStringOrEmpty(obj, "format");
  if (!fmtStr.empty() && !parseVertexFormat(fmtStr, fmt)) {
    return fail("UNSUPPORTED_VERTEX_FORMAT",
                "createGeometry: unknown format",
                R"({"supported":["pos2_clip","candle6"]})");
  }

  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::Geometry, "createGeometry", id);
  if (!r.ok) return r;

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(g);
  return r;
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  if (drawItemId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing/invalid drawItemId");
  }

  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "bindDrawItem: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) {
    return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");
  }

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");
  }

  // Validate before mutating so a rejected bind leaves the item untouched.
  DrawItem candidate = *di;
  candidate.pipeline = pipeline;
  candidate.geometryId = geomId;
  CmdResult r = validateDrawItem(candidate);
  if (!r.ok) return r;

  di->pipeline = pipeline;
  di->geometryId = geomId;
  return r;
}

CmdResult CommandProcessor::validateVertexCount(const std::string& pipeline,
                                                std::uint32_t count) const {
  const PipelineSpec* spec = catalog_.find(pipeline);
  if (!spec) return created(0);
  if ((count % spec->vertexCountMultiple) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                pipeline + " requires vertexCount multiple of " +
                  std::to_string(spec->vertexCountMultiple),
                std::string(R"({"vertexCount":)") + std::to_string(count) + "}");
  }
  return created(0);
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = catalog_.find(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  if (di.geometryId == 0) {
    return fail("VALIDATION_MISSING_GEOMETRY",
                "drawItem must bind geometryId",
                std::string(R"({"drawItemId":)") + std::to_string(di.id) + "}");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY",
                "drawItem geometryId does not exist",
                std::string(R"({"geometryId":)") + std::to_string(di.geometryId) + "}");
  }

  if (!scene_.hasBuffer(g->vertexBufferId)) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                std::string(R"({"vertexBufferId":)") + std::to_string(g->vertexBufferId) + "}");
  }

  if (g->format != spec->requiredVertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->requiredVertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  return validateVertexCount(di.pipeline, g->vertexCount);
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = scene_.getGeometryMutable(geomId);
  if (!g) {
    return fail("NOT_FOUND",
                "setGeometryVertexCount: geometryId does not exist",
                std::string(R"({"geometryId":)") + std::to_string(geomId) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }
  const std::uint32_t count = vc->GetUint();

  // Every item drawing this geometry must still accept the new count.
  for (Id diId : scene_.drawItemIds()) {
    const DrawItem* di = scene_.getDrawItem(diId);
    if (di && di->geometryId == geomId) {
      CmdResult r = validateVertexCount(di->pipeline, count);
      if (!r.ok) return r;
    }
  }

  g->vertexCount = count;
  return created(0);
}

// -------------------- transforms --------------------

CmdResult CommandProcessor::cmdCreateTransform(const rapidjson::Value& obj) {
  Id id = 0;
  CmdResult r = claimId(obj, ResourceKind::Transform, "createTransform", id);
  if (!r.ok) return r;

  Transform t;
  t.id = id;
  scene_.addTransform(t);
  return r;
}

CmdResult CommandProcessor::cmdAttachTransform(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "attachTransform: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const Id transformId = getIdOrZero(obj, "transformId");
  if (transformId == 0 || !scene_.hasTransform(transformId)) {
    return fail("NOT_FOUND",
                "attachTransform: transformId does not exist",
                std::string(R"({"transformId":)") + std::to_string(transformId) + "}");
  }

  di->transformId = transformId;
  return created(0);
}

CmdResult CommandProcessor::cmdSetTransform(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  Transform* t = scene_.getTransformMutable(id);
  if (!t) {
    return fail("NOT_FOUND",
                "setTransform: transform does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  auto readF = [&](const char* key, float& out) {
    const auto* v = getMember(obj, key);
    if (v && v->IsNumber()) out = static_cast<float>(v->GetDouble());
  };
  readF("tx", t->params.tx);
  readF("ty", t->params.ty);
  readF("sx", t->params.sx);
  readF("sy", t->params.sy);
  return created(0);
}

// -------------------- draw item state --------------------

CmdResult CommandProcessor::cmdSetDrawItemVisible(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemVisible: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const auto* v = getMember(obj, "visible");
  if (!v || !v->IsBool()) {
    return fail("BAD_COMMAND", "setDrawItemVisible: missing bool visible");
  }
  di->visible = v->GetBool();
  return created(0);
}

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemStyle: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  // All fields optional; absent ones keep their current value.
  auto readF = [&](const char* key, float& out) {
    const auto* v = getMember(obj, key);
    if (v && v->IsNumber()) out = static_cast<float>(v->GetDouble());
  };
  readF("r", di->color[0]);
  readF("g", di->color[1]);
  readF("b", di->color[2]);
  readF("a", di->color[3]);
  readF("colorUpR", di->colorUp[0]);
  readF("colorUpG", di->colorUp[1]);
  readF("colorUpB", di->colorUp[2]);
  readF("colorUpA", di->colorUp[3]);
  readF("colorDownR", di->colorDown[0]);
  readF("colorDownG", di->colorDown[1]);
  readF("colorDownB", di->colorDown[2]);
  readF("colorDownA", di->colorDown[3]);
  readF("lineWidth", di->lineWidth);
  return created(0);
}

// -------------------- Query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeList = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeList("panes", ResourceKind::Pane);
  writeList("layers", ResourceKind::Layer);
  writeList("drawItems", ResourceKind::DrawItem);
  writeList("buffers", ResourceKind::Buffer);
  writeList("geometries", ResourceKind::Geometry);
  writeList("transforms", ResourceKind::Transform);
  w.EndObject();

  return sb.GetString();
}

} // namespace tc
