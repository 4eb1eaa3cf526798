#pragma once
#include "tc/ids/Id.hpp"
#include "tc/pipelines/PipelineCatalog.hpp"
#include "tc/scene/ResourceRegistry.hpp"
#include "tc/scene/Scene.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace tc {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// The only writer of Scene structure. Every mutation arrives as a JSON
// command object ({"cmd": "...", ...}) so recipes and tests share one path.
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // {"panes":[...],"layers":[...],...} for logging / tests.
  std::string listResourcesJson() const;

  std::uint64_t appliedCount() const { return applied_; }

private:
  Scene& scene_;
  ResourceRegistry& reg_;
  PipelineCatalog catalog_;
  std::uint64_t applied_{0};

  CmdResult dispatch(const std::string& cmd, const rapidjson::Value& obj);

  // ---- handlers ----
  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);

  CmdResult cmdCreateTransform(const rapidjson::Value& obj);
  CmdResult cmdAttachTransform(const rapidjson::Value& obj);
  CmdResult cmdSetTransform(const rapidjson::Value& obj);

  CmdResult cmdSetDrawItemVisible(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult created(Id id);

  CmdResult claimId(const rapidjson::Value& obj, ResourceKind kind,
                    const char* cmdName, Id& out);
  CmdResult validateDrawItem(const DrawItem& di) const;
  CmdResult validateVertexCount(const std::string& pipeline, std::uint32_t count) const;
};

} // namespace tc
