#pragma once
#include "tc/ids/Id.hpp"
#include "tc/scene/Geometry.hpp"
#include "tc/scene/Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Result of building a recipe: the commands to create/dispose it.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands; // applied in order to tear down
};

// Base class for all recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  // IDs of all DrawItems created by this recipe.
  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  // Deterministic ID: idBase_ + offset
  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }

  // buffer + geometry + drawItem + bind (+ attachTransform when transformId != 0),
  // with the matching deletes appended to disposeCommands.
  static void emitSeries(RecipeBuildResult& out, Id bufferId, Id geometryId,
                         Id drawItemId, Id layerId, const std::string& name,
                         VertexFormat format, const char* pipeline, Id transformId);
};

// ---- shared command builders ----

CmdString makeColorStyleCmd(Id drawItemId, const float rgba[4], float lineWidth);
CmdString makeUpDownStyleCmd(Id drawItemId, const float up[4], const float down[4]);
CmdString makeVisibleCmd(Id drawItemId, bool visible);
CmdString makeVertexCountCmd(Id geometryId, std::uint32_t vertexCount);
CmdString makeSetTransformCmd(Id transformId, const TransformParams& tp);

} // namespace tc
