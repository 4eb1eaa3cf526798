#pragma once
#include "tc/scene/Geometry.hpp"
#include "tc/scene/Types.hpp"
#include <unordered_map>
#include <vector>

namespace tc {

// Persistent scene state: Pane -> Layer -> DrawItem, plus the buffers,
// geometries and transforms draw items bind to.
class Scene {
public:
  bool hasPane(Id id) const;
  bool hasLayer(Id id) const;
  bool hasDrawItem(Id id) const;
  bool hasBuffer(Id id) const;
  bool hasGeometry(Id id) const;
  bool hasTransform(Id id) const;

  const Pane*      getPane(Id id) const;
  const Layer*     getLayer(Id id) const;
  const DrawItem*  getDrawItem(Id id) const;
  const Buffer*    getBuffer(Id id) const;
  const Geometry*  getGeometry(Id id) const;
  const Transform* getTransform(Id id) const;

  DrawItem*  getDrawItemMutable(Id id);
  Buffer*    getBufferMutable(Id id);
  Geometry*  getGeometryMutable(Id id);
  Transform* getTransformMutable(Id id);

  // Create (caller ensures IDs are unique / valid in registry)
  void addPane(Pane p);
  void addLayer(Layer l);
  void addDrawItem(DrawItem d);
  void addBuffer(Buffer b);
  void addGeometry(Geometry g);
  void addTransform(Transform t);

  // Delete (cascades) - returns full list of deleted IDs (empty if nothing deleted).
  // - deletePane => {paneId, layerIds..., drawItemIds...}
  // - deleteLayer => {layerId, drawItemIds...}
  std::vector<Id> deletePane(Id paneId);
  std::vector<Id> deleteLayer(Id layerId);
  std::vector<Id> deleteDrawItem(Id drawItemId);
  std::vector<Id> deleteBuffer(Id bufferId);
  std::vector<Id> deleteGeometry(Id geometryId);
  std::vector<Id> deleteTransform(Id transformId);

  std::vector<Id> paneIds() const;
  std::vector<Id> layerIds() const;
  std::vector<Id> drawItemIds() const;

private:
  std::unordered_map<Id, Pane> panes_;
  std::unordered_map<Id, Layer> layers_;
  std::unordered_map<Id, DrawItem> drawItems_;
  std::unordered_map<Id, Buffer> buffers_;
  std::unordered_map<Id, Geometry> geometries_;
  std::unordered_map<Id, Transform> transforms_;
};

} // namespace tc
