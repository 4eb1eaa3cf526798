#include "tc/scene/Scene.hpp"

namespace tc {

template <typename Map>
static auto findIn(Map& m, Id id) -> decltype(&m.begin()->second) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

bool Scene::hasPane(Id id) const      { return panes_.find(id) != panes_.end(); }
bool Scene::hasLayer(Id id) const     { return layers_.find(id) != layers_.end(); }
bool Scene::hasDrawItem(Id id) const  { return drawItems_.find(id) != drawItems_.end(); }
bool Scene::hasBuffer(Id id) const    { return buffers_.find(id) != buffers_.end(); }
bool Scene::hasGeometry(Id id) const  { return geometries_.find(id) != geometries_.end(); }
bool Scene::hasTransform(Id id) const { return transforms_.find(id) != transforms_.end(); }

const Pane*      Scene::getPane(Id id) const      { return findIn(panes_, id); }
const Layer*     Scene::getLayer(Id id) const     { return findIn(layers_, id); }
const DrawItem*  Scene::getDrawItem(Id id) const  { return findIn(drawItems_, id); }
const Buffer*    Scene::getBuffer(Id id) const    { return findIn(buffers_, id); }
const Geometry*  Scene::getGeometry(Id id) const  { return findIn(geometries_, id); }
const Transform* Scene::getTransform(Id id) const { return findIn(transforms_, id); }

DrawItem*  Scene::getDrawItemMutable(Id id)  { return findIn(drawItems_, id); }
Buffer*    Scene::getBufferMutable(Id id)    { return findIn(buffers_, id); }
Geometry*  Scene::getGeometryMutable(Id id)  { return findIn(geometries_, id); }
Transform* Scene::getTransformMutable(Id id) { return findIn(transforms_, id); }

void Scene::addPane(Pane p)           { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)         { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d)   { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)       { buffers_[b.id] = b; }
void Scene::addGeometry(Geometry g)   { geometries_[g.id] = g; }
void Scene::addTransform(Transform t) { transforms_[t.id] = t; }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  if (drawItems_.erase(drawItemId) == 0) return {};
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  auto it = layers_.find(layerId);
  if (it == layers_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  // cascade delete draw items
  std::vector<Id> toDelete;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) toDelete.push_back(kv.first);
  }
  for (Id id : toDelete) {
    drawItems_.erase(id);
    deleted.push_back(id);
  }

  layers_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  auto it = panes_.find(paneId);
  if (it == panes_.end()) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  std::vector<Id> layersToDelete;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) layersToDelete.push_back(kv.first);
  }
  for (Id lid : layersToDelete) {
    auto layerDeleted = deleteLayer(lid);
    deleted.insert(deleted.end(), layerDeleted.begin(), layerDeleted.end());
  }

  panes_.erase(it);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  if (buffers_.erase(bufferId) == 0) return {};
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  if (geometries_.erase(geometryId) == 0) return {};
  return {geometryId};
}

std::vector<Id> Scene::deleteTransform(Id transformId) {
  if (transforms_.erase(transformId) == 0) return {};
  // Items bound to a deleted transform fall back to identity.
  for (auto& kv : drawItems_) {
    if (kv.second.transformId == transformId) kv.second.transformId = 0;
  }
  return {transformId};
}

std::vector<Id> Scene::paneIds() const {
  std::vector<Id> out;
  out.reserve(panes_.size());
  for (auto& kv : panes_) out.push_back(kv.first);
  return out;
}

std::vector<Id> Scene::layerIds() const {
  std::vector<Id> out;
  out.reserve(layers_.size());
  for (auto& kv : layers_) out.push_back(kv.first);
  return out;
}

std::vector<Id> Scene::drawItemIds() const {
  std::vector<Id> out;
  out.reserve(drawItems_.size());
  for (auto& kv : drawItems_) out.push_back(kv.first);
  return out;
}

} // namespace tc
