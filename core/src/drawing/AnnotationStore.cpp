#include "tc/drawing/AnnotationStore.hpp"

#include <algorithm>
#include <utility>
#include <chrono>
#include <cmath>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tc {

const char* toString(AnnotationKind kind) {
  switch (kind) {
    case AnnotationKind::HorizontalLine: return "horizontal_line";
    case AnnotationKind::Trendline:      return "trendline";
    case AnnotationKind::Text:           return "text";
    case AnnotationKind::Brush:          return "brush";
  }
  return "unknown";
}

bool parseAnnotationKind(const std::string& s, AnnotationKind& out) {
  for (AnnotationKind k : {AnnotationKind::HorizontalLine, AnnotationKind::Trendline,
                           AnnotationKind::Text, AnnotationKind::Brush}) {
    if (s == toString(k)) { out = k; return true; }
  }
  return false;
}

AnnotationStore::AnnotationStore()
  : clock_([] {
      return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count());
    }) {}

void AnnotationStore::setDefaultColor(const float rgba[4]) {
  for (int i = 0; i < 4; ++i) defaultColor_[i] = rgba[i];
}

Annotation& AnnotationStore::push(AnnotationKind kind) {
  Annotation a;
  a.id = nextId_++;
  a.kind = kind;
  for (int i = 0; i < 4; ++i) a.color[i] = defaultColor_[i];
  a.createdAt = clock_ ? clock_() : 0;
  annotations_.push_back(std::move(a));
  revision_++;
  return annotations_.back();
}

std::uint32_t AnnotationStore::addHorizontalLine(double price, double time) {
  Annotation& a = push(AnnotationKind::HorizontalLine);
  a.price = price;
  a.time = time;
  return a.id;
}

std::uint32_t AnnotationStore::addTrendline(double time0, double price0,
                                            double time1, double price1) {
  Annotation& a = push(AnnotationKind::Trendline);
  a.time = time0;  a.price = price0;
  a.time1 = time1; a.price1 = price1;
  return a.id;
}

std::uint32_t AnnotationStore::addText(double time, double price, const std::string& text) {
  Annotation& a = push(AnnotationKind::Text);
  a.time = time;
  a.price = price;
  a.text = text;
  return a.id;
}

std::uint32_t AnnotationStore::addBrush(const std::vector<AnnotationPoint>& points) {
  if (points.size() < 2) return 0;
  Annotation& a = push(AnnotationKind::Brush);
  a.points = points;
  a.time = points.front().time;
  a.price = points.front().price;
  return a.id;
}

bool AnnotationStore::setColor(std::uint32_t id, float r, float g, float b, float a) {
  for (auto& an : annotations_) {
    if (an.id == id) {
      an.color[0] = r; an.color[1] = g;
      an.color[2] = b; an.color[3] = a;
      revision_++;
      return true;
    }
  }
  return false;
}

bool AnnotationStore::remove(std::uint32_t id) {
  auto it = std::remove_if(annotations_.begin(), annotations_.end(),
    [id](const Annotation& a) { return a.id == id; });
  if (it == annotations_.end()) return false;
  annotations_.erase(it, annotations_.end());
  revision_++;
  return true;
}

void AnnotationStore::clear() {
  annotations_.clear();
  revision_++;
}

void AnnotationStore::adopt(AnnotationStore&& other) {
  annotations_ = std::move(other.annotations_);
  other.annotations_.clear();
  nextId_ = other.nextId_;
  other.nextId_ = 1;
  revision_++;
}

const Annotation* AnnotationStore::get(std::uint32_t id) const {
  for (const auto& a : annotations_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

std::string AnnotationStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("annotations");
  w.StartArray();
  for (const auto& a : annotations_) {
    w.StartObject();
    w.Key("id");        w.Uint(a.id);
    w.Key("type");      w.String(toString(a.kind));
    w.Key("price");     w.Double(a.price);
    w.Key("time");      w.Double(a.time);
    w.Key("createdAt"); w.Int64(a.createdAt);
    if (a.kind == AnnotationKind::Trendline) {
      w.Key("time1");  w.Double(a.time1);
      w.Key("price1"); w.Double(a.price1);
    }
    if (a.kind == AnnotationKind::Text) {
      w.Key("text"); w.String(a.text.c_str());
    }
    if (a.kind == AnnotationKind::Brush) {
      w.Key("points");
      w.StartArray();
      for (const auto& p : a.points) {
        w.StartArray();
        w.Double(p.time);
        w.Double(p.price);
        w.EndArray();
      }
      w.EndArray();
    }
    w.Key("color");
    w.StartArray();
    for (int i = 0; i < 4; ++i) w.Double(static_cast<double>(a.color[i]));
    w.EndArray();
    w.Key("lineWidth"); w.Double(static_cast<double>(a.lineWidth));
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

static bool readNumber(const rapidjson::Value& v, const char* key, double& out) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return std::isfinite(out);
}

bool AnnotationStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("annotations") || !doc["annotations"].IsArray()) return false;

  const auto& arr = doc["annotations"].GetArray();

  std::vector<Annotation> loaded;
  loaded.reserve(arr.Size());
  std::uint32_t maxId = 0;

  for (const auto& v : arr) {
    if (!v.IsObject()) return false;
    Annotation a;

    if (v.HasMember("id") && v["id"].IsUint() && v["id"].GetUint() != 0)
      a.id = v["id"].GetUint();
    else
      return false;

    if (!v.HasMember("type") || !v["type"].IsString() ||
        !parseAnnotationKind(v["type"].GetString(), a.kind))
      return false;

    if (!readNumber(v, "price", a.price)) return false;
    readNumber(v, "time", a.time);
    if (v.HasMember("createdAt") && v["createdAt"].IsInt64())
      a.createdAt = v["createdAt"].GetInt64();

    if (a.kind == AnnotationKind::Trendline) {
      if (!readNumber(v, "time1", a.time1) || !readNumber(v, "price1", a.price1))
        return false;
    }
    if (a.kind == AnnotationKind::Text && v.HasMember("text") && v["text"].IsString())
      a.text = v["text"].GetString();
    if (a.kind == AnnotationKind::Brush) {
      if (!v.HasMember("points") || !v["points"].IsArray()) return false;
      for (const auto& p : v["points"].GetArray()) {
        if (!p.IsArray() || p.Size() != 2 || !p[0].IsNumber() || !p[1].IsNumber())
          return false;
        a.points.push_back({p[0].GetDouble(), p[1].GetDouble()});
      }
      if (a.points.size() < 2) return false;
    }

    if (v.HasMember("color") && v["color"].IsArray()) {
      const auto& ca = v["color"].GetArray();
      for (unsigned i = 0; i < 4 && i < ca.Size(); ++i) {
        if (ca[i].IsNumber())
          a.color[i] = static_cast<float>(ca[i].GetDouble());
      }
    }

    if (v.HasMember("lineWidth") && v["lineWidth"].IsNumber())
      a.lineWidth = static_cast<float>(v["lineWidth"].GetDouble());

    if (a.id > maxId) maxId = a.id;
    loaded.push_back(std::move(a));
  }

  annotations_ = std::move(loaded);
  nextId_ = maxId + 1;
  revision_++;
  return true;
}

} // namespace tc
