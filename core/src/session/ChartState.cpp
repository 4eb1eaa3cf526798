#include "tc/session/ChartState.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace tc {

std::string serializeChartState(const ChartState& state) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(state.version.c_str(), alloc), alloc);
  doc.AddMember("symbol",
                rapidjson::Value(state.symbol.c_str(), alloc), alloc);
  doc.AddMember("timeframe",
                rapidjson::Value(state.timeframe.c_str(), alloc), alloc);
  doc.AddMember("chartType",
                rapidjson::Value(state.chartType.c_str(), alloc), alloc);

  rapidjson::Value ind(rapidjson::kObjectType);
  ind.AddMember("sma20", state.sma20, alloc);
  ind.AddMember("sma50", state.sma50, alloc);
  ind.AddMember("sma200", state.sma200, alloc);
  ind.AddMember("rsi14", state.rsi14, alloc);
  doc.AddMember("indicators", ind, alloc);

  doc.AddMember("theme",
                rapidjson::Value(state.themeName.c_str(), alloc), alloc);

  rapidjson::Value vp(rapidjson::kObjectType);
  vp.AddMember("visibleBars", state.visibleBars, alloc);
  doc.AddMember("viewport", vp, alloc);

  // Annotations: parse and embed as nested object
  if (!state.annotationsJSON.empty()) {
    rapidjson::Document annDoc;
    annDoc.Parse(state.annotationsJSON.c_str());
    if (!annDoc.HasParseError()) {
      rapidjson::Value annCopy(annDoc, alloc);
      doc.AddMember("annotations", annCopy, alloc);
    }
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (obj.HasMember(key) && obj[key].IsBool()) out = obj[key].GetBool();
}

static void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  if (obj.HasMember(key) && obj[key].IsString()) out = obj[key].GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  readString(doc, "version", out.version);
  readString(doc, "symbol", out.symbol);
  readString(doc, "timeframe", out.timeframe);
  readString(doc, "chartType", out.chartType);
  readString(doc, "theme", out.themeName);

  if (doc.HasMember("indicators") && doc["indicators"].IsObject()) {
    const auto& ind = doc["indicators"];
    readBool(ind, "sma20", out.sma20);
    readBool(ind, "sma50", out.sma50);
    readBool(ind, "sma200", out.sma200);
    readBool(ind, "rsi14", out.rsi14);
  }

  if (doc.HasMember("viewport") && doc["viewport"].IsObject()) {
    const auto& vp = doc["viewport"];
    if (vp.HasMember("visibleBars") && vp["visibleBars"].IsInt())
      out.visibleBars = vp["visibleBars"].GetInt();
  }

  // Annotations: re-serialize the embedded object back to a JSON string
  if (doc.HasMember("annotations") && doc["annotations"].IsObject()) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    doc["annotations"].Accept(writer);
    out.annotationsJSON = sb.GetString();
  }

  return true;
}

} // namespace tc
