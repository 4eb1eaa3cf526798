#include "tc/data/TickMessage.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace tc {

static bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

static ChartResult malformed(const char* why) {
  return chartFail(ErrorCode::MalformedTick, why);
}

static ChartResult readTickFields(const rapidjson::Value& obj, Tick& out) {
  if (!obj.IsObject()) return malformed("tick payload is not an object");

  double price = 0;
  if (!readNumber(obj, "last", price) && !readNumber(obj, "price", price)) {
    return malformed("missing numeric price");
  }

  double ts = 0;
  if (!readNumber(obj, "timestampMillis", ts) && !readNumber(obj, "timestamp", ts)) {
    return malformed("missing numeric timestamp");
  }

  out.price = price;
  out.timestampMillis = ts;
  return chartOk();
}

ChartResult parseTickMessage(const std::string& json, Tick& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    return malformed("invalid JSON object");
  }

  auto dataIt = doc.FindMember("data");
  if (dataIt == doc.MemberEnd()) {
    return readTickFields(doc, out);
  }

  auto typeIt = doc.FindMember("type");
  if (typeIt != doc.MemberEnd() &&
      (!typeIt->value.IsString() || std::string(typeIt->value.GetString()) != "update")) {
    return malformed("envelope type is not \"update\"");
  }

  const rapidjson::Value& data = dataIt->value;
  if (data.IsString()) {
    rapidjson::Document inner;
    inner.Parse(data.GetString(), data.GetStringLength());
    if (inner.HasParseError()) return malformed("envelope data is not valid JSON");
    return readTickFields(inner, out);
  }
  return readTickFields(data, out);
}

ChartResult parseHistoryJson(const std::string& json, std::vector<Candle>& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    return chartFail(ErrorCode::InvalidArgument, "history: invalid JSON");
  }

  const rapidjson::Value* arr = nullptr;
  if (doc.IsArray()) {
    arr = &doc;
  } else if (doc.IsObject()) {
    auto it = doc.FindMember("candles");
    if (it != doc.MemberEnd() && it->value.IsArray()) arr = &it->value;
  }
  if (!arr) {
    return chartFail(ErrorCode::InvalidArgument, "history: missing candles array");
  }

  out.clear();
  out.reserve(arr->Size());
  std::size_t skipped = 0;

  for (const auto& v : arr->GetArray()) {
    if (!v.IsObject()) { ++skipped; continue; }

    double timeMs = 0;
    Candle c;
    if (!readNumber(v, "time", timeMs) ||
        !readNumber(v, "open", c.open) ||
        !readNumber(v, "high", c.high) ||
        !readNumber(v, "low", c.low) ||
        !readNumber(v, "close", c.close) ||
        std::fabs(timeMs) > kMaxTimestampMillis) {
      ++skipped;
      continue;
    }
    if (!readNumber(v, "volume", c.volume)) c.volume = 0.0;

    c.time = static_cast<std::int64_t>(std::floor(timeMs / 1000.0));
    out.push_back(c);
  }

  if (skipped > 0) {
    std::fprintf(stderr, "[TickMessage] skipped %zu incomplete history entries\n", skipped);
  }
  return chartOk();
}

} // namespace tc
