#include "dk/clock/ClockConfig.hpp"
#include "dk/style/PropertyReader.hpp"

#include <fstream>
#include <sstream>

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dk {

namespace {

Status readDimension(const rapidjson::Value& doc, const char* key, int& out) {
  auto it = doc.FindMember(key);
  if (it == doc.MemberEnd()) {
    return configError("MISSING_FIELD", std::string("Configuration requires '") + key + "'",
                       "{\"field\":" + jsonQuote(key) + "}");
  }
  if (!it->value.IsInt() || it->value.GetInt() < 1) {
    return configError("BAD_FIELD", std::string("'") + key + "' must be a positive integer",
                       "{\"field\":" + jsonQuote(key) + "}");
  }
  out = it->value.GetInt();
  return {};
}

Status parsePostProcessing(const rapidjson::Value& v, PostProcessing& out) {
  if (!v.IsObject()) return configError("BAD_FIELD", "'post_processing' must be an object");
  PropertyReader r(v, "post_processing");
  PostProcessing p;
  Status st;
  if (r.has("flip_horizontal")) {
    st = r.readBool("flip_horizontal", p.flipHorizontal);
    p.hasFlipHorizontal = true;
  }
  if (st.ok && r.has("rotate")) {
    st = r.readNumber("rotate", p.rotate);
    p.hasRotate = true;
  }
  if (st.ok && r.has("transpose")) {
    st = r.readBool("transpose", p.transpose);
    p.hasTranspose = true;
  }
  if (!st.ok) return st;
  out = p;
  return {};
}

std::string writeJson(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  v.Accept(writer);
  return sb.GetString();
}

} // anonymous namespace

Status parseClockConfig(const rapidjson::Value& doc, ClockConfig& out) {
  if (!doc.IsObject()) return configError("BAD_CONFIG", "Configuration must be a JSON object");

  ClockConfig cfg;
  Status st = readDimension(doc, "width", cfg.canvas.width);
  if (st.ok) st = readDimension(doc, "height", cfg.canvas.height);
  if (!st.ok) return st;

  PropertyReader r(doc, "config");
  if (r.has("antialias")) {
    st = r.readBool("antialias", cfg.canvas.antialias);
    cfg.hasAntialias = true;
  }
  if (st.ok && r.has("scale_factor")) {
    st = r.readPositiveInt("scale_factor", cfg.canvas.scaleFactor);
    cfg.hasScaleFactor = true;
  }
  if (st.ok && r.has("background_color")) {
    st = r.readColor("background_color", cfg.canvas.background);
    cfg.backgroundJson = writeJson(*r.get("background_color"));
    cfg.hasBackground = true;
  }
  if (!st.ok) return st;

  if (const rapidjson::Value* elems = r.get("elements")) {
    if (!elems->IsArray()) return configError("BAD_FIELD", "'elements' must be a list");
    cfg.hasElements = true;
    for (rapidjson::SizeType i = 0; i < elems->Size(); i++) {
      const rapidjson::Value& e = (*elems)[i];
      std::string where = "{\"index\":" + std::to_string(i) + "}";
      if (!e.IsObject()) {
        return configError("BAD_ELEMENT", "Element entries must be objects", where);
      }
      auto typeIt = e.FindMember("type");
      if (typeIt == e.MemberEnd() || !typeIt->value.IsString()) {
        return configError("BAD_ELEMENT", "Element entry requires a string 'type'", where);
      }
      ElementEntry entry;
      entry.type = typeIt->value.GetString();
      auto propsIt = e.FindMember("properties");
      entry.hasProperties = propsIt != e.MemberEnd();
      if (entry.hasProperties) {
        if (!propsIt->value.IsObject()) {
          return configError("BAD_ELEMENT", "Element 'properties' must be an object", where);
        }
        entry.propertiesJson = writeJson(propsIt->value);
      }
      cfg.elements.push_back(std::move(entry));
    }
  }

  if (const rapidjson::Value* post = r.get("post_processing")) {
    st = parsePostProcessing(*post, cfg.post);
    if (!st.ok) return st;
    cfg.hasPostProcessing = true;
  }

  out = std::move(cfg);
  return {};
}

Status loadClockConfigText(const std::string& json, ClockConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    return configError("PARSE_ERROR",
                       std::string("Invalid JSON: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()),
                       "{\"offset\":" + std::to_string(doc.GetErrorOffset()) + "}");
  }
  return parseClockConfig(doc, out);
}

Status loadClockConfigFile(const std::string& path, ClockConfig& out) {
  std::ifstream f(path);
  if (!f) {
    return resourceError("CONFIG_NOT_FOUND", "Cannot open configuration file: " + path,
                         "{\"path\":" + jsonQuote(path) + "}");
  }
  std::stringstream ss;
  ss << f.rdbuf();
  return loadClockConfigText(ss.str(), out);
}

std::string serializeClockConfig(const ClockConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("width", cfg.canvas.width, alloc);
  doc.AddMember("height", cfg.canvas.height, alloc);
  if (cfg.hasAntialias) doc.AddMember("antialias", cfg.canvas.antialias, alloc);
  if (cfg.hasScaleFactor) doc.AddMember("scale_factor", cfg.canvas.scaleFactor, alloc);

  if (cfg.hasBackground && !cfg.backgroundJson.empty()) {
    rapidjson::Document bg;
    bg.Parse(cfg.backgroundJson.c_str());
    if (!bg.HasParseError()) {
      rapidjson::Value copy(bg, alloc);
      doc.AddMember("background_color", copy, alloc);
    }
  }

  if (cfg.hasElements || !cfg.elements.empty()) {
    rapidjson::Value elems(rapidjson::kArrayType);
    for (const auto& e : cfg.elements) {
      rapidjson::Value obj(rapidjson::kObjectType);
      obj.AddMember("type", rapidjson::Value(e.type.c_str(), alloc), alloc);
      if (e.hasProperties) {
        rapidjson::Document props;
        props.Parse(e.propertiesJson.c_str());
        if (!props.HasParseError()) {
          rapidjson::Value copy(props, alloc);
          obj.AddMember("properties", copy, alloc);
        }
      }
      elems.PushBack(obj, alloc);
    }
    doc.AddMember("elements", elems, alloc);
  }

  if (cfg.hasPostProcessing) {
    rapidjson::Value pp(rapidjson::kObjectType);
    if (cfg.post.hasFlipHorizontal) pp.AddMember("flip_horizontal", cfg.post.flipHorizontal, alloc);
    if (cfg.post.hasRotate) pp.AddMember("rotate", cfg.post.rotate, alloc);
    if (cfg.post.hasTranspose) pp.AddMember("transpose", cfg.post.transpose, alloc);
    doc.AddMember("post_processing", pp, alloc);
  }

  return writeJson(doc);
}

} // namespace dk
