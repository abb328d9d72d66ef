#include "dk/style/PropertyReader.hpp"

#include <cmath>

namespace dk {

PropertyReader::PropertyReader(const rapidjson::Value& props, std::string scope)
  : props_(props), scope_(std::move(scope)) {}

const rapidjson::Value* PropertyReader::get(const char* key) const {
  if (!props_.IsObject()) return nullptr;
  auto it = props_.FindMember(key);
  if (it == props_.MemberEnd() || it->value.IsNull()) return nullptr;
  return &it->value;
}

Status PropertyReader::wrongType(const char* key, const char* expected) const {
  return configError("BAD_PROPERTY",
                     scope_ + "." + key + ": expected " + expected,
                     "{\"property\":" + jsonQuote(key) + "}");
}

Status PropertyReader::outOfRange(const char* key, const std::string& why) const {
  return configError("OUT_OF_RANGE",
                     scope_ + "." + key + ": " + why,
                     "{\"property\":" + jsonQuote(key) + "}");
}

Status PropertyReader::readNumber(const char* key, double& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsNumber()) return wrongType(key, "number");
  double d = v->GetDouble();
  if (!std::isfinite(d)) return outOfRange(key, "must be finite");
  out = d;
  return {};
}

Status PropertyReader::readNumber(const char* key, float& out) const {
  double d = out;
  Status st = readNumber(key, d);
  if (st.ok) out = static_cast<float>(d);
  return st;
}

Status PropertyReader::readPositive(const char* key, double& out) const {
  double d = out;
  Status st = readNumber(key, d);
  if (!st.ok) return st;
  if (has(key) && d <= 0) return outOfRange(key, "must be > 0");
  out = d;
  return {};
}

Status PropertyReader::readNonNegative(const char* key, double& out) const {
  double d = out;
  Status st = readNumber(key, d);
  if (!st.ok) return st;
  if (has(key) && d < 0) return outOfRange(key, "must be >= 0");
  out = d;
  return {};
}

Status PropertyReader::readFraction(const char* key, double& out) const {
  double d = out;
  Status st = readNumber(key, d);
  if (!st.ok) return st;
  if (has(key) && (d <= 0 || d > 1)) return outOfRange(key, "must be in (0, 1]");
  out = d;
  return {};
}

Status PropertyReader::readInt(const char* key, int& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (v->IsInt()) {
    out = v->GetInt();
    return {};
  }
  if (v->IsNumber()) {
    double d = v->GetDouble();
    if (d == std::floor(d) && std::fabs(d) < 1e9) {
      out = static_cast<int>(d);
      return {};
    }
  }
  return wrongType(key, "integer");
}

Status PropertyReader::readPositiveInt(const char* key, int& out) const {
  int i = out;
  Status st = readInt(key, i);
  if (!st.ok) return st;
  if (has(key) && i < 1) return outOfRange(key, "must be >= 1");
  out = i;
  return {};
}

Status PropertyReader::readBool(const char* key, bool& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsBool()) return wrongType(key, "boolean");
  out = v->GetBool();
  return {};
}

Status PropertyReader::readString(const char* key, std::string& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsString()) return wrongType(key, "string");
  out = v->GetString();
  return {};
}

Status PropertyReader::readPoint(const char* key, Point& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsArray() || v->Size() != 2 || !(*v)[0].IsNumber() || !(*v)[1].IsNumber()) {
    return wrongType(key, "[x, y]");
  }
  out.x = (*v)[0].GetDouble();
  out.y = (*v)[1].GetDouble();
  return {};
}

Status PropertyReader::readIntList(const char* key, std::vector<int>& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsArray()) return wrongType(key, "list of integers");
  std::vector<int> items;
  for (const auto& e : v->GetArray()) {
    if (!e.IsInt()) return wrongType(key, "list of integers");
    items.push_back(e.GetInt());
  }
  out = std::move(items);
  return {};
}

Status PropertyReader::readNumberList(const char* key, std::vector<double>& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsArray()) return wrongType(key, "list of numbers");
  std::vector<double> items;
  for (const auto& e : v->GetArray()) {
    if (!e.IsNumber()) return wrongType(key, "list of numbers");
    items.push_back(e.GetDouble());
  }
  out = std::move(items);
  return {};
}

Status PropertyReader::readStringList(const char* key, std::vector<std::string>& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsArray()) return wrongType(key, "list of strings");
  std::vector<std::string> items;
  for (const auto& e : v->GetArray()) {
    if (e.IsString()) {
      items.push_back(e.GetString());
    } else if (e.IsInt()) {
      items.push_back(std::to_string(e.GetInt()));
    } else {
      return wrongType(key, "list of strings");
    }
  }
  out = std::move(items);
  return {};
}

Status PropertyReader::readColor(const char* key, ColorSpec& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  ColorSpec c;
  Status st = parseColorSpec(*v, c);
  if (!st.ok) {
    st.err.message = scope_ + "." + key + ": " + st.err.message;
    return st;
  }
  out = std::move(c);
  return {};
}

Status PropertyReader::readObject(const char* key, const rapidjson::Value*& out) const {
  const rapidjson::Value* v = get(key);
  if (!v) return {};
  if (!v->IsObject()) return wrongType(key, "object");
  out = v;
  return {};
}

} // namespace dk
