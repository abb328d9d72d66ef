#pragma once
#include "dk/core/Status.hpp"
#include "dk/math/ClockMath.hpp"
#include "dk/style/Color.hpp"

#include <string>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

namespace dk {

// Typed, validating access to one element's property object. Every read*
// leaves `out` untouched when the key is absent, so config structs keep
// their defaults. Present keys of the wrong type fail with BAD_PROPERTY.
class PropertyReader {
public:
  // `scope` prefixes error messages, e.g. "Hands.hour_spec".
  PropertyReader(const rapidjson::Value& props, std::string scope);

  const std::string& scope() const { return scope_; }
  bool has(const char* key) const { return get(key) != nullptr; }
  const rapidjson::Value* get(const char* key) const;

  Status readNumber(const char* key, double& out) const;
  Status readNumber(const char* key, float& out) const;
  Status readPositive(const char* key, double& out) const;     // > 0
  Status readNonNegative(const char* key, double& out) const;  // >= 0
  Status readFraction(const char* key, double& out) const;     // (0, 1]
  Status readInt(const char* key, int& out) const;
  Status readPositiveInt(const char* key, int& out) const;     // >= 1
  Status readBool(const char* key, bool& out) const;
  Status readString(const char* key, std::string& out) const;
  Status readPoint(const char* key, Point& out) const;
  Status readIntList(const char* key, std::vector<int>& out) const;
  Status readNumberList(const char* key, std::vector<double>& out) const;
  Status readStringList(const char* key, std::vector<std::string>& out) const;
  Status readColor(const char* key, ColorSpec& out) const;

  // Object-valued property; `out` stays null when absent.
  Status readObject(const char* key, const rapidjson::Value*& out) const;

  // Closed-set string property mapped onto an enum.
  template <typename E>
  Status readEnum(const char* key,
                  const std::vector<std::pair<const char*, E>>& table,
                  E& out) const {
    const rapidjson::Value* v = get(key);
    if (!v) return {};
    if (!v->IsString()) return wrongType(key, "string");
    std::string s = v->GetString();
    std::string allowed;
    for (const auto& e : table) {
      if (s == e.first) {
        out = e.second;
        return {};
      }
      if (!allowed.empty()) allowed += "|";
      allowed += e.first;
    }
    return configError("BAD_ENUM",
                       scope_ + "." + key + ": expected one of " + allowed +
                       ", got '" + s + "'",
                       "{\"property\":" + jsonQuote(key) + ",\"value\":" + jsonQuote(s) + "}");
  }

  Status outOfRange(const char* key, const std::string& why) const;
  Status wrongType(const char* key, const char* expected) const;

private:
  const rapidjson::Value& props_;
  std::string scope_;
};

} // namespace dk
