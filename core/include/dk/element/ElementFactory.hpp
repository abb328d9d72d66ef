#pragma once
#include "dk/element/Element.hpp"

#include <memory>
#include <string>

namespace dk {

// Build the variant for `kind` from its property object.
Status createElement(ElementKind kind, const rapidjson::Value& props,
                     std::unique_ptr<Element>& out);

// Type tag ("Face", "Ticks", ...) dispatch; unknown tags are a ConfigError.
Status createElement(const std::string& typeTag, const rapidjson::Value& props,
                     std::unique_ptr<Element>& out);

// Convenience: parse the property JSON text first.
Status createElementFromJson(const std::string& typeTag, const std::string& propsJson,
                             std::unique_ptr<Element>& out);

} // namespace dk
