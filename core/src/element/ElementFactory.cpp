#include "dk/element/ElementFactory.hpp"
#include "dk/element/FaceElement.hpp"
#include "dk/element/HandsElement.hpp"
#include "dk/element/NumeralsElement.hpp"
#include "dk/element/OverlayElement.hpp"
#include "dk/element/TicksElement.hpp"

namespace dk {

Status createElement(ElementKind kind, const rapidjson::Value& props,
                     std::unique_ptr<Element>& out) {
  if (!props.IsObject()) {
    return configError("BAD_PROPERTY",
                       std::string(toString(kind)) + ": properties must be an object");
  }
  switch (kind) {
    case ElementKind::Face:     return FaceElement::create(props, out);
    case ElementKind::Ticks:    return TicksElement::create(props, out);
    case ElementKind::Numerals: return NumeralsElement::create(props, out);
    case ElementKind::Hands:    return HandsElement::create(props, out);
    case ElementKind::Overlay:  return OverlayElement::create(props, out);
  }
  return configError("UNKNOWN_ELEMENT_TYPE", "Unknown element kind");
}

Status createElement(const std::string& typeTag, const rapidjson::Value& props,
                     std::unique_ptr<Element>& out) {
  ElementKind kind;
  if (!parseElementKind(typeTag, kind)) {
    return configError("UNKNOWN_ELEMENT_TYPE",
                       "Unknown element type: " + typeTag +
                       " (expected Face|Ticks|Numerals|Hands|Overlay)",
                       "{\"type\":" + jsonQuote(typeTag) + "}");
  }
  return createElement(kind, props, out);
}

Status createElementFromJson(const std::string& typeTag, const std::string& propsJson,
                             std::unique_ptr<Element>& out) {
  rapidjson::Document doc;
  doc.Parse(propsJson.c_str());
  if (doc.HasParseError()) {
    return configError("PARSE_ERROR", "Invalid element property JSON",
                       "{\"offset\":" + std::to_string(doc.GetErrorOffset()) + "}");
  }
  return createElement(typeTag, doc, out);
}

} // namespace dk
