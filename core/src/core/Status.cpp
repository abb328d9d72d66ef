#include "dk/core/Status.hpp"

#include <cstdio>

namespace dk {

const char* toString(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:     return "None";
    case ErrorKind::Config:   return "ConfigError";
    case ErrorKind::Resource: return "ResourceError";
    case ErrorKind::Io:       return "IoError";
  }
  return "Unknown";
}

static Status make(ErrorKind kind, const std::string& code,
                   const std::string& message, const std::string& detailsJson) {
  Status s;
  s.ok = false;
  s.err.kind = kind;
  s.err.code = code;
  s.err.message = message;
  s.err.details = detailsJson;
  return s;
}

Status configError(const std::string& code, const std::string& message,
                   const std::string& detailsJson) {
  return make(ErrorKind::Config, code, message, detailsJson);
}

Status resourceError(const std::string& code, const std::string& message,
                     const std::string& detailsJson) {
  return make(ErrorKind::Resource, code, message, detailsJson);
}

Status ioError(const std::string& code, const std::string& message,
               const std::string& detailsJson) {
  return make(ErrorKind::Io, code, message, detailsJson);
}

std::string jsonQuote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
  return out;
}

} // namespace dk
