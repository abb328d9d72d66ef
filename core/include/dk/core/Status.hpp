#pragma once
#include <cstdint>
#include <string>

namespace dk {

enum class ErrorKind : std::uint8_t {
  None,
  Config,   // invalid configuration: bad enum, color, time, range, JSON
  Resource, // missing/unreadable font or image
  Io        // output could not be written
};

const char* toString(ErrorKind k);

struct DialError {
  ErrorKind kind{ErrorKind::None};
  std::string code;     // e.g. "BAD_ENUM"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct Status {
  bool ok{true};
  DialError err{};
};

Status configError(const std::string& code,
                   const std::string& message,
                   const std::string& detailsJson = "{}");

Status resourceError(const std::string& code,
                     const std::string& message,
                     const std::string& detailsJson = "{}");

Status ioError(const std::string& code,
               const std::string& message,
               const std::string& detailsJson = "{}");

// Escape a string for embedding in a details JSON object.
std::string jsonQuote(const std::string& s);

} // namespace dk
