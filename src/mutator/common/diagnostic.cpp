#include "mutator/common/diagnostic/diagnostic.hpp"

#include <format>
#include <string>
#include <variant>

#include "mutator/common/overloaded.hpp"

namespace mutator {

auto ToString(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kUnexpectedMarkerUse:
      return "unexpected-marker-use";
    case ErrorCode::kUnrecognizedKeyField:
      return "unrecognized-key-field";
    case ErrorCode::kMissingKeyValue:
      return "missing-key-value";
    case ErrorCode::kTraceFailure:
      return "trace-failure";
    case ErrorCode::kMissingProcessor:
      return "missing-processor";
    case ErrorCode::kMalformedCryptOperands:
      return "malformed-crypt-operands";
    case ErrorCode::kMarkerTypeNotFound:
      return "marker-type-not-found";
  }
  return "unknown";
}

auto FormatLocation(const DiagLocation& location) -> std::string {
  return std::visit(
      common::Overloaded{
          [](const UnknownLocation&) -> std::string { return {}; },
          [](const InstrLocation& loc) -> std::string {
            return std::format("{}@{}", loc.procedure, loc.index);
          },
          [](const FileLocation& loc) -> std::string {
            if (loc.line == 0) {
              return loc.path;
            }
            return std::format("{}:{}", loc.path, loc.line);
          },
      },
      location);
}

}  // namespace mutator
