#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mutator {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,        // Malformed marker use in a procedure body
  kConfigError,  // Pass set up incorrectly (missing transform, marker type)
  kHostError,    // I/O, malformed listing or configuration input
  kWarning,      // Non-fatal
  kNote,         // Auxiliary message
};

// Stable identity of a pass failure (only valid for kError / kConfigError)
enum class ErrorCode : uint8_t {
  kUnexpectedMarkerUse,
  kUnrecognizedKeyField,
  kMissingKeyValue,
  kTraceFailure,
  kMissingProcessor,
  kMalformedCryptOperands,
  kMarkerTypeNotFound,
};

// Position of an instruction inside a procedure body
struct InstrLocation {
  std::string procedure;
  size_t index = 0;

  auto operator==(const InstrLocation&) const -> bool = default;
};

// Line inside a listing or configuration file
struct FileLocation {
  std::string path;
  uint32_t line = 0;

  auto operator==(const FileLocation&) const -> bool = default;
};

// Represents missing location (configuration errors, host errors)
struct UnknownLocation {
  auto operator==(const UnknownLocation&) const -> bool = default;
};

using DiagLocation = std::variant<UnknownLocation, InstrLocation, FileLocation>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagLocation location;
  std::string message;
  std::optional<ErrorCode> code;  // has_value() iff kind is kError or
                                  // kConfigError

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: malformed marker use at an instruction
  static auto Error(ErrorCode code, InstrLocation loc, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::move(loc),
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: pass configuration error (no instruction is at fault)
  static auto ConfigError(ErrorCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kConfigError,
             .location = UnknownLocation{},
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: configuration error reported against an instruction
  static auto ConfigError(ErrorCode code, InstrLocation loc, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kConfigError,
             .location = std::move(loc),
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: host error without location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = UnknownLocation{},
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: host error with file location (listing or config line)
  static auto HostError(FileLocation loc, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = std::move(loc),
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(InstrLocation loc, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .location = std::move(loc),
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = UnknownLocation{},
            .message = std::move(msg),
            .code = std::nullopt,
        });
    return std::move(*this);
  }

  [[nodiscard]] auto Code() const -> std::optional<ErrorCode> {
    return primary.code;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

// String conversion for diagnostic display
auto ToString(ErrorCode code) -> const char*;
auto FormatLocation(const DiagLocation& location) -> std::string;

}  // namespace mutator
