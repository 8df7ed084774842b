#pragma once

#include <cstdint>
#include <string_view>

#include "mutator/il/instruction.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::mutation {

// Well-known names of the reserved marker type and its call members.
inline constexpr std::string_view kMarkerTypeName = "Mutation";
inline constexpr std::string_view kPlaceholderMethodName = "Placeholder";
inline constexpr std::string_view kCryptMethodName = "Crypt";

enum class MarkerKind : uint8_t {
  kNone,             // Does not reference the marker type
  kKeyField,         // ldsfld of a marker field
  kPlaceholderCall,  // call Mutation.Placeholder
  kCryptCall,        // call Mutation.Crypt
  kUnexpected,       // Any other reference to a marker member
};

struct MarkerUse {
  MarkerKind kind = MarkerKind::kNone;
  // Unqualified member name; empty when kind == kNone. Points into module
  // storage.
  std::string_view member;
};

// Classifies instructions against the marker type. The marker type is an
// opaque handle compared by identity, so same-named types elsewhere never
// match.
class MarkerCatalog {
 public:
  explicit MarkerCatalog(const il::TypeDef* marker_type)
      : marker_type_(marker_type) {
  }

  // Never fails. References to the marker type that are neither a field
  // load nor a known call are reported as kUnexpected so the caller can
  // reject them.
  [[nodiscard]] auto Classify(const il::Instruction& instr) const -> MarkerUse;

  [[nodiscard]] auto MarkerType() const -> const il::TypeDef* {
    return marker_type_;
  }

 private:
  const il::TypeDef* marker_type_;
};

}  // namespace mutator::mutation
