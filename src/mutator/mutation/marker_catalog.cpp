#include "mutator/mutation/marker_catalog.hpp"

#include "mutator/il/instruction.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::mutation {

auto MarkerCatalog::Classify(const il::Instruction& instr) const -> MarkerUse {
  if (const il::FieldDef* field = instr.AsField()) {
    if (field->declaring_type != marker_type_) {
      return MarkerUse{};
    }
    if (instr.opcode == il::Opcode::kLoadStaticField) {
      return MarkerUse{.kind = MarkerKind::kKeyField, .member = field->name};
    }
    return MarkerUse{.kind = MarkerKind::kUnexpected, .member = field->name};
  }

  if (const il::MethodDef* method = instr.AsMethod()) {
    if (method->declaring_type != marker_type_) {
      return MarkerUse{};
    }
    if (instr.opcode == il::Opcode::kCall) {
      if (method->name == kPlaceholderMethodName) {
        return MarkerUse{
            .kind = MarkerKind::kPlaceholderCall, .member = method->name};
      }
      if (method->name == kCryptMethodName) {
        return MarkerUse{.kind = MarkerKind::kCryptCall, .member = method->name};
      }
    }
    return MarkerUse{.kind = MarkerKind::kUnexpected, .member = method->name};
  }

  return MarkerUse{};
}

}  // namespace mutator::mutation
