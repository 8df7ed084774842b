#include "mutator/mutation/key_field.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>

#include <spdlog/spdlog.h>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/internal_error.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::mutation {

auto KeyFieldResolver::Resolve(il::Procedure& procedure, size_t index) const
    -> Result<void> {
  il::Instruction& instr = procedure.Body()[index];
  const il::FieldDef* field = instr.AsField();
  if (field == nullptr) {
    common::ThrowInternalError(
        "KeyFieldResolver", "instruction '{}' has no field operand",
        instr.ToString());
  }

  InstrLocation loc{.procedure = procedure.Name(), .index = index};

  auto slot = ParseKeySlot(field->name);
  if (!slot) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kUnrecognizedKeyField, loc,
            std::format(
                "'{}' is not a recognized key field (expected KeyI0..KeyI15)",
                field->QualifiedName())));
  }

  auto it = key_values_->find(*slot);
  if (it == key_values_->end()) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kMissingKeyValue, loc,
            std::format(
                "code requests mutation key {}, but no value is set for it",
                field->name)));
  }

  spdlog::debug(
      "{}@{}: {} -> ldc {:#010x}", procedure.Name(), index,
      field->QualifiedName(), static_cast<uint32_t>(it->second));
  instr = il::Instruction::LoadConst(it->second);
  return {};
}

}  // namespace mutator::mutation
