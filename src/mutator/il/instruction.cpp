#include "mutator/il/instruction.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "mutator/common/internal_error.hpp"
#include "mutator/common/overloaded.hpp"
#include "mutator/il/opcode.hpp"

namespace mutator::il {

auto Instruction::GetStackEffect() const -> StackEffect {
  if (opcode == Opcode::kCall) {
    const MethodDef* callee = AsMethod();
    if (callee == nullptr) {
      common::ThrowInternalError(
          "Instruction::GetStackEffect", "call without method operand");
    }
    return StackEffect{
        .pops = callee->param_count,
        .pushes = callee->returns_value ? 1U : 0U,
    };
  }
  const OpcodeInfo& info = GetOpcodeInfo(opcode);
  return StackEffect{.pops = info.pops, .pushes = info.pushes};
}

auto Instruction::ToString() const -> std::string {
  std::string_view mnemonic = Mnemonic(opcode);
  return std::visit(
      common::Overloaded{
          [&](std::monostate) -> std::string { return std::string(mnemonic); },
          [&](int32_t value) -> std::string {
            return fmt::format("{} {}", mnemonic, value);
          },
          [&](const Local* local) -> std::string {
            return fmt::format("{} {}", mnemonic, local->name);
          },
          [&](const FieldDef* field) -> std::string {
            return fmt::format("{} {}", mnemonic, field->QualifiedName());
          },
          [&](const MethodDef* method) -> std::string {
            return fmt::format("{} {}", mnemonic, method->QualifiedName());
          },
          [&](const Label* label) -> std::string {
            return fmt::format("{} {}", mnemonic, label->name);
          },
      },
      operand);
}

}  // namespace mutator::il
