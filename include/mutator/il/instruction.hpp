#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "mutator/il/opcode.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::il {

using Operand = std::variant<
    std::monostate, int32_t, const Local*, const FieldDef*, const MethodDef*,
    const Label*>;

struct StackEffect {
  uint32_t pops = 0;
  uint32_t pushes = 0;
};

struct Instruction {
  Opcode opcode = Opcode::kNop;
  Operand operand{};

  auto operator==(const Instruction&) const -> bool = default;

  static auto Nop() -> Instruction {
    return Instruction{.opcode = Opcode::kNop, .operand = std::monostate{}};
  }

  static auto LoadConst(int32_t value) -> Instruction {
    return Instruction{.opcode = Opcode::kLoadConst, .operand = value};
  }

  static auto LoadLocal(const Local* local) -> Instruction {
    return Instruction{.opcode = Opcode::kLoadLocal, .operand = local};
  }

  static auto StoreLocal(const Local* local) -> Instruction {
    return Instruction{.opcode = Opcode::kStoreLocal, .operand = local};
  }

  static auto LoadStaticField(const FieldDef* field) -> Instruction {
    return Instruction{.opcode = Opcode::kLoadStaticField, .operand = field};
  }

  static auto StoreStaticField(const FieldDef* field) -> Instruction {
    return Instruction{.opcode = Opcode::kStoreStaticField, .operand = field};
  }

  static auto Call(const MethodDef* method) -> Instruction {
    return Instruction{.opcode = Opcode::kCall, .operand = method};
  }

  static auto MakeLabel(const Label* label) -> Instruction {
    return Instruction{.opcode = Opcode::kLabel, .operand = label};
  }

  static auto Branch(Opcode opcode, const Label* target) -> Instruction {
    return Instruction{.opcode = opcode, .operand = target};
  }

  // Operand-free instruction (arithmetic, stack, array, ret)
  static auto Simple(Opcode opcode) -> Instruction {
    return Instruction{.opcode = opcode, .operand = std::monostate{}};
  }

  [[nodiscard]] auto AsInt32() const -> const int32_t* {
    return std::get_if<int32_t>(&operand);
  }

  [[nodiscard]] auto AsLocal() const -> const Local* {
    const auto* p = std::get_if<const Local*>(&operand);
    return p != nullptr ? *p : nullptr;
  }

  [[nodiscard]] auto AsField() const -> const FieldDef* {
    const auto* p = std::get_if<const FieldDef*>(&operand);
    return p != nullptr ? *p : nullptr;
  }

  [[nodiscard]] auto AsMethod() const -> const MethodDef* {
    const auto* p = std::get_if<const MethodDef*>(&operand);
    return p != nullptr ? *p : nullptr;
  }

  [[nodiscard]] auto AsLabel() const -> const Label* {
    const auto* p = std::get_if<const Label*>(&operand);
    return p != nullptr ? *p : nullptr;
  }

  // Stack effect of this instruction in isolation. kReturn reports no pops;
  // its consumption depends on the owning procedure and it is a control
  // barrier for every analysis in this project.
  [[nodiscard]] auto GetStackEffect() const -> StackEffect;

  [[nodiscard]] auto IsControl() const -> bool {
    return GetOpcodeInfo(opcode).is_control;
  }

  [[nodiscard]] auto ToString() const -> std::string;
};

}  // namespace mutator::il
