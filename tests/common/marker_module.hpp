#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <ostream>
#include <vector>

#include "mutator/il/instruction.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::il {

// Readable gtest failure output for bodies.
inline void PrintTo(const Instruction& instr, std::ostream* os) {
  *os << instr.ToString();
}

}  // namespace mutator::il

namespace mutator::test {

// Module with the marker type, its sixteen key fields, the two marker
// calls, and a few non-marker helpers to build bodies from.
struct MarkerModule {
  il::Module module;
  const il::TypeDef* marker = nullptr;
  std::array<const il::FieldDef*, mutation::kKeySlotCount> keys{};
  const il::FieldDef* key16 = nullptr;     // KeyI16: out of range
  const il::FieldDef* key_other = nullptr;  // KeyX: wrong pattern
  const il::MethodDef* placeholder = nullptr;
  const il::MethodDef* crypt = nullptr;
  const il::MethodDef* other_marker_call = nullptr;

  const il::TypeDef* helper = nullptr;
  const il::FieldDef* helper_field = nullptr;
  const il::MethodDef* unary = nullptr;    // (1) -> value
  const il::MethodDef* binary = nullptr;   // (2) -> value
  const il::MethodDef* nullary = nullptr;  // (0) -> value

  MarkerModule() {
    marker = module.AddType("Mutation");
    for (size_t i = 0; i < keys.size(); ++i) {
      keys[i] = module.AddField(marker, std::format("KeyI{}", i));
    }
    key16 = module.AddField(marker, "KeyI16");
    key_other = module.AddField(marker, "KeyX");
    placeholder = module.AddMethod(marker, "Placeholder", 1, true);
    crypt = module.AddMethod(marker, "Crypt", 2, false);
    other_marker_call = module.AddMethod(marker, "Value", 0, true);

    helper = module.AddType("Helper");
    helper_field = module.AddField(helper, "KeyI0");
    unary = module.AddMethod(helper, "Unary", 1, true);
    binary = module.AddMethod(helper, "Binary", 2, true);
    nullary = module.AddMethod(helper, "Nullary", 0, true);
  }

  auto Key(size_t slot) const -> const il::FieldDef* {
    return keys[slot];
  }
};

inline auto Op(il::Opcode opcode) -> il::Instruction {
  return il::Instruction::Simple(opcode);
}

inline auto Ldc(int32_t value) -> il::Instruction {
  return il::Instruction::LoadConst(value);
}

}  // namespace mutator::test
