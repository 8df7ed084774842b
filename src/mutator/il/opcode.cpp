#include "mutator/il/opcode.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace mutator::il {

namespace {

constexpr size_t kOpcodeCount = static_cast<size_t>(Opcode::kReturn) + 1;

// Indexed by Opcode. Order must match the enum.
constexpr std::array<OpcodeInfo, kOpcodeCount> kOpcodeTable = {{
    {"nop", OperandKind::kNone, 0, 0, false},
    {"ldc", OperandKind::kInt32, 0, 1, false},
    {"ldloc", OperandKind::kLocal, 0, 1, false},
    {"stloc", OperandKind::kLocal, 1, 0, false},
    {"ldsfld", OperandKind::kField, 0, 1, false},
    {"stsfld", OperandKind::kField, 1, 0, false},
    {"ldsflda", OperandKind::kField, 0, 1, false},
    {"newarr", OperandKind::kNone, 1, 1, false},
    {"ldelem", OperandKind::kNone, 2, 1, false},
    {"stelem", OperandKind::kNone, 3, 0, false},
    {"ldlen", OperandKind::kNone, 1, 1, false},
    {"add", OperandKind::kNone, 2, 1, false},
    {"sub", OperandKind::kNone, 2, 1, false},
    {"mul", OperandKind::kNone, 2, 1, false},
    {"div", OperandKind::kNone, 2, 1, false},
    {"rem", OperandKind::kNone, 2, 1, false},
    {"and", OperandKind::kNone, 2, 1, false},
    {"or", OperandKind::kNone, 2, 1, false},
    {"xor", OperandKind::kNone, 2, 1, false},
    {"shl", OperandKind::kNone, 2, 1, false},
    {"shr", OperandKind::kNone, 2, 1, false},
    {"neg", OperandKind::kNone, 1, 1, false},
    {"not", OperandKind::kNone, 1, 1, false},
    {"dup", OperandKind::kNone, 1, 2, false},
    {"pop", OperandKind::kNone, 1, 0, false},
    {"call", OperandKind::kMethod, 0, 0, false},
    {"label", OperandKind::kLabel, 0, 0, true},
    {"br", OperandKind::kLabel, 0, 0, true},
    {"brtrue", OperandKind::kLabel, 1, 0, true},
    {"brfalse", OperandKind::kLabel, 1, 0, true},
    {"ret", OperandKind::kNone, 0, 0, true},
}};

}  // namespace

auto GetOpcodeInfo(Opcode opcode) -> const OpcodeInfo& {
  return kOpcodeTable[static_cast<size_t>(opcode)];
}

auto ParseOpcode(std::string_view mnemonic) -> std::optional<Opcode> {
  for (size_t i = 0; i < kOpcodeTable.size(); ++i) {
    if (kOpcodeTable[i].mnemonic == mnemonic) {
      return static_cast<Opcode>(i);
    }
  }
  return std::nullopt;
}

}  // namespace mutator::il
