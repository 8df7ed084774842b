#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mutator::il {

enum class Opcode : uint8_t {
  kNop,

  // Constants and variables
  kLoadConst,         // ldc: push 32-bit integer operand
  kLoadLocal,         // ldloc
  kStoreLocal,        // stloc
  kLoadStaticField,   // ldsfld
  kStoreStaticField,  // stsfld
  kLoadStaticFieldAddress,  // ldsflda

  // Arrays
  kNewArray,      // newarr: length -> array
  kLoadElement,   // ldelem: array, index -> value
  kStoreElement,  // stelem: array, index, value ->
  kLoadLength,    // ldlen: array -> length

  // Arithmetic and bitwise
  kAdd,
  kSub,
  kMul,
  kDiv,
  kRem,
  kAnd,
  kOr,
  kXor,
  kShl,
  kShr,
  kNeg,
  kNot,

  // Stack manipulation
  kDup,
  kPop,

  // Calls (stack effect comes from the callee signature)
  kCall,

  // Control flow
  kLabel,  // Branch target pseudo-instruction, no stack effect
  kBranch,
  kBranchIfTrue,
  kBranchIfFalse,
  kReturn,
};

enum class OperandKind : uint8_t {
  kNone,
  kInt32,
  kLocal,
  kField,
  kMethod,
  kLabel,
};

struct OpcodeInfo {
  std::string_view mnemonic;
  OperandKind operand;
  // Fixed stack effect. Ignored for kCall (callee-dependent) and kReturn
  // (procedure-dependent).
  uint8_t pops;
  uint8_t pushes;
  // Instruction transfers control or is a transfer target.
  bool is_control;
};

auto GetOpcodeInfo(Opcode opcode) -> const OpcodeInfo&;

// Lookup by listing mnemonic (e.g. "ldloc"). Returns nullopt if unknown.
auto ParseOpcode(std::string_view mnemonic) -> std::optional<Opcode>;

inline auto Mnemonic(Opcode opcode) -> std::string_view {
  return GetOpcodeInfo(opcode).mnemonic;
}

}  // namespace mutator::il
