#include "mutator/transform/stock.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "mutator/il/instruction.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::transform {

namespace {

auto AppendBinaryConstant(il::Opcode opcode, int32_t operand)
    -> mutation::PlaceholderTransform {
  return [opcode, operand](std::span<const il::Instruction> argument) {
    std::vector<il::Instruction> out(argument.begin(), argument.end());
    out.push_back(il::Instruction::LoadConst(operand));
    out.push_back(il::Instruction::Simple(opcode));
    return out;
  };
}

}  // namespace

auto Identity() -> mutation::PlaceholderTransform {
  return [](std::span<const il::Instruction> argument) {
    return std::vector<il::Instruction>(argument.begin(), argument.end());
  };
}

auto XorConstant(int32_t operand) -> mutation::PlaceholderTransform {
  return AppendBinaryConstant(il::Opcode::kXor, operand);
}

auto AddConstant(int32_t operand) -> mutation::PlaceholderTransform {
  return AppendBinaryConstant(il::Opcode::kAdd, operand);
}

auto UnrolledXor(uint32_t block_size) -> mutation::CryptTransform {
  return [block_size](
             const il::Procedure& /*procedure*/, const il::Local& block,
             const il::Local& key) {
    std::vector<il::Instruction> out;
    out.reserve(static_cast<size_t>(block_size) * 10);
    for (uint32_t i = 0; i < block_size; ++i) {
      auto index = static_cast<int32_t>(i);
      // block[i] = block[i] ^ key[i]
      out.push_back(il::Instruction::LoadLocal(&block));
      out.push_back(il::Instruction::LoadConst(index));
      out.push_back(il::Instruction::LoadLocal(&block));
      out.push_back(il::Instruction::LoadConst(index));
      out.push_back(il::Instruction::Simple(il::Opcode::kLoadElement));
      out.push_back(il::Instruction::LoadLocal(&key));
      out.push_back(il::Instruction::LoadConst(index));
      out.push_back(il::Instruction::Simple(il::Opcode::kLoadElement));
      out.push_back(il::Instruction::Simple(il::Opcode::kXor));
      out.push_back(il::Instruction::Simple(il::Opcode::kStoreElement));
    }
    return out;
  };
}

}  // namespace mutator::transform
