#pragma once

#include <cstdint>

#include "mutator/mutation/options.hpp"

namespace mutator::transform {

// Placeholder transforms. Each returns the argument span followed by code
// that post-processes the value it leaves on the stack.

// Argument unchanged (the marker call is simply dropped).
auto Identity() -> mutation::PlaceholderTransform;

// value ^ operand
auto XorConstant(int32_t operand) -> mutation::PlaceholderTransform;

// value + operand (wrapping)
auto AddConstant(int32_t operand) -> mutation::PlaceholderTransform;

// Crypt transforms.

// Unrolled in-place XOR of the first block_size words of the block array
// with the key array: block[i] = block[i] ^ key[i] for i in [0, block_size).
auto UnrolledXor(uint32_t block_size) -> mutation::CryptTransform;

}  // namespace mutator::transform
