#pragma once

#include <cstddef>
#include <vector>

#include "mutator/il/instruction.hpp"

namespace mutator::mutation {

// Position of a replacement inserted into a body: [start, start + length).
struct Splice {
  size_t start = 0;
  size_t length = 0;

  [[nodiscard]] auto End() const -> size_t {
    return start + length;
  }
};

// Removes body[start, start + remove_count) and inserts replacement at
// start, preserving its order. Works on indices only; no iterator outlives
// a single mutation.
auto SpliceBody(
    std::vector<il::Instruction>& body, size_t start, size_t remove_count,
    std::vector<il::Instruction> replacement) -> Splice;

}  // namespace mutator::mutation
