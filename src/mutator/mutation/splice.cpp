#include "mutator/mutation/splice.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

#include "mutator/common/internal_error.hpp"
#include "mutator/il/instruction.hpp"

namespace mutator::mutation {

auto SpliceBody(
    std::vector<il::Instruction>& body, size_t start, size_t remove_count,
    std::vector<il::Instruction> replacement) -> Splice {
  if (start > body.size() || remove_count > body.size() - start) {
    common::ThrowInternalError(
        "SpliceBody", "range [{}, {}) out of bounds (body size {})", start,
        start + remove_count, body.size());
  }

  auto offset = static_cast<std::ptrdiff_t>(start);
  body.erase(
      body.begin() + offset,
      body.begin() + offset + static_cast<std::ptrdiff_t>(remove_count));
  body.insert(
      body.begin() + offset, std::make_move_iterator(replacement.begin()),
      std::make_move_iterator(replacement.end()));

  return Splice{.start = start, .length = replacement.size()};
}

}  // namespace mutator::mutation
