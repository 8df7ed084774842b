#pragma once

#include <cstddef>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/options.hpp"
#include "mutator/mutation/splice.hpp"

namespace mutator::mutation {

// Replaces "ldloc block; ldloc key; call Mutation.Crypt" with the output of
// the crypt transform. The operand shape is positional, not traced.
class CryptExpander {
 public:
  explicit CryptExpander(const CryptTransform* transform)
      : transform_(transform) {
  }

  // call_index must address a crypt marker call. Returns where the
  // replacement landed (the former position of the block load).
  //
  // Errors: kMissingProcessor (no transform configured),
  // kMalformedCryptOperands (the two preceding instructions are not both
  // ldloc).
  [[nodiscard]] auto Expand(il::Procedure& procedure, size_t call_index) const
      -> Result<Splice>;

 private:
  const CryptTransform* transform_;
};

}  // namespace mutator::mutation
