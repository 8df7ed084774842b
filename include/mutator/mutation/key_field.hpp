#pragma once

#include <cstddef>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::mutation {

// Substitutes key-field marker loads with constant loads.
class KeyFieldResolver {
 public:
  explicit KeyFieldResolver(const KeyValueMap* key_values)
      : key_values_(key_values) {
  }

  // Rewrites body[index], an ldsfld of a marker field, into `ldc <value>` in
  // place. Body length and positions are unchanged. On error the
  // instruction is left untouched.
  //
  // Errors: kUnrecognizedKeyField for names outside KeyI0..KeyI15,
  // kMissingKeyValue when the slot has no configured value.
  [[nodiscard]] auto Resolve(il::Procedure& procedure, size_t index) const
      -> Result<void>;

 private:
  const KeyValueMap* key_values_;
};

}  // namespace mutator::mutation
