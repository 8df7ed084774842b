#pragma once

#include <cstddef>

#include "mutator/analysis/provenance_tracer.hpp"
#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/options.hpp"
#include "mutator/mutation/splice.hpp"

namespace mutator::mutation {

// Replaces "argument; call Mutation.Placeholder" with the output of the
// placeholder transform applied to the argument span.
class PlaceholderExpander {
 public:
  PlaceholderExpander(
      const analysis::ProvenanceTracer* tracer,
      const PlaceholderTransform* transform)
      : tracer_(tracer), transform_(transform) {
  }

  // call_index must address a placeholder marker call. Returns where the
  // replacement landed; the instruction that followed the call is at
  // Splice::End().
  //
  // Errors: kMissingProcessor (no transform configured, checked before any
  // tracing), kTraceFailure (argument span cannot be isolated or the call
  // does not take exactly one argument). Throws InternalError if the tracer
  // reports an argument start at or past call_index.
  [[nodiscard]] auto Expand(il::Procedure& procedure, size_t call_index) const
      -> Result<Splice>;

 private:
  const analysis::ProvenanceTracer* tracer_;
  const PlaceholderTransform* transform_;
};

}  // namespace mutator::mutation
