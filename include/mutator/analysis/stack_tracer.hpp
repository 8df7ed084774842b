#pragma once

#include <cstddef>
#include <vector>

#include "mutator/analysis/provenance_tracer.hpp"
#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::analysis {

// Straight-line provenance tracer driven by per-instruction stack effects.
//
// Walks backwards from the consumer. For each argument (last first) it
// starts with one required value; every preceding instruction first
// satisfies requirements with its pushes and then adds its own pops. The
// argument begins at the instruction where the requirement drops to zero.
//
// Fails when the walk reaches a label, branch or return (the span would not
// be branch-free), runs off the start of the body, or meets an instruction
// that pushes more values than the span can own (e.g. a `dup` whose other
// copy is consumed outside the span).
class StackTracer final : public ProvenanceTracer {
 public:
  [[nodiscard]] auto TraceArguments(
      const il::Procedure& procedure, size_t consumer_index) const
      -> Result<std::vector<size_t>> override;
};

}  // namespace mutator::analysis
