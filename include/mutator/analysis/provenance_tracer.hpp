#pragma once

#include <cstddef>
#include <vector>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::analysis {

// Determines which instructions produce the stack values consumed by an
// instruction.
//
// For a consumer at consumer_index that pops N values, a successful result
// holds N indices in push order: element k is the index of the first
// instruction of the contiguous, branch-free span that computes argument k.
// Argument k's span ends where argument k+1's span begins; the last span
// ends immediately before the consumer.
//
// A consumer that pops nothing yields an empty vector (success). Any span
// that cannot be resolved is reported as an error with
// ErrorCode::kTraceFailure.
class ProvenanceTracer {
 public:
  ProvenanceTracer() = default;
  virtual ~ProvenanceTracer() = default;

  ProvenanceTracer(const ProvenanceTracer&) = delete;
  auto operator=(const ProvenanceTracer&) -> ProvenanceTracer& = delete;
  ProvenanceTracer(ProvenanceTracer&&) = delete;
  auto operator=(ProvenanceTracer&&) -> ProvenanceTracer& = delete;

  [[nodiscard]] virtual auto TraceArguments(
      const il::Procedure& procedure, size_t consumer_index) const
      -> Result<std::vector<size_t>> = 0;
};

}  // namespace mutator::analysis
