#include "mutator/analysis/stack_tracer.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/internal_error.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::analysis {

namespace {

auto TraceError(
    const il::Procedure& procedure, size_t index, std::string msg)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::Error(
          ErrorCode::kTraceFailure,
          InstrLocation{.procedure = procedure.Name(), .index = index},
          std::move(msg)));
}

}  // namespace

auto StackTracer::TraceArguments(
    const il::Procedure& procedure, size_t consumer_index) const
    -> Result<std::vector<size_t>> {
  const auto& body = procedure.Body();
  if (consumer_index >= body.size()) {
    common::ThrowInternalError(
        "StackTracer", "consumer index {} out of range (body size {})",
        consumer_index, body.size());
  }

  const il::Instruction& consumer = body[consumer_index];
  uint32_t arg_count = consumer.GetStackEffect().pops;
  std::vector<size_t> starts(arg_count);

  // Exclusive end of the span currently being traced.
  size_t end = consumer_index;
  for (uint32_t arg = arg_count; arg > 0; --arg) {
    int64_t required = 1;
    size_t cursor = end;
    while (required > 0) {
      if (cursor == 0) {
        return TraceError(
            procedure, consumer_index,
            std::format(
                "argument {} of '{}' is not produced within the procedure",
                arg - 1, consumer.ToString()));
      }
      --cursor;
      const il::Instruction& producer = body[cursor];
      if (producer.IsControl()) {
        return TraceError(
            procedure, consumer_index,
            std::format(
                "argument {} of '{}' crosses control transfer '{}' at {}",
                arg - 1, consumer.ToString(), producer.ToString(), cursor));
      }
      il::StackEffect effect = producer.GetStackEffect();
      required -= effect.pushes;
      if (required < 0) {
        return TraceError(
            procedure, consumer_index,
            std::format(
                "argument {} of '{}' has ambiguous producer '{}' at {}",
                arg - 1, consumer.ToString(), producer.ToString(), cursor));
      }
      required += effect.pops;
    }
    starts[arg - 1] = cursor;
    end = cursor;
  }

  return starts;
}

}  // namespace mutator::analysis
