#include "mutator/mutation/placeholder_expander.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <span>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/internal_error.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/splice.hpp"

namespace mutator::mutation {

auto PlaceholderExpander::Expand(il::Procedure& procedure, size_t call_index)
    const -> Result<Splice> {
  InstrLocation loc{.procedure = procedure.Name(), .index = call_index};

  if (transform_ == nullptr || !*transform_) {
    return std::unexpected(
        Diagnostic::ConfigError(
            ErrorCode::kMissingProcessor, loc,
            "found mutation placeholder, but no placeholder processor is "
            "configured"));
  }

  auto trace = tracer_->TraceArguments(procedure, call_index);
  if (!trace) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kTraceFailure, loc,
            "failed to trace placeholder argument")
            .WithNote(trace.error().primary.message));
  }
  if (trace->size() != 1) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kTraceFailure, loc,
            std::format(
                "placeholder must take exactly one argument, traced {}",
                trace->size())));
  }

  size_t start = trace->front();
  if (start >= call_index) {
    common::ThrowInternalError(
        "placeholder expander",
        "tracer placed the argument of the call at {} at index {}", call_index,
        start);
  }
  auto& body = procedure.Body();
  std::vector<il::Instruction> argument(
      body.begin() + static_cast<std::ptrdiff_t>(start),
      body.begin() + static_cast<std::ptrdiff_t>(call_index));

  // Argument span plus the call itself.
  size_t removed = argument.size() + 1;
  SpliceBody(body, start, removed, {});

  std::vector<il::Instruction> replacement =
      (*transform_)(std::span<const il::Instruction>(argument));
  Splice splice = SpliceBody(body, start, 0, std::move(replacement));

  spdlog::debug(
      "{}@{}: placeholder expanded, {} removed, {} inserted", procedure.Name(),
      start, removed, splice.length);
  return splice;
}

}  // namespace mutator::mutation
