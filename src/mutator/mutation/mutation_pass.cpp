#include "mutator/mutation/mutation_pass.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/crypt_expander.hpp"
#include "mutator/mutation/key_field.hpp"
#include "mutator/mutation/marker_catalog.hpp"
#include "mutator/mutation/placeholder_expander.hpp"
#include "mutator/mutation/splice.hpp"

namespace mutator::mutation {

auto MutationPass::Create(
    const il::Module& module, const analysis::ProvenanceTracer& tracer,
    MutationOptions options) -> Result<MutationPass> {
  const il::TypeDef* marker_type = module.FindType(kMarkerTypeName);
  if (marker_type == nullptr) {
    return std::unexpected(
        Diagnostic::ConfigError(
            ErrorCode::kMarkerTypeNotFound,
            std::format(
                "marker type '{}' is not defined in the module",
                kMarkerTypeName)));
  }
  return MutationPass(marker_type, tracer, std::move(options));
}

MutationPass::MutationPass(
    const il::TypeDef* marker_type, const analysis::ProvenanceTracer& tracer,
    MutationOptions options)
    : catalog_(marker_type), tracer_(&tracer), options_(std::move(options)) {
}

auto MutationPass::Run(il::Procedure& procedure) const -> Result<void> {
  auto stats = RunWithStats(procedure);
  if (!stats) {
    return std::unexpected(std::move(stats.error()));
  }
  return {};
}

auto MutationPass::RunWithStats(il::Procedure& procedure) const
    -> Result<PassStats> {
  KeyFieldResolver key_fields(&options_.key_values);
  PlaceholderExpander placeholders(tracer_, &options_.placeholder);
  CryptExpander crypts(&options_.crypt);

  PassStats stats;
  auto& body = procedure.Body();
  size_t cursor = 0;
  while (cursor < body.size()) {
    MarkerUse use = catalog_.Classify(body[cursor]);
    switch (use.kind) {
      case MarkerKind::kNone:
        ++cursor;
        break;

      case MarkerKind::kKeyField: {
        auto result = key_fields.Resolve(procedure, cursor);
        if (!result) {
          return std::unexpected(std::move(result.error()));
        }
        ++stats.key_fields;
        ++cursor;
        break;
      }

      case MarkerKind::kPlaceholderCall: {
        auto splice = placeholders.Expand(procedure, cursor);
        if (!splice) {
          return std::unexpected(std::move(splice.error()));
        }
        ++stats.placeholders;
        cursor = splice->End();
        break;
      }

      case MarkerKind::kCryptCall: {
        auto splice = crypts.Expand(procedure, cursor);
        if (!splice) {
          return std::unexpected(std::move(splice.error()));
        }
        ++stats.crypts;
        cursor = splice->End();
        break;
      }

      case MarkerKind::kUnexpected: {
        const il::Instruction& instr = body[cursor];
        return std::unexpected(
            Diagnostic::Error(
                ErrorCode::kUnexpectedMarkerUse,
                InstrLocation{.procedure = procedure.Name(), .index = cursor},
                std::format(
                    "unexpected '{}' of marker member '{}.{}'",
                    il::Mnemonic(instr.opcode),
                    catalog_.MarkerType()->name, use.member)));
      }
    }
  }

  spdlog::debug(
      "{}: resolved {} key fields, {} placeholders, {} crypts",
      procedure.Name(), stats.key_fields, stats.placeholders, stats.crypts);
  return stats;
}

}  // namespace mutator::mutation
