#pragma once

#include <cstddef>

#include "mutator/analysis/provenance_tracer.hpp"
#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"
#include "mutator/mutation/marker_catalog.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::mutation {

// Per-run counts, for logging and the driver's summary.
struct PassStats {
  size_t key_fields = 0;
  size_t placeholders = 0;
  size_t crypts = 0;

  [[nodiscard]] auto Total() const -> size_t {
    return key_fields + placeholders + crypts;
  }
};

// Resolves every marker operation in a procedure body.
//
// Single forward scan over the body with an index cursor. Key-field loads
// are rewritten in place; placeholder and crypt calls are spliced, and the
// cursor resumes right after the inserted replacement so neither replacement
// instructions are revisited nor original instructions skipped.
//
// Every error aborts the run immediately. The body may be left partially
// rewritten; callers wanting atomicity run the pass on a copy.
class MutationPass {
 public:
  // Resolves the marker type (kMarkerTypeName) in module. Its absence is a
  // configuration error (kMarkerTypeNotFound). The tracer must outlive the
  // pass.
  static auto Create(
      const il::Module& module, const analysis::ProvenanceTracer& tracer,
      MutationOptions options) -> Result<MutationPass>;

  // For callers that already hold the marker type handle.
  MutationPass(
      const il::TypeDef* marker_type, const analysis::ProvenanceTracer& tracer,
      MutationOptions options);

  [[nodiscard]] auto Run(il::Procedure& procedure) const -> Result<void>;

  // Same as Run, also reporting how many markers were resolved.
  [[nodiscard]] auto RunWithStats(il::Procedure& procedure) const
      -> Result<PassStats>;

  [[nodiscard]] auto Catalog() const -> const MarkerCatalog& {
    return catalog_;
  }

  [[nodiscard]] auto Options() const -> const MutationOptions& {
    return options_;
  }

 private:
  MarkerCatalog catalog_;
  const analysis::ProvenanceTracer* tracer_;
  MutationOptions options_;
};

}  // namespace mutator::mutation
