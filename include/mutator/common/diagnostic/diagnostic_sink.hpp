#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "mutator/common/diagnostic/diagnostic.hpp"

namespace mutator {

// Accumulates diagnostics where reporting continues past the first error
// (the pass itself stops at the first one). Reporting order is preserved.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kConfigError:
      case DiagKind::kHostError:
        ++error_count_;
        break;
      case DiagKind::kWarning:
        ++warning_count_;
        break;
      case DiagKind::kNote:
        break;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(ErrorCode code, InstrLocation loc, std::string msg) {
    Report(Diagnostic::Error(code, std::move(loc), std::move(msg)));
  }

  void Warning(InstrLocation loc, std::string msg) {
    Report(Diagnostic::Warning(std::move(loc), std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return error_count_ > 0;
  }

  [[nodiscard]] auto ErrorCount() const -> size_t {
    return error_count_;
  }

  [[nodiscard]] auto WarningCount() const -> size_t {
    return warning_count_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  size_t error_count_ = 0;
  size_t warning_count_ = 0;
};

}  // namespace mutator
