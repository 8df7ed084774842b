#pragma once

#include <string>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/diagnostic/diagnostic_sink.hpp"

namespace mutator::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace mutator::driver
