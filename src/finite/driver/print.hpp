#pragma once

#include <string>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/diagnostic/diagnostic_sink.hpp"

namespace fnt::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// Prints every collected diagnostic followed by a "N warnings and M errors
// generated." summary line when there is anything to report.
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace fnt::driver
