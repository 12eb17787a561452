#pragma once

#include <string>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/diagnostic/diagnostic_sink.hpp"
#include "ctxerr/common/source_manager.hpp"

namespace ctxerr::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* sources);

}  // namespace ctxerr::driver
