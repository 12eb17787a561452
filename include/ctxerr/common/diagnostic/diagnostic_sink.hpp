#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "ctxerr/common/diagnostic/diagnostic.hpp"

namespace ctxerr {

// Collects diagnostics across the items of one driver run. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      ++error_count_;
    }
    diagnostics_.push_back(std::move(diag));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return error_count_ > 0;
  }

  [[nodiscard]] auto ErrorCount() const -> std::size_t {
    return error_count_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  std::size_t error_count_ = 0;
};

}  // namespace ctxerr
