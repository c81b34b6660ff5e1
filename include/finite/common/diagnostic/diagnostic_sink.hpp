#pragma once

#include <vector>

#include "finite/common/diagnostic/diagnostic.hpp"

namespace fnt {

// Collects diagnostics while loading a model description. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(ErrorCode code, std::string msg) {
    Report(Diagnostic::Error(code, std::move(msg)));
  }

  void HostError(std::string msg) {
    Report(Diagnostic::HostError(std::move(msg)));
  }

  void Warning(std::string msg) {
    Report(Diagnostic::Warning(std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace fnt
