#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fnt {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed model declaration
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Category of model error (only valid when kind == kError)
enum class ErrorCode : uint8_t {
  kMalformedArc,          // Arc does not connect a place and a transition
  kUnresolvedReference,   // Name or handle unknown to this model
  kUnboundVariable,       // Variable never given a value function
  kAlreadyFrozen,         // Structural declaration after freeze
  kNotFrozen,             // Operation requires a frozen model
  kOverlayUnavailable,    // Imported models carry no overlay
};

// Stable kebab-case name, e.g. "malformed-arc".
auto ToString(ErrorCode code) -> std::string_view;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;
  std::optional<ErrorCode> code;  // has_value() iff kind == kError

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: model declaration or compile error
  static auto Error(ErrorCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: host error (I/O, malformed file or payload)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
            .code = std::nullopt,
        });
    return std::move(*this);
  }

  [[nodiscard]] auto Code() const -> std::optional<ErrorCode> {
    return primary.code;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace fnt
