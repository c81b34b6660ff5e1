#include "print.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/diagnostic/diagnostic_sink.hpp"

namespace fnt::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  std::string message = item.message;
  if (item.code) {
    message += fmt::format(" [{}]", ToString(*item.code));
  }
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("finite", kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("finite", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : sink.GetDiagnostics()) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }
    PrintDiagnostic(diag);
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace fnt::driver
