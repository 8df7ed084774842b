#include "print.hpp"

#include <cstddef>
#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/diagnostic/diagnostic_sink.hpp"

namespace mutator::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
      return "error:";
    case DiagKind::kConfigError:
      return "config error:";
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
    case DiagKind::kConfigError:
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
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  std::string location = FormatLocation(item.location);
  if (location.empty()) {
    location = "mutator";
  }

  std::string message = item.message;
  if (item.code) {
    message += fmt::format(" [{}]", ToString(*item.code));
  }

  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled(location, is_primary ? kToolStyle : fmt::text_style{}),
      fmt::styled(kind_str, kind_style),
      fmt::styled(
          message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("mutator", kToolStyle),
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
  for (const auto& diag : sink.GetDiagnostics()) {
    PrintDiagnostic(diag);
  }

  size_t errors = sink.ErrorCount();
  size_t warnings = sink.WarningCount();
  if (errors == 0 && warnings == 0) {
    return;
  }
  std::string summary;
  if (warnings > 0) {
    summary += fmt::format("{} warning{}", warnings, warnings == 1 ? "" : "s");
  }
  if (warnings > 0 && errors > 0) {
    summary += " and ";
  }
  if (errors > 0) {
    summary += fmt::format("{} error{}", errors, errors == 1 ? "" : "s");
  }
  fmt::print(stderr, "{} generated.\n", summary);
}

}  // namespace mutator::driver
