#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "wapps/common/diagnostic.hpp"

namespace wapps::driver {

namespace {

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kFormatError:
    case DiagKind::kLinkError:
    case DiagKind::kTrap:
    case DiagKind::kPresentation:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintItem(const DiagItem& item, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("wapps", kToolStyle),
      fmt::styled(
          std::string(DiagKindLabel(item.kind)) + ":",
          DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("wapps", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("wapps", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintItem(note, false);
  }
}

}  // namespace wapps::driver
