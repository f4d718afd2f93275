#include "wapps/common/diagnostic.hpp"

#include <string>

#include <fmt/core.h>

namespace wapps {

auto DiagKindLabel(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kFormatError:
      return "format error";
    case DiagKind::kLinkError:
      return "link error";
    case DiagKind::kTrap:
      return "trap";
    case DiagKind::kPresentation:
      return "presentation error";
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}: {}", DiagKindLabel(diag.primary.kind), diag.primary.message);
  for (const auto& note : diag.notes) {
    out += fmt::format("\n  {}: {}", DiagKindLabel(note.kind), note.message);
  }
  return out;
}

}  // namespace wapps
