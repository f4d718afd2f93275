#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace wapps {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kFormatError,   // Malformed package or payload bytes
  kLinkError,     // Guest needs something the host does not provide
  kTrap,          // Guest aborted inside a call
  kPresentation,  // Frame descriptor does not fit guest memory
  kHostError,     // I/O, configuration
  kWarning,       // Non-fatal
  kNote,          // Auxiliary message
};

struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto FormatError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kFormatError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto LinkError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kLinkError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Trap(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kTrap, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Presentation(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kPresentation, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: I/O or configuration problem
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kWarning, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
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

// Short lowercase label for a kind ("error", "trap", ...).
auto DiagKindLabel(DiagKind kind) -> const char*;

// One-line rendering: "<label>: <message>" followed by notes, newline
// separated. Used by logs and tests; the CLI prints with colours instead.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace wapps
