#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace hrrr {

// Kind of failure. Each kind is a distinct, deterministic failure; none of
// them is retried by the library.
enum class DiagKind : uint8_t {
  kRange,            // Forecast hour outside [0, 48]
  kCycleBound,       // Forecast hour past the cycle type's maximum
  kInvalidEnum,      // String outside a closed enumeration
  kTemplateParse,    // forecast_valid template matches no known shape
  kMissingTemplate,  // No template inventory registered for a key
  kHostError,        // I/O, malformed packaged data or config
};

auto ToString(DiagKind kind) -> const char*;

struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  static auto Make(DiagKind kind, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = kind, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Range(std::string msg) -> Diagnostic {
    return Make(DiagKind::kRange, std::move(msg));
  }

  static auto CycleBound(std::string msg) -> Diagnostic {
    return Make(DiagKind::kCycleBound, std::move(msg));
  }

  static auto InvalidEnum(std::string msg) -> Diagnostic {
    return Make(DiagKind::kInvalidEnum, std::move(msg));
  }

  static auto TemplateParse(std::string msg) -> Diagnostic {
    return Make(DiagKind::kTemplateParse, std::move(msg));
  }

  static auto MissingTemplate(std::string msg) -> Diagnostic {
    return Make(DiagKind::kMissingTemplate, std::move(msg));
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, std::move(msg));
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

// Renders "<kind>: <message>" followed by one "  note: ..." line per note.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

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

}  // namespace hrrr
