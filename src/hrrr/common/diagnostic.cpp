#include "hrrr/common/diagnostic.hpp"

#include <iterator>
#include <string>

#include <fmt/format.h>

namespace hrrr {

auto ToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kRange:
      return "range error";
    case DiagKind::kCycleBound:
      return "cycle bound error";
    case DiagKind::kInvalidEnum:
      return "invalid value";
    case DiagKind::kTemplateParse:
      return "template parse error";
    case DiagKind::kMissingTemplate:
      return "missing template inventory";
    case DiagKind::kHostError:
      return "host error";
  }
  return "unknown";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out;
  fmt::format_to(
      std::back_inserter(out), "{}: {}", ToString(diag.primary.kind),
      diag.primary.message);
  for (const auto& note : diag.notes) {
    fmt::format_to(std::back_inserter(out), "\n  note: {}", note);
  }
  return out;
}

}  // namespace hrrr
