#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "hrrr/common/diagnostic.hpp"

namespace hrrr {

// Parsed shapes of a forecast_valid template. Each shape is searched for
// anywhere in the text; matching is ordered and the first shape found wins.

// "analysis"
struct AnalysisTemplate {
  auto operator==(const AnalysisTemplate&) const -> bool = default;
};

// "<N> <unit> fcst"
struct InstantTemplate {
  std::int64_t value;
  std::string unit;

  auto operator==(const InstantTemplate&) const -> bool = default;
};

// "<N1>-<N2> <unit> <stat>"
struct IntervalTemplate {
  // Start bound as written; the hour branch compares the literal text.
  std::string start_text;
  std::int64_t start;
  std::int64_t end;
  std::string unit;
  std::string stat;

  auto operator==(const IntervalTemplate&) const -> bool = default;
};

using ForecastValidTemplate =
    std::variant<AnalysisTemplate, InstantTemplate, IntervalTemplate>;

// Fails with kTemplateParse naming the template text when no shape matches,
// or when a matched number is too large to offset safely.
auto MatchForecastValidTemplate(std::string_view text)
    -> Result<ForecastValidTemplate>;

// Concrete time window of an interval layer at one forecast hour.
struct IntervalWindow {
  std::int64_t start;
  std::int64_t end;
  std::string unit;
  std::string stat;

  auto operator==(const IntervalWindow&) const -> bool = default;
};

// Minute templates are authored against forecast hour 2 and shift by 60
// minutes per hour. Hour templates end at the forecast hour and start one
// hour earlier (N1 == "1") or at 0.
auto ComputeIntervalWindow(const IntervalTemplate& tmpl, int forecast_hour)
    -> IntervalWindow;

// Whole-day forecast hours are re-expressed as "0-<days> day". Minute
// windows are left alone.
auto ApplyDayOverride(IntervalWindow window, int forecast_hour)
    -> IntervalWindow;

auto FormatIntervalWindow(const IntervalWindow& window) -> std::string;

// Valid-time text of a matched template at forecast_hour.
auto ResolveForecastValid(const ForecastValidTemplate& tmpl, int forecast_hour)
    -> std::string;

}  // namespace hrrr
