#include "hrrr/inventory/forecast_valid.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "hrrr/common/overloaded.hpp"

namespace hrrr {

namespace {

constexpr std::string_view kMinuteUnit = "min";
constexpr std::string_view kHourUnit = "hour";
constexpr std::string_view kDayUnit = "day";
constexpr int kMinutesPerHour = 60;
constexpr int kHoursPerDay = 24;

// Reference forecast hours the minute-based templates were authored at.
constexpr int kInstantReferenceHour = 1;
constexpr int kIntervalReferenceHour = 2;

// Leaves headroom for the minute offset of any int forecast hour.
constexpr std::int64_t kMaxTemplateNumber =
    std::numeric_limits<std::int64_t>::max() / 2;

// Either no match (nullopt) or a matched shape whose numbers are usable.
using MatchResult = Result<std::optional<ForecastValidTemplate>>;

auto ParseTemplateNumber(const std::ssub_match& group, const std::string& text)
    -> Result<std::int64_t> {
  std::string digits = group.str();
  std::int64_t value = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() ||
      value > kMaxTemplateNumber) {
    return std::unexpected(
        Diagnostic::TemplateParse(
            fmt::format(
                "{} could not be parsed into a forecast_valid string", text))
            .WithNote(fmt::format("'{}' is out of range", digits)));
  }
  return value;
}

auto MatchAnalysis(const std::string& text) -> MatchResult {
  if (text == "analysis") {
    return AnalysisTemplate{};
  }
  return std::nullopt;
}

auto MatchInstant(const std::string& text) -> MatchResult {
  static const std::regex kPattern(R"((\d+) (.*) fcst)");
  std::smatch match;
  if (!std::regex_search(text, match, kPattern)) {
    return std::nullopt;
  }
  auto value = ParseTemplateNumber(match[1], text);
  if (!value) {
    return std::unexpected(value.error());
  }
  return InstantTemplate{.value = *value, .unit = match[2].str()};
}

auto MatchInterval(const std::string& text) -> MatchResult {
  static const std::regex kPattern(R"((\d+)-(\d+) (\w+) (.*))");
  std::smatch match;
  if (!std::regex_search(text, match, kPattern)) {
    return std::nullopt;
  }
  auto start = ParseTemplateNumber(match[1], text);
  if (!start) {
    return std::unexpected(start.error());
  }
  auto end = ParseTemplateNumber(match[2], text);
  if (!end) {
    return std::unexpected(end.error());
  }
  return IntervalTemplate{
      .start_text = match[1].str(),
      .start = *start,
      .end = *end,
      .unit = match[3].str(),
      .stat = match[4].str(),
  };
}

using Matcher = auto (*)(const std::string&) -> MatchResult;

// Order matters: first match wins.
constexpr std::array<Matcher, 3> kMatchers = {
    MatchAnalysis, MatchInstant, MatchInterval};

auto MinuteOffset(int forecast_hour, int reference_hour) -> std::int64_t {
  return (std::int64_t{forecast_hour} - reference_hour) * kMinutesPerHour;
}

auto ResolveInstant(const InstantTemplate& tmpl, int forecast_hour)
    -> std::string {
  if (tmpl.unit == kMinuteUnit) {
    std::int64_t minutes =
        tmpl.value + MinuteOffset(forecast_hour, kInstantReferenceHour);
    return fmt::format("{} {} fcst", minutes, tmpl.unit);
  }
  // The template's number only marks the shape; the live hour replaces it.
  return fmt::format("{} {} fcst", forecast_hour, tmpl.unit);
}

}  // namespace

auto MatchForecastValidTemplate(std::string_view text)
    -> Result<ForecastValidTemplate> {
  std::string owned(text);
  for (auto matcher : kMatchers) {
    auto matched = matcher(owned);
    if (!matched) {
      return std::unexpected(std::move(matched.error()));
    }
    if (*matched) {
      return **std::move(matched);
    }
  }
  return std::unexpected(
      Diagnostic::TemplateParse(
          fmt::format(
              "{} could not be parsed into a forecast_valid string", text)));
}

auto ComputeIntervalWindow(const IntervalTemplate& tmpl, int forecast_hour)
    -> IntervalWindow {
  if (tmpl.unit == kMinuteUnit) {
    std::int64_t offset = MinuteOffset(forecast_hour, kIntervalReferenceHour);
    return IntervalWindow{
        .start = tmpl.start + offset,
        .end = tmpl.end + offset,
        .unit = tmpl.unit,
        .stat = tmpl.stat,
    };
  }
  return IntervalWindow{
      .start = tmpl.start_text == "1" ? std::int64_t{forecast_hour} - 1 : 0,
      .end = forecast_hour,
      .unit = std::string(kHourUnit),
      .stat = tmpl.stat,
  };
}

auto ApplyDayOverride(IntervalWindow window, int forecast_hour)
    -> IntervalWindow {
  if (window.unit != kHourUnit || forecast_hour % kHoursPerDay != 0) {
    return window;
  }
  window.start = 0;
  window.end = forecast_hour / kHoursPerDay;
  window.unit = std::string(kDayUnit);
  return window;
}

auto FormatIntervalWindow(const IntervalWindow& window) -> std::string {
  return fmt::format(
      "{}-{} {} {}", window.start, window.end, window.unit, window.stat);
}

auto ResolveForecastValid(const ForecastValidTemplate& tmpl, int forecast_hour)
    -> std::string {
  return std::visit(
      common::Overloaded{
          [&](const AnalysisTemplate&) -> std::string {
            if (forecast_hour == 0) {
              return "analysis";
            }
            return fmt::format("{} hour fcst", forecast_hour);
          },
          [&](const InstantTemplate& instant) -> std::string {
            return ResolveInstant(instant, forecast_hour);
          },
          [&](const IntervalTemplate& interval) -> std::string {
            return FormatIntervalWindow(
                ApplyDayOverride(
                    ComputeIntervalWindow(interval, forecast_hour),
                    forecast_hour));
          },
      },
      tmpl);
}

}  // namespace hrrr
