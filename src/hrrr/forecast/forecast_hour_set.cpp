#include "hrrr/forecast/forecast_hour_set.hpp"

#include <array>
#include <charconv>
#include <span>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include "hrrr/common/internal_error.hpp"

namespace hrrr {

namespace {

constexpr std::array kSubHourlySets = {
    ForecastHourSet::kFh00, ForecastHourSet::kFh01To18};
constexpr std::array kHourlySets = {
    ForecastHourSet::kFh00To01, ForecastHourSet::kFh02To48};

auto ParseHour(std::string_view text) -> Result<int> {
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::unexpected(
        Diagnostic::InvalidEnum(
            fmt::format("'{}' is not a forecast hour", text)));
  }
  return value;
}

}  // namespace

auto ToString(ForecastHourSet set) -> std::string_view {
  return common::EnumToString(
      kForecastHourSetNames, set, "ToString(ForecastHourSet)");
}

auto ParseForecastHourSet(std::string_view name) -> Result<ForecastHourSet> {
  return common::ParseEnum(kForecastHourSetNames, name);
}

auto ParseForecastHourRange(std::string_view notation)
    -> Result<ForecastHourRange> {
  constexpr std::string_view kPrefix = "fh";
  if (!notation.starts_with(kPrefix)) {
    return std::unexpected(
        Diagnostic::InvalidEnum(
            fmt::format("Could not parse value from string: {}", notation)));
  }
  std::string_view body = notation.substr(kPrefix.size());

  auto dash = body.find('-');
  auto first = ParseHour(body.substr(0, dash));
  if (!first) {
    return std::unexpected(first.error());
  }
  if (dash == std::string_view::npos) {
    return ForecastHourRange{.first = *first, .last = *first};
  }

  auto last = ParseHour(body.substr(dash + 1));
  if (!last) {
    return std::unexpected(last.error());
  }
  if (*last < *first) {
    return std::unexpected(
        Diagnostic::InvalidEnum(
            fmt::format("'{}' is an empty forecast hour range", notation)));
  }
  return ForecastHourRange{.first = *first, .last = *last};
}

auto RangeOf(ForecastHourSet set) -> ForecastHourRange {
  auto range = ParseForecastHourRange(ToString(set));
  if (!range) {
    common::ThrowInternalError("RangeOf", range.error().Message());
  }
  return *range;
}

auto CheckForecastHour(int forecast_hour) -> Result<void> {
  if (forecast_hour < kMinForecastHour || forecast_hour > kMaxForecastHour) {
    return std::unexpected(
        Diagnostic::Range(
            fmt::format(
                "forecast hour {} must be within {}-{}", forecast_hour,
                kMinForecastHour, kMaxForecastHour)));
  }
  return {};
}

auto SelectForecastHourSet(int forecast_hour, Product product)
    -> Result<ForecastHourSet> {
  if (auto check = CheckForecastHour(forecast_hour); !check) {
    return std::unexpected(check.error());
  }
  if (product == Product::kSubHourly) {
    return forecast_hour == 0 ? ForecastHourSet::kFh00
                              : ForecastHourSet::kFh01To18;
  }
  return forecast_hour < 2 ? ForecastHourSet::kFh00To01
                           : ForecastHourSet::kFh02To48;
}

auto ForecastHourSetsFor(Product product) -> std::span<const ForecastHourSet> {
  if (product == Product::kSubHourly) {
    return kSubHourlySets;
  }
  return kHourlySets;
}

auto IsLegalForecastHourSet(Product product, ForecastHourSet set) -> bool {
  for (auto legal : ForecastHourSetsFor(product)) {
    if (legal == set) {
      return true;
    }
  }
  return false;
}

}  // namespace hrrr
