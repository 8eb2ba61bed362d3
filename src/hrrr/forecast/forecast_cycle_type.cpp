#include "hrrr/forecast/forecast_cycle_type.hpp"

#include <chrono>
#include <string_view>

#include <fmt/core.h>

namespace hrrr {

auto UtcHour(std::chrono::sys_seconds reference_time) -> int {
  auto day = std::chrono::floor<std::chrono::days>(reference_time);
  std::chrono::hh_mm_ss time_of_day{reference_time - day};
  return static_cast<int>(time_of_day.hours().count());
}

auto ForecastCycleType::FromName(std::string_view name)
    -> Result<ForecastCycleType> {
  if (name == "standard") {
    return ForecastCycleType(Kind::kStandard);
  }
  if (name == "extended") {
    return ForecastCycleType(Kind::kExtended);
  }
  return std::unexpected(
      Diagnostic::InvalidEnum(
          fmt::format("Invalid forecast cycle type: {}", name)));
}

auto ForecastCycleType::FromCycleHour(int hour) -> Result<ForecastCycleType> {
  if (hour < 0 || hour > 23) {
    return std::unexpected(
        Diagnostic::Range(
            fmt::format("cycle hour {} must be within 0-23", hour)));
  }
  return ForecastCycleType(hour % 6 == 0 ? Kind::kExtended : Kind::kStandard);
}

auto ForecastCycleType::FromTimestamp(std::chrono::sys_seconds reference_time)
    -> ForecastCycleType {
  int hour = UtcHour(reference_time);
  return ForecastCycleType(hour % 6 == 0 ? Kind::kExtended : Kind::kStandard);
}

auto ForecastCycleType::ValidateForecastHour(int forecast_hour) const
    -> Result<void> {
  if (forecast_hour < 0 || forecast_hour > MaxForecastHour()) {
    return std::unexpected(
        Diagnostic::CycleBound(
            fmt::format(
                "The provided forecast_hour ({}) is not compatible with the "
                "forecast cycle type ({})",
                forecast_hour, Name())));
  }
  return {};
}

}  // namespace hrrr
