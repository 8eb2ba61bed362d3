#include "hrrr/catalog/forecast_request.hpp"

#include <chrono>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "hrrr/forecast/forecast_hour_set.hpp"

namespace hrrr {

auto ValidateForecastRequest(const ForecastRequest& request)
    -> Result<ForecastCycleType> {
  if (auto check = CheckForecastHour(request.forecast_hour); !check) {
    return std::unexpected(check.error());
  }

  int cycle_hour = UtcHour(request.reference_time);
  if (!GetRegionConfig(request.region).RunsCycleAt(cycle_hour)) {
    return std::unexpected(
        Diagnostic::CycleBound(
            fmt::format(
                "region {} has no forecast cycle starting at {:02}Z",
                ToString(request.region), cycle_hour)));
  }

  auto start = DataStartDate(request.cloud_provider);
  if (request.reference_time < start) {
    return std::unexpected(
        Diagnostic::Range(
            fmt::format(
                "{} has no data before {:%Y-%m-%d}",
                ToString(request.cloud_provider),
                fmt::gmtime(std::chrono::system_clock::to_time_t(start)))));
  }

  auto cycle_type = ForecastCycleType::FromTimestamp(request.reference_time);
  if (auto check = cycle_type.ValidateForecastHour(request.forecast_hour);
      !check) {
    return std::unexpected(check.error());
  }
  return cycle_type;
}

}  // namespace hrrr
