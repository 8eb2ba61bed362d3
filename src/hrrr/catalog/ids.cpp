#include "hrrr/catalog/ids.hpp"

#include <chrono>
#include <string>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace hrrr {

auto FormatItemId(
    Region region, Product product, std::chrono::sys_seconds reference_time,
    int forecast_hour) -> std::string {
  // Reference times are UTC; format through gmtime, not the local zone.
  auto utc = fmt::gmtime(std::chrono::system_clock::to_time_t(reference_time));
  return fmt::format(
      "hrrr-{}-{}-{:%Y-%m-%dT%H}-FH{}", ToString(region), ToString(product),
      utc, forecast_hour);
}

auto FormatCollectionId(
    Region region, Product product, ForecastHourSet forecast_hour_set)
    -> std::string {
  return fmt::format(
      "{}-{}-{}-{}", kCollectionIdBase, ToString(region), ToString(product),
      ToString(forecast_hour_set));
}

}  // namespace hrrr
