#pragma once

#include <chrono>
#include <string>

#include "hrrr/domain/product.hpp"
#include "hrrr/domain/region.hpp"
#include "hrrr/forecast/forecast_hour_set.hpp"

namespace hrrr {

inline constexpr const char* kCollectionIdBase = "noaa-hrrr";

// hrrr-{region}-{product}-{YYYY-MM-DDTHH}-FH{forecast_hour}
auto FormatItemId(
    Region region, Product product, std::chrono::sys_seconds reference_time,
    int forecast_hour) -> std::string;

// noaa-hrrr-{region}-{product}-{forecast_hour_set}
auto FormatCollectionId(
    Region region, Product product, ForecastHourSet forecast_hour_set)
    -> std::string;

}  // namespace hrrr
