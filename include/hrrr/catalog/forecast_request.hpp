#pragma once

#include <chrono>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/domain/cloud_provider.hpp"
#include "hrrr/domain/product.hpp"
#include "hrrr/domain/region.hpp"
#include "hrrr/forecast/forecast_cycle_type.hpp"

namespace hrrr {

// A request for the catalog entry of one forecast hour of one model run.
struct ForecastRequest {
  Region region;
  Product product;
  CloudProvider cloud_provider;
  std::chrono::sys_seconds reference_time;
  int forecast_hour;
};

// Checks, in order:
//  1. forecast_hour is within [0, 48]                         (kRange)
//  2. the region starts a cycle at the reference hour         (kCycleBound)
//  3. the provider archives data from the reference date on   (kRange)
//  4. forecast_hour is legal for the run's cycle type         (kCycleBound)
// Returns the classified cycle type of the run.
auto ValidateForecastRequest(const ForecastRequest& request)
    -> Result<ForecastCycleType>;

}  // namespace hrrr
