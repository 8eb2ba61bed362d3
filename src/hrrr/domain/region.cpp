#include "hrrr/domain/region.hpp"

#include <string_view>
#include <vector>

#include "hrrr/common/internal_error.hpp"

namespace hrrr {

namespace {

auto EveryNthHour(int step) -> std::vector<int> {
  std::vector<int> hours;
  for (int hour = 0; hour < 24; hour += step) {
    hours.push_back(hour);
  }
  return hours;
}

}  // namespace

auto ToString(Region region) -> std::string_view {
  return common::EnumToString(kRegionNames, region, "ToString(Region)");
}

auto ParseRegion(std::string_view name) -> Result<Region> {
  return common::ParseEnum(kRegionNames, name);
}

auto GetRegionConfig(Region region) -> const RegionConfig& {
  static const RegionConfig kConus{
      .model_id = "hrrr", .cycle_run_hours = EveryNthHour(1)};
  static const RegionConfig kAlaska{
      .model_id = "hrrrak", .cycle_run_hours = EveryNthHour(3)};

  switch (region) {
    case Region::kConus:
      return kConus;
    case Region::kAlaska:
      return kAlaska;
  }
  common::ThrowInternalError("GetRegionConfig", "unknown region");
}

}  // namespace hrrr
