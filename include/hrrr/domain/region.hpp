#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/common/enum_table.hpp"

namespace hrrr {

// Model domain of an HRRR run.
enum class Region : uint8_t {
  kConus,
  kAlaska,
};

inline constexpr std::array kAllRegions = {Region::kConus, Region::kAlaska};

inline constexpr std::array kRegionNames =
    std::to_array<common::EnumName<Region>>({
        {.value = Region::kConus, .name = "conus"},
        {.value = Region::kAlaska, .name = "alaska"},
    });

auto ToString(Region region) -> std::string_view;
auto ParseRegion(std::string_view name) -> Result<Region>;

// Per-region run schedule. Projection and footprint live with the catalog
// assembly layer and are not modeled here.
struct RegionConfig {
  // Model identifier used by upstream archive tooling ("hrrr", "hrrrak").
  std::string_view model_id;
  // UTC hours at which the region's model cycle is started.
  std::vector<int> cycle_run_hours;

  [[nodiscard]] auto RunsCycleAt(int hour) const -> bool {
    return std::ranges::find(cycle_run_hours, hour) != cycle_run_hours.end();
  }
};

// CONUS runs every hour; Alaska every third hour.
auto GetRegionConfig(Region region) -> const RegionConfig&;

}  // namespace hrrr
