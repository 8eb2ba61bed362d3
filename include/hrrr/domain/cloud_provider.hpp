#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/common/enum_table.hpp"

namespace hrrr {

// Cloud storage provider hosting a copy of the archive.
enum class CloudProvider : uint8_t {
  kAzure,
  kAws,
  kGoogle,
};

inline constexpr std::array kAllCloudProviders = {
    CloudProvider::kAzure, CloudProvider::kAws, CloudProvider::kGoogle};

inline constexpr std::array kCloudProviderNames =
    std::to_array<common::EnumName<CloudProvider>>({
        {.value = CloudProvider::kAzure, .name = "azure"},
        {.value = CloudProvider::kAws, .name = "aws"},
        {.value = CloudProvider::kGoogle, .name = "google"},
    });

auto ToString(CloudProvider provider) -> std::string_view;
auto ParseCloudProvider(std::string_view name) -> Result<CloudProvider>;

// Earliest reference date archived by the provider. Each provider's copy
// starts on a different day.
auto DataStartDate(CloudProvider provider) -> std::chrono::sys_days;

}  // namespace hrrr
