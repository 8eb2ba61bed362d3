#include "hrrr/domain/cloud_provider.hpp"

#include <chrono>
#include <string_view>

#include "hrrr/common/internal_error.hpp"

namespace hrrr {

auto ToString(CloudProvider provider) -> std::string_view {
  return common::EnumToString(
      kCloudProviderNames, provider, "ToString(CloudProvider)");
}

auto ParseCloudProvider(std::string_view name) -> Result<CloudProvider> {
  return common::ParseEnum(kCloudProviderNames, name);
}

auto DataStartDate(CloudProvider provider) -> std::chrono::sys_days {
  using std::chrono::July;
  using std::chrono::March;
  using std::chrono::year;

  switch (provider) {
    case CloudProvider::kAzure:
      return year{2021} / March / 21;
    case CloudProvider::kAws:
    case CloudProvider::kGoogle:
      return year{2014} / July / 30;
  }
  common::ThrowInternalError("DataStartDate", "unknown cloud provider");
}

}  // namespace hrrr
