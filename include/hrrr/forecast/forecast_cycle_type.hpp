#pragma once

#include <chrono>
#include <cstdint>
#include <ranges>
#include <string_view>

#include "hrrr/common/diagnostic.hpp"

namespace hrrr {

inline constexpr int kStandardForecastMaxHour = 18;
inline constexpr int kExtendedForecastMaxHour = 48;

// Hour of day, in UTC, at which a run with this reference time started.
auto UtcHour(std::chrono::sys_seconds reference_time) -> int;

// Classification of a model run by its start hour. Extended cycles start
// every six hours (00, 06, 12, 18 UTC) and forecast out to 48 hours; every
// other cycle is standard and forecasts out to 18 hours.
class ForecastCycleType {
 public:
  enum class Kind : uint8_t {
    kStandard,
    kExtended,
  };

  // Accepts "standard" or "extended"; anything else is kInvalidEnum.
  static auto FromName(std::string_view name) -> Result<ForecastCycleType>;

  // Classifies a cycle start hour in [0, 23].
  static auto FromCycleHour(int hour) -> Result<ForecastCycleType>;

  // Classifies by the UTC hour of the run's reference time.
  static auto FromTimestamp(std::chrono::sys_seconds reference_time)
      -> ForecastCycleType;

  [[nodiscard]] auto GetKind() const -> Kind {
    return kind_;
  }
  [[nodiscard]] auto IsExtended() const -> bool {
    return kind_ == Kind::kExtended;
  }
  [[nodiscard]] auto MaxForecastHour() const -> int {
    return IsExtended() ? kExtendedForecastMaxHour : kStandardForecastMaxHour;
  }
  [[nodiscard]] auto Name() const -> std::string_view {
    return IsExtended() ? "extended" : "standard";
  }

  // Forecast hours produced by a run of this type: 1..MaxForecastHour().
  [[nodiscard]] auto ForecastHours() const {
    return std::views::iota(1, MaxForecastHour() + 1);
  }

  // Fails with kCycleBound unless 0 <= forecast_hour <= MaxForecastHour().
  [[nodiscard]] auto ValidateForecastHour(int forecast_hour) const
      -> Result<void>;

  auto operator==(const ForecastCycleType&) const -> bool = default;

 private:
  explicit ForecastCycleType(Kind kind) : kind_(kind) {
  }

  Kind kind_;
};

}  // namespace hrrr
