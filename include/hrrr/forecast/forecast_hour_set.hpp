#pragma once

#include <array>
#include <cstdint>
#include <ranges>
#include <span>
#include <string_view>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/common/enum_table.hpp"
#include "hrrr/domain/product.hpp"

namespace hrrr {

inline constexpr int kMinForecastHour = 0;
inline constexpr int kMaxForecastHour = 48;

// Named partition of forecast hours sharing one layer inventory shape.
// Sub-hourly output splits at {0}/{1..18}; every other product splits at
// {0,1}/{2..48}.
enum class ForecastHourSet : uint8_t {
  kFh00,
  kFh01To18,
  kFh00To01,
  kFh02To48,
};

inline constexpr std::array kAllForecastHourSets = {
    ForecastHourSet::kFh00, ForecastHourSet::kFh01To18,
    ForecastHourSet::kFh00To01, ForecastHourSet::kFh02To48};

inline constexpr std::array kForecastHourSetNames =
    std::to_array<common::EnumName<ForecastHourSet>>({
        {.value = ForecastHourSet::kFh00, .name = "fh00"},
        {.value = ForecastHourSet::kFh01To18, .name = "fh01-18"},
        {.value = ForecastHourSet::kFh00To01, .name = "fh00-01"},
        {.value = ForecastHourSet::kFh02To48, .name = "fh02-48"},
    });

auto ToString(ForecastHourSet set) -> std::string_view;
auto ParseForecastHourSet(std::string_view name) -> Result<ForecastHourSet>;

// Inclusive integer range of forecast hours.
struct ForecastHourRange {
  int first;
  int last;

  auto operator==(const ForecastHourRange&) const -> bool = default;
};

// Decodes the compact "fhNN" / "fhNN-MM" notation.
auto ParseForecastHourRange(std::string_view notation)
    -> Result<ForecastHourRange>;

auto RangeOf(ForecastHourSet set) -> ForecastHourRange;

// Lazy, restartable sequence of the set's member hours.
inline auto ForecastHours(ForecastHourSet set) {
  auto range = RangeOf(set);
  return std::views::iota(range.first, range.last + 1);
}

// Fails with kRange unless hour is in [0, 48].
auto CheckForecastHour(int forecast_hour) -> Result<void>;

// Picks the partition forecast_hour belongs to for the given product.
auto SelectForecastHourSet(int forecast_hour, Product product)
    -> Result<ForecastHourSet>;

// Legal sets per product: {fh00, fh01-18} for sub-hourly,
// {fh00-01, fh02-48} for everything else.
auto ForecastHourSetsFor(Product product) -> std::span<const ForecastHourSet>;

auto IsLegalForecastHourSet(Product product, ForecastHourSet set) -> bool;

}  // namespace hrrr
