#include "hrrr/inventory/variable.hpp"

#include <utility>

#include "hrrr/forecast/forecast_hour_set.hpp"
#include "hrrr/inventory/forecast_valid.hpp"

namespace hrrr {

auto ExpandVariable(const TemplateEntry& entry, int forecast_hour)
    -> Result<Variable> {
  if (auto check = CheckForecastHour(forecast_hour); !check) {
    return std::unexpected(check.error());
  }

  auto tmpl = MatchForecastValidTemplate(entry.forecast_valid_template);
  if (!tmpl) {
    return std::unexpected(std::move(tmpl.error()));
  }

  return Variable{
      .row_number = entry.row_number,
      .level_layer = entry.level_layer,
      .parameter = entry.parameter,
      .forecast_valid = ResolveForecastValid(*tmpl, forecast_hour),
      .description = entry.description,
  };
}

}  // namespace hrrr
