#include "hrrr/inventory/cycle_run_config.hpp"

#include <map>
#include <span>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace hrrr {

CycleRunConfig::CycleRunConfig(
    Region region, Product product, ForecastHourSet forecast_hour_set,
    const TemplateRegistry& registry)
    : key_{.region = region,
           .product = product,
           .forecast_hour_set = forecast_hour_set} {
  const auto& templates = registry.At(key_);

  for (int forecast_hour : ForecastHours(forecast_hour_set)) {
    std::vector<Variable> variables;
    variables.reserve(templates.size());
    for (const auto& entry : templates) {
      auto variable = ExpandVariable(entry, forecast_hour);
      if (!variable) {
        throw DiagnosticException(
            std::move(variable.error())
                .WithNote(
                    fmt::format(
                        "while expanding row {} of {} at forecast hour {}",
                        entry.row_number, InventoryFileName(key_),
                        forecast_hour)));
      }
      variables.push_back(*std::move(variable));
    }
    inventory_.emplace(forecast_hour, std::move(variables));
  }

  spdlog::debug(
      "built cycle run config {} with {} forecast hours x {} layers",
      ToString(key_), inventory_.size(), templates.size());
}

auto CycleRunConfig::VariablesAt(int forecast_hour) const
    -> Result<std::span<const Variable>> {
  auto it = inventory_.find(forecast_hour);
  if (it == inventory_.end()) {
    return std::unexpected(
        Diagnostic::Range(
            fmt::format(
                "forecast hour {} is not part of forecast hour set {}",
                forecast_hour, ToString(key_.forecast_hour_set))));
  }
  return std::span<const Variable>(it->second);
}

auto InventoryFor(
    const TemplateRegistry& registry, Region region, Product product,
    int forecast_hour) -> Result<std::vector<Variable>> {
  auto set = SelectForecastHourSet(forecast_hour, product);
  if (!set) {
    return std::unexpected(set.error());
  }

  try {
    CycleRunConfig config(region, product, *set, registry);
    auto variables = config.VariablesAt(forecast_hour);
    if (!variables) {
      return std::unexpected(variables.error());
    }
    return std::vector<Variable>(variables->begin(), variables->end());
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

}  // namespace hrrr
