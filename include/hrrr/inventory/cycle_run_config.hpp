#pragma once

#include <map>
#include <span>
#include <vector>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/domain/product.hpp"
#include "hrrr/domain/region.hpp"
#include "hrrr/forecast/forecast_hour_set.hpp"
#include "hrrr/inventory/template_registry.hpp"
#include "hrrr/inventory/variable.hpp"

namespace hrrr {

// Expanded layer inventory of one (region, product, forecast-hour-set):
// for every forecast hour of the set, the template entries resolved in
// their file order. Built eagerly; immutable afterwards.
class CycleRunConfig {
 public:
  // Throws DiagnosticException if the key is not registered or any template
  // fails to expand. No partially built object is ever returned.
  CycleRunConfig(
      Region region, Product product, ForecastHourSet forecast_hour_set,
      const TemplateRegistry& registry = TemplateRegistry::Global());

  [[nodiscard]] auto GetRegion() const -> Region {
    return key_.region;
  }
  [[nodiscard]] auto GetProduct() const -> Product {
    return key_.product;
  }
  [[nodiscard]] auto GetForecastHourSet() const -> ForecastHourSet {
    return key_.forecast_hour_set;
  }

  [[nodiscard]] auto Inventory() const
      -> const std::map<int, std::vector<Variable>>& {
    return inventory_;
  }

  // Fails with kRange when forecast_hour is not a member of the set.
  [[nodiscard]] auto VariablesAt(int forecast_hour) const
      -> Result<std::span<const Variable>>;

 private:
  InventoryKey key_;
  std::map<int, std::vector<Variable>> inventory_;
};

// Variables of the layers archived for one forecast hour of a product,
// selecting the forecast-hour set from the hour.
auto InventoryFor(
    const TemplateRegistry& registry, Region region, Product product,
    int forecast_hour) -> Result<std::vector<Variable>>;

}  // namespace hrrr
