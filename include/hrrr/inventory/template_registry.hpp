#pragma once

#include <compare>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/domain/product.hpp"
#include "hrrr/domain/region.hpp"
#include "hrrr/forecast/forecast_hour_set.hpp"
#include "hrrr/inventory/variable.hpp"

namespace hrrr {

struct InventoryKey {
  Region region;
  Product product;
  ForecastHourSet forecast_hour_set;

  auto operator<=>(const InventoryKey&) const = default;
};

auto ToString(const InventoryKey& key) -> std::string;

// Every (region, product, forecast-hour-set) combination the archive
// produces, in region/product/set order.
auto AllInventoryKeys() -> std::vector<InventoryKey>;

// "inventory__{region}__{product}__{forecast_hour_set}.json"
auto InventoryFileName(const InventoryKey& key) -> std::string;

// Parses one inventory file's JSON array of template records. Record order
// is kept. Throws DiagnosticException (kHostError) naming source on
// malformed input.
auto ParseTemplateEntries(std::string_view json_text, std::string_view source)
    -> std::vector<TemplateEntry>;

// Read-only table of template entries keyed by InventoryKey.
class TemplateRegistry {
 public:
  using Entries = std::vector<TemplateEntry>;

  explicit TemplateRegistry(std::map<InventoryKey, Entries> entries);

  // Loads one file per AllInventoryKeys() entry from data_dir. A missing or
  // malformed file throws DiagnosticException.
  static auto LoadFromDirectory(const std::filesystem::path& data_dir)
      -> TemplateRegistry;

  // Process-wide registry. The first of Initialize()/Global() to run loads
  // it exactly once; later calls return the same instance. Global() loads
  // from the data_dir of config::ResolveConfig() and applies its log level.
  static auto Initialize(const std::filesystem::path& data_dir)
      -> const TemplateRegistry&;
  static auto Global() -> const TemplateRegistry&;

  // Fails with kMissingTemplate for an unregistered key.
  [[nodiscard]] auto Find(const InventoryKey& key) const
      -> Result<const Entries*>;

  // As Find(), throwing DiagnosticException instead.
  [[nodiscard]] auto At(const InventoryKey& key) const -> const Entries&;

  [[nodiscard]] auto Size() const -> std::size_t {
    return entries_.size();
  }

 private:
  std::map<InventoryKey, Entries> entries_;
};

}  // namespace hrrr
