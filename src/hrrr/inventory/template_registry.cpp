#include "hrrr/inventory/template_registry.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hrrr/config/catalog_config.hpp"

namespace hrrr {

namespace fs = std::filesystem;

namespace {

auto ReadFile(const fs::path& path) -> std::string {
  std::ifstream in(path);
  if (!in) {
    throw DiagnosticException(
        Diagnostic::HostError(
            fmt::format("cannot open inventory file '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto ParseRecord(const nlohmann::json& record) -> TemplateEntry {
  return TemplateEntry{
      .row_number = record.at("row_number").get<int>(),
      .level_layer = record.at("level_layer").get<std::string>(),
      .parameter = record.at("parameter").get<std::string>(),
      .forecast_valid_template =
          record.at("forecast_valid_template").get<std::string>(),
      .description = record.at("description").get<std::string>(),
  };
}

struct GlobalRegistry {
  std::once_flag once;
  std::unique_ptr<const TemplateRegistry> registry;
  fs::path data_dir;
};

auto GetGlobalRegistry() -> GlobalRegistry& {
  static GlobalRegistry global;
  return global;
}

// A throwing load leaves the once_flag unset, so a later call retries from
// scratch and never observes a partial registry.
auto LoadGlobalOnce(const std::function<fs::path()>& resolve_dir)
    -> const TemplateRegistry& {
  auto& global = GetGlobalRegistry();
  std::call_once(global.once, [&] {
    fs::path dir = resolve_dir();
    global.registry = std::make_unique<const TemplateRegistry>(
        TemplateRegistry::LoadFromDirectory(dir));
    global.data_dir = std::move(dir);
  });
  return *global.registry;
}

}  // namespace

auto ToString(const InventoryKey& key) -> std::string {
  return fmt::format(
      "({}, {}, {})", ToString(key.region), ToString(key.product),
      ToString(key.forecast_hour_set));
}

auto AllInventoryKeys() -> std::vector<InventoryKey> {
  std::vector<InventoryKey> keys;
  for (auto region : kAllRegions) {
    for (auto product : kAllProducts) {
      for (auto set : ForecastHourSetsFor(product)) {
        keys.push_back(
            InventoryKey{
                .region = region,
                .product = product,
                .forecast_hour_set = set});
      }
    }
  }
  return keys;
}

auto InventoryFileName(const InventoryKey& key) -> std::string {
  return fmt::format(
      "inventory__{}__{}__{}.json", ToString(key.region),
      ToString(key.product), ToString(key.forecast_hour_set));
}

auto ParseTemplateEntries(std::string_view json_text, std::string_view source)
    -> std::vector<TemplateEntry> {
  std::vector<TemplateEntry> entries;
  try {
    auto doc = nlohmann::json::parse(json_text);
    if (!doc.is_array()) {
      throw DiagnosticException(
          Diagnostic::HostError(
              fmt::format("{}: expected a JSON array of records", source)));
    }
    entries.reserve(doc.size());
    for (const auto& record : doc) {
      entries.push_back(ParseRecord(record));
    }
  } catch (const nlohmann::json::exception& e) {
    throw DiagnosticException(
        Diagnostic::HostError(
            fmt::format("{}: malformed inventory: {}", source, e.what())));
  }
  return entries;
}

TemplateRegistry::TemplateRegistry(std::map<InventoryKey, Entries> entries)
    : entries_(std::move(entries)) {
}

auto TemplateRegistry::LoadFromDirectory(const fs::path& data_dir)
    -> TemplateRegistry {
  std::map<InventoryKey, Entries> entries;
  for (const auto& key : AllInventoryKeys()) {
    fs::path path = data_dir / InventoryFileName(key);
    auto parsed = ParseTemplateEntries(ReadFile(path), path.string());
    spdlog::debug("loaded {} layers from {}", parsed.size(), path.string());
    entries.emplace(key, std::move(parsed));
  }
  spdlog::info(
      "template registry loaded {} inventories from {}", entries.size(),
      data_dir.string());
  return TemplateRegistry(std::move(entries));
}

auto TemplateRegistry::Initialize(const fs::path& data_dir)
    -> const TemplateRegistry& {
  const auto& registry = LoadGlobalOnce([&] { return data_dir; });
  const auto& loaded_from = GetGlobalRegistry().data_dir;
  if (loaded_from != data_dir) {
    spdlog::warn(
        "template registry already loaded from {}; ignoring {}",
        loaded_from.string(), data_dir.string());
  }
  return registry;
}

auto TemplateRegistry::Global() -> const TemplateRegistry& {
  return LoadGlobalOnce([] {
    auto config = config::ResolveConfig();
    config::ConfigureLogging(config);
    return config.data_dir;
  });
}

auto TemplateRegistry::Find(const InventoryKey& key) const
    -> Result<const Entries*> {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::unexpected(
        Diagnostic::MissingTemplate(
            fmt::format("no template inventory for {}", ToString(key)))
            .WithNote(
                fmt::format(
                    "expected packaged file {}", InventoryFileName(key))));
  }
  return &it->second;
}

auto TemplateRegistry::At(const InventoryKey& key) const -> const Entries& {
  auto found = Find(key);
  if (!found) {
    spdlog::error("{}", FormatDiagnostic(found.error()));
    throw DiagnosticException(std::move(found.error()));
  }
  return **found;
}

}  // namespace hrrr
