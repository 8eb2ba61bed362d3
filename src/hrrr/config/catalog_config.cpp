#include "hrrr/config/catalog_config.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "hrrr/common/diagnostic.hpp"

#ifndef HRRR_DEFAULT_DATA_DIR
#define HRRR_DEFAULT_DATA_DIR "data"
#endif

namespace hrrr::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto ConfigError(const fs::path& config_path, std::string_view detail)
    -> DiagnosticException {
  return DiagnosticException(
      Diagnostic::HostError(
          fmt::format("{}: {}", config_path.string(), detail)));
}

// Reads an optional string key. A present key of another type is an error.
auto OptionalString(
    const toml::node_view<toml::node>& node, const fs::path& config_path,
    std::string_view key) -> std::optional<std::string> {
  if (!node) {
    return std::nullopt;
  }
  auto value = node.value<std::string>();
  if (!value) {
    throw ConfigError(
        config_path, fmt::format("'{}' must be a string", key));
  }
  return value;
}

}  // namespace

auto DefaultConfig() -> CatalogConfig {
  return CatalogConfig{
      .data_dir = fs::path(HRRR_DEFAULT_DATA_DIR),
      .log_level = "info",
      .root_dir = {},
  };
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> CatalogConfig {
  CatalogConfig config = DefaultConfig();
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    throw ConfigError(
        config_path, fmt::format("failed to parse: {}", e.description()));
  }

  // [inventory] section (optional)
  if (auto data_dir = OptionalString(
          tbl["inventory"]["data_dir"], config_path, "inventory.data_dir")) {
    // Resolve relative paths against config directory
    fs::path dir = *data_dir;
    if (dir.is_relative()) {
      dir = config.root_dir / dir;
    }
    config.data_dir = dir;
  }

  // [logging] section (optional)
  if (auto level = OptionalString(
          tbl["logging"]["level"], config_path, "logging.level")) {
    if (std::ranges::find(kLogLevels, *level) == kLogLevels.end()) {
      throw ConfigError(
          config_path, fmt::format("unknown logging.level '{}'", *level));
    }
    config.log_level = *level;
  }

  spdlog::debug(
      "loaded {} (data_dir={}, level={})", config_path.string(),
      config.data_dir.string(), config.log_level);
  return config;
}

auto ResolveConfig() -> CatalogConfig {
  if (auto path = FindConfig()) {
    return LoadConfig(*path);
  }
  return DefaultConfig();
}

void ConfigureLogging(const CatalogConfig& config) {
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

}  // namespace hrrr::config
