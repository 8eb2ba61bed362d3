#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace hrrr::config {

inline constexpr const char* kConfigFileName = "hrrr.toml";

struct CatalogConfig {
  // Directory holding the packaged inventory__*.json template files
  std::filesystem::path data_dir;
  // spdlog level name: trace, debug, info, warn, error, critical, off
  std::string log_level = "info";

  // Directory where hrrr.toml was found (empty for the default config)
  std::filesystem::path root_dir;
};

// Packaged data directory, level "info".
auto DefaultConfig() -> CatalogConfig;

// Search for hrrr.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse hrrr.toml. Missing keys keep their defaults.
// Throws DiagnosticException (kHostError) on parse errors or bad values.
auto LoadConfig(const std::filesystem::path& config_path) -> CatalogConfig;

// hrrr.toml found from the working directory, else DefaultConfig().
auto ResolveConfig() -> CatalogConfig;

// Applies log_level to the spdlog default logger.
void ConfigureLogging(const CatalogConfig& config);

}  // namespace hrrr::config
