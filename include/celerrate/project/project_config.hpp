// celerrate/project/project_config.hpp - Project configuration (celerrate.yaml)
//
// Parses and validates celerrate.yaml, which selects the PHP dialect and the
// mapper policy for every file of a project.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "celerrate/dialect/php_version.hpp"
#include "celerrate/syntax/mapping_options.hpp"

namespace celerrate
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * `php` section.
 */
struct PhpConfig
{
  /// Tag as written in the file ("8.1", "php7.4")
  std::string version_tag = std::string(to_string(k_latest_php_version));

  /// Resolved dialect; the latest one when the tag is unknown
  PhpVersion version = k_latest_php_version;

  /// True when version_tag named no known dialect
  bool version_fell_back = false;
};

/**
 * `mapping` section.
 */
struct MappingConfig
{
  GatePolicy policy = GatePolicy::Downgrade;
  uint32_t max_depth = k_default_max_depth;
};

/**
 * Complete project configuration (celerrate.yaml).
 */
struct ProjectConfig
{
  PhpConfig php;
  MappingConfig mapping;

  /// Directory containing celerrate.yaml; empty when loaded from a string
  std::filesystem::path project_root;
};

/// Options for one mapping pass under this configuration.
[[nodiscard]] MappingOptions to_mapping_options(const ProjectConfig & config) noexcept;

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Non-fatal findings, such as an unknown dialect tag
  std::vector<std::string> warnings;

  static ConfigLoadResult ok(ProjectConfig cfg, std::vector<std::string> warnings = {})
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    r.warnings = std::move(warnings);
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a celerrate.yaml file.
 *
 * Missing files, YAML syntax errors, values of the wrong type and unknown
 * policies fail the load. Absent keys keep their defaults.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for YAML text already in memory.
[[nodiscard]] ConfigLoadResult load_project_config_from_string(std::string_view yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to celerrate.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "celerrate.yaml";

}  // namespace celerrate
