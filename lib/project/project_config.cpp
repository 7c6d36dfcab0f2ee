// celerrate/project/project_config.cpp - Project configuration implementation
//
#include "celerrate/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>

#include <fmt/format.h>

namespace celerrate
{

namespace
{

std::optional<std::string> parse_php_section(
  const YAML::Node & node, PhpConfig & php, std::vector<std::string> & warnings)
{
  if (!node.IsMap()) {
    return std::string("'php' must be a map");
  }

  if (const YAML::Node version = node["version"]) {
    if (!version.IsScalar()) {
      return std::string("php.version must be a string such as \"8.1\"");
    }
    // Unquoted 8.1 is a YAML float; the scalar text is what was written.
    php.version_tag = version.Scalar();
    const DialectSelection selection = resolve_dialect_tag(php.version_tag);
    php.version = selection.version;
    php.version_fell_back = selection.fell_back;
    if (selection.fell_back) {
      warnings.push_back(fmt::format(
        "unknown php.version '{}', using PHP {}", php.version_tag, to_string(selection.version)));
    }
  }
  return std::nullopt;
}

std::optional<std::string> parse_mapping_section(const YAML::Node & node, MappingConfig & mapping)
{
  if (!node.IsMap()) {
    return std::string("'mapping' must be a map");
  }

  if (const YAML::Node policy = node["policy"]) {
    const std::string text = policy.IsScalar() ? policy.Scalar() : std::string();
    const auto parsed = parse_gate_policy(text);
    if (!parsed) {
      return fmt::format(
        "invalid mapping.policy: '{}' (must be 'downgrade' or 'strict')", text);
    }
    mapping.policy = *parsed;
  }

  if (const YAML::Node depth = node["max_depth"]) {
    int64_t value = 0;
    try {
      value = depth.as<int64_t>();
    } catch (const YAML::BadConversion &) {
      return std::string("mapping.max_depth must be an integer");
    }
    if (value <= 0 || value > std::numeric_limits<uint32_t>::max()) {
      return fmt::format("mapping.max_depth must be positive (got {})", value);
    }
    mapping.max_depth = static_cast<uint32_t>(value);
  }
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;
  std::vector<std::string> warnings;

  // An empty file is a valid configuration with every default.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["php"]) {
    if (auto error = parse_php_section(root["php"], config.php, warnings)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  }

  if (root["mapping"]) {
    if (auto error = parse_mapping_section(root["mapping"], config.mapping)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  }

  return ConfigLoadResult::ok(std::move(config), std::move(warnings));
}

}  // namespace

MappingOptions to_mapping_options(const ProjectConfig & config) noexcept
{
  MappingOptions options;
  options.version = config.php.version;
  options.policy = config.mapping.policy;
  options.max_depth = config.mapping.max_depth;
  return options;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_root(root);
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult load_project_config_from_string(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace celerrate
