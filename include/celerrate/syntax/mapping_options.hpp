// celerrate/syntax/mapping_options.hpp - Per-pass mapper configuration
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "celerrate/dialect/php_version.hpp"

namespace celerrate
{

/// How a construct that the active dialect does not accept is reported.
/// The mapped tree is the same under both policies.
enum class GatePolicy : uint8_t {
  Downgrade,  ///< Warning
  Strict,     ///< Error
};

[[nodiscard]] constexpr std::string_view to_string(GatePolicy p) noexcept
{
  return p == GatePolicy::Strict ? "strict" : "downgrade";
}

[[nodiscard]] constexpr std::optional<GatePolicy> parse_gate_policy(std::string_view s) noexcept
{
  if (s == "downgrade") return GatePolicy::Downgrade;
  if (s == "strict") return GatePolicy::Strict;
  return std::nullopt;
}

inline constexpr uint32_t k_default_max_depth = 2048;

struct MappingOptions
{
  PhpVersion version = k_latest_php_version;
  GatePolicy policy = GatePolicy::Downgrade;
  /// Concrete subtrees nested deeper than this become Unknown (E2004).
  uint32_t max_depth = k_default_max_depth;
};

}  // namespace celerrate
