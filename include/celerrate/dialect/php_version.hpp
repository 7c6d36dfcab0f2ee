// celerrate/dialect/php_version.hpp - PHP dialect tags
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace celerrate
{

/// One tag per PHP minor release the mapper knows about.
enum class PhpVersion : uint8_t {
  Php70,
  Php71,
  Php72,
  Php73,
  Php74,
  Php80,
  Php81,
  Php82,
  Php83,
  Php84,
};

inline constexpr PhpVersion k_oldest_php_version = PhpVersion::Php70;
inline constexpr PhpVersion k_latest_php_version = PhpVersion::Php84;

/// "8.1" style spelling
[[nodiscard]] std::string_view to_string(PhpVersion v) noexcept;

/// Exact match on a known minor release. Accepts "8.1", "php8.1", "PHP 8.1"
/// and ignores a patch component ("8.1.27"). Returns nullopt otherwise.
[[nodiscard]] std::optional<PhpVersion> parse_php_version(std::string_view tag);

/**
 * Outcome of resolving a user-supplied dialect tag.
 *
 * Unknown, malformed and future tags select the newest known dialect and
 * set fell_back so the caller can report it.
 */
struct DialectSelection
{
  PhpVersion version = k_latest_php_version;
  bool fell_back = false;
  std::string requested;
};

[[nodiscard]] DialectSelection resolve_dialect_tag(std::string_view tag);

}  // namespace celerrate
