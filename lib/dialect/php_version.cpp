// celerrate/dialect/php_version.cpp
#include "celerrate/dialect/php_version.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <utility>

namespace celerrate
{

namespace
{

struct VersionName
{
  PhpVersion version;
  int major;
  int minor;
  std::string_view text;
};

constexpr std::array<VersionName, 10> k_versions = {{
  {PhpVersion::Php70, 7, 0, "7.0"},
  {PhpVersion::Php71, 7, 1, "7.1"},
  {PhpVersion::Php72, 7, 2, "7.2"},
  {PhpVersion::Php73, 7, 3, "7.3"},
  {PhpVersion::Php74, 7, 4, "7.4"},
  {PhpVersion::Php80, 8, 0, "8.0"},
  {PhpVersion::Php81, 8, 1, "8.1"},
  {PhpVersion::Php82, 8, 2, "8.2"},
  {PhpVersion::Php83, 8, 3, "8.3"},
  {PhpVersion::Php84, 8, 4, "8.4"},
}};

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool parse_int(std::string_view s, int & out)
{
  if (s.empty()) return false;
  const auto * first = s.data();
  const auto * last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

std::string_view to_string(PhpVersion v) noexcept
{
  return k_versions[static_cast<size_t>(v)].text;
}

std::optional<PhpVersion> parse_php_version(std::string_view tag)
{
  std::string_view s = trim(tag);
  if (s.size() >= 3 && (s[0] == 'p' || s[0] == 'P') && (s[1] == 'h' || s[1] == 'H') &&
      (s[2] == 'p' || s[2] == 'P')) {
    s = trim(s.substr(3));
  }

  const size_t dot = s.find('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view minor_part = s.substr(dot + 1);
  const size_t patch_dot = minor_part.find('.');
  if (patch_dot != std::string_view::npos) {
    int patch = 0;
    if (!parse_int(minor_part.substr(patch_dot + 1), patch)) {
      return std::nullopt;
    }
    minor_part = minor_part.substr(0, patch_dot);
  }

  int major = 0;
  int minor = 0;
  if (!parse_int(s.substr(0, dot), major) || !parse_int(minor_part, minor)) {
    return std::nullopt;
  }

  for (const auto & v : k_versions) {
    if (v.major == major && v.minor == minor) {
      return v.version;
    }
  }
  return std::nullopt;
}

DialectSelection resolve_dialect_tag(std::string_view tag)
{
  DialectSelection sel;
  sel.requested = std::string(tag);
  if (auto v = parse_php_version(tag)) {
    sel.version = *v;
    return sel;
  }
  sel.version = k_latest_php_version;
  sel.fell_back = true;
  return sel;
}

}  // namespace celerrate
