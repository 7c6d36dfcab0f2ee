// celerrate/dialect/dialect_resolver.cpp - Dialect tables
#include "celerrate/dialect/dialect_resolver.hpp"

#include <array>

namespace celerrate
{

namespace
{

namespace removal
{
constexpr std::optional<PhpVersion> Never = std::nullopt;
constexpr std::optional<PhpVersion> Php80 = PhpVersion::Php80;
}  // namespace removal

struct ConstructInfo
{
  std::string_view name;
  PhpVersion min_version;
  std::optional<PhpVersion> removed_in;
  std::string_view description;
};

constexpr ConstructInfo k_constructs[] = {
#define CONSTRUCT(Id, Name, Min, Removed, Desc) {Name, PhpVersion::Min, removal::Removed, Desc},
#include "celerrate/dialect/constructs.def"
};

constexpr size_t k_construct_count = sizeof(k_constructs) / sizeof(k_constructs[0]);

const ConstructInfo & info(Construct c) noexcept { return k_constructs[static_cast<size_t>(c)]; }

constexpr bool in_range(PhpVersion v, PhpVersion min, std::optional<PhpVersion> removed)
{
  return v >= min && (!removed || v < *removed);
}

// Preference lists, oldest spelling first.
using IC = InterpretationChoice;

constexpr InterpretationCandidate k_block[] = {{IC::Block, PhpVersion::Php70, std::nullopt}};
constexpr InterpretationCandidate k_else_if[] = {
  {IC::FlatElseIf, PhpVersion::Php70, std::nullopt},
  {IC::NestedIf, PhpVersion::Php70, std::nullopt},
};
constexpr InterpretationCandidate k_array[] = {{IC::ArrayLiteral, PhpVersion::Php70, std::nullopt}};
constexpr InterpretationCandidate k_list[] = {
  {IC::ListDestructure, PhpVersion::Php70, std::nullopt}};
constexpr InterpretationCandidate k_cast[] = {{IC::CanonicalCast, PhpVersion::Php70, std::nullopt}};
constexpr InterpretationCandidate k_nullable[] = {
  {IC::NullableType, PhpVersion::Php71, std::nullopt},
  {IC::UnionType, PhpVersion::Php80, std::nullopt},
};
constexpr InterpretationCandidate k_nested_ternary[] = {
  {IC::LeftAssociative, PhpVersion::Php70, PhpVersion::Php80}};

struct AmbiguityRule
{
  Construct construct;
  gsl::span<const InterpretationCandidate> candidates;
  InterpretationChoice fallback;
};

const std::array<AmbiguityRule, 8> & ambiguity_rules()
{
  static const std::array<AmbiguityRule, 8> rules = {{
    {Construct::AlternativeBlockSyntax, k_block, IC::AsWritten},
    {Construct::UnbracedBody, k_block, IC::AsWritten},
    {Construct::ElseIfSpelling, k_else_if, IC::AsWritten},
    {Construct::ArraySpelling, k_array, IC::AsWritten},
    {Construct::ListSpelling, k_list, IC::AsWritten},
    {Construct::CastSpelling, k_cast, IC::AsWritten},
    {Construct::NullableSpelling, k_nullable, IC::AsWritten},
    {Construct::UnparenthesizedNestedTernary, k_nested_ternary, IC::Reject},
  }};
  return rules;
}

const AmbiguityRule * find_rule(Construct c) noexcept
{
  for (const auto & rule : ambiguity_rules()) {
    if (rule.construct == c) {
      return &rule;
    }
  }
  return nullptr;
}

}  // namespace

std::string_view to_string(Construct c) noexcept { return info(c).name; }

std::string_view describe(Construct c) noexcept { return info(c).description; }

std::optional<Construct> find_construct(std::string_view name) noexcept
{
  for (size_t i = 0; i < k_construct_count; ++i) {
    if (k_constructs[i].name == name) {
      return static_cast<Construct>(i);
    }
  }
  return std::nullopt;
}

std::string_view to_string(InterpretationChoice c) noexcept
{
  switch (c) {
    case IC::AsWritten:
      return "as_written";
    case IC::Block:
      return "block";
    case IC::FlatElseIf:
      return "flat_else_if";
    case IC::NestedIf:
      return "nested_if";
    case IC::ArrayLiteral:
      return "array_literal";
    case IC::ListDestructure:
      return "list_destructure";
    case IC::CanonicalCast:
      return "canonical_cast";
    case IC::NullableType:
      return "nullable_type";
    case IC::UnionType:
      return "union_type";
    case IC::LeftAssociative:
      return "left_associative";
    case IC::Reject:
      return "reject";
  }
  return "unknown";
}

const DialectResolver & DialectResolver::standard() noexcept
{
  static const DialectResolver resolver;
  return resolver;
}

bool DialectResolver::is_construct_enabled(Construct c, PhpVersion v) const noexcept
{
  return status(c, v) == ConstructStatus::Enabled;
}

ConstructStatus DialectResolver::status(Construct c, PhpVersion v) const noexcept
{
  const ConstructInfo & ci = info(c);
  if (v < ci.min_version) {
    return ConstructStatus::NotYetAvailable;
  }
  if (ci.removed_in && v >= *ci.removed_in) {
    return ConstructStatus::Removed;
  }
  return ConstructStatus::Enabled;
}

InterpretationChoice DialectResolver::resolve_ambiguity(Construct c, PhpVersion v) const noexcept
{
  const AmbiguityRule * rule = find_rule(c);
  if (rule == nullptr) {
    return IC::AsWritten;
  }
  for (const auto & candidate : rule->candidates) {
    if (in_range(v, candidate.min_version, candidate.removed_in)) {
      return candidate.choice;
    }
  }
  return rule->fallback;
}

PhpVersion DialectResolver::min_version(Construct c) const noexcept
{
  return info(c).min_version;
}

std::optional<PhpVersion> DialectResolver::removed_in(Construct c) const noexcept
{
  return info(c).removed_in;
}

gsl::span<const InterpretationCandidate> DialectResolver::candidates(Construct c) const noexcept
{
  const AmbiguityRule * rule = find_rule(c);
  if (rule == nullptr) {
    return {};
  }
  return rule->candidates;
}

}  // namespace celerrate
