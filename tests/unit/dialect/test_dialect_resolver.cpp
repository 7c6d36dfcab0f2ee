// tests/unit/dialect/test_dialect_resolver.cpp - Gating table and ambiguity rules
#include <gtest/gtest.h>

#include <vector>

#include "celerrate/dialect/dialect_resolver.hpp"

using namespace celerrate;

namespace
{

std::vector<PhpVersion> all_versions()
{
  std::vector<PhpVersion> out;
  for (auto v = static_cast<int>(k_oldest_php_version); v <= static_cast<int>(k_latest_php_version);
       ++v) {
    out.push_back(static_cast<PhpVersion>(v));
  }
  return out;
}

std::vector<Construct> all_constructs()
{
  return {
#define CONSTRUCT(Id, Name, Min, Removed, Desc) Construct::Id,
#include "celerrate/dialect/constructs.def"
  };
}

}  // namespace

TEST(DialectResolver, GateBoundaries)
{
  const auto & r = DialectResolver::standard();

  EXPECT_FALSE(r.is_construct_enabled(Construct::ReadonlyProperty, PhpVersion::Php80));
  EXPECT_TRUE(r.is_construct_enabled(Construct::ReadonlyProperty, PhpVersion::Php81));

  EXPECT_FALSE(r.is_construct_enabled(Construct::NullableTypes, PhpVersion::Php70));
  EXPECT_TRUE(r.is_construct_enabled(Construct::NullableTypes, PhpVersion::Php71));

  EXPECT_EQ(r.status(Construct::TypedProperties, PhpVersion::Php73), ConstructStatus::NotYetAvailable);
  EXPECT_EQ(r.status(Construct::TypedProperties, PhpVersion::Php74), ConstructStatus::Enabled);

  EXPECT_EQ(r.status(Construct::AsymmetricVisibility, PhpVersion::Php83), ConstructStatus::NotYetAvailable);
  EXPECT_EQ(r.status(Construct::AsymmetricVisibility, PhpVersion::Php84), ConstructStatus::Enabled);
}

TEST(DialectResolver, RemovedConstructs)
{
  const auto & r = DialectResolver::standard();

  EXPECT_EQ(r.status(Construct::RealCast, PhpVersion::Php74), ConstructStatus::Enabled);
  EXPECT_EQ(r.status(Construct::RealCast, PhpVersion::Php80), ConstructStatus::Removed);
  EXPECT_EQ(r.removed_in(Construct::UnsetCast), PhpVersion::Php80);
  EXPECT_FALSE(r.removed_in(Construct::Enums).has_value());
}

TEST(DialectResolver, MonotonicUnlessRemoved)
{
  const auto & r = DialectResolver::standard();
  const auto versions = all_versions();

  for (const Construct c : all_constructs()) {
    bool enabled_before = false;
    for (const PhpVersion v : versions) {
      const bool enabled = r.is_construct_enabled(c, v);
      if (enabled_before && !enabled) {
        EXPECT_EQ(r.status(c, v), ConstructStatus::Removed) << to_string(c) << " @ " << to_string(v);
        ASSERT_TRUE(r.removed_in(c).has_value()) << to_string(c);
        EXPECT_LE(*r.removed_in(c), v);
      }
      enabled_before = enabled;
    }
  }
}

TEST(DialectResolver, MinVersionIsFirstEnabledDialect)
{
  const auto & r = DialectResolver::standard();
  for (const Construct c : all_constructs()) {
    const PhpVersion min = r.min_version(c);
    EXPECT_TRUE(r.is_construct_enabled(c, min)) << to_string(c);
    if (min != k_oldest_php_version) {
      const auto before = static_cast<PhpVersion>(static_cast<int>(min) - 1);
      EXPECT_FALSE(r.is_construct_enabled(c, before)) << to_string(c);
    }
  }
}

TEST(DialectResolver, FindConstructByName)
{
  EXPECT_EQ(find_construct("match_expression"), Construct::MatchExpression);
  EXPECT_EQ(find_construct("dnf_types"), Construct::DnfTypes);
  EXPECT_FALSE(find_construct("generics").has_value());

  for (const Construct c : all_constructs()) {
    EXPECT_EQ(find_construct(to_string(c)), c);
    EXPECT_FALSE(describe(c).empty());
  }
}

TEST(DialectResolver, CanonicalShapesForSpellings)
{
  const auto & r = DialectResolver::standard();
  for (const PhpVersion v : all_versions()) {
    EXPECT_EQ(r.resolve_ambiguity(Construct::AlternativeBlockSyntax, v), InterpretationChoice::Block);
    EXPECT_EQ(r.resolve_ambiguity(Construct::UnbracedBody, v), InterpretationChoice::Block);
    EXPECT_EQ(r.resolve_ambiguity(Construct::ElseIfSpelling, v), InterpretationChoice::FlatElseIf);
    EXPECT_EQ(r.resolve_ambiguity(Construct::ArraySpelling, v), InterpretationChoice::ArrayLiteral);
    EXPECT_EQ(r.resolve_ambiguity(Construct::ListSpelling, v), InterpretationChoice::ListDestructure);
    EXPECT_EQ(r.resolve_ambiguity(Construct::CastSpelling, v), InterpretationChoice::CanonicalCast);
  }
}

TEST(DialectResolver, FirstValidCandidateWins)
{
  const auto & r = DialectResolver::standard();

  // Both `?T` and `T|null` are valid from 8.0; the older spelling is preferred.
  EXPECT_EQ(r.resolve_ambiguity(Construct::NullableSpelling, PhpVersion::Php84), InterpretationChoice::NullableType);
  EXPECT_EQ(r.resolve_ambiguity(Construct::NullableSpelling, PhpVersion::Php71), InterpretationChoice::NullableType);
  EXPECT_EQ(r.resolve_ambiguity(Construct::NullableSpelling, PhpVersion::Php70), InterpretationChoice::AsWritten);

  const auto candidates = r.candidates(Construct::NullableSpelling);
  ASSERT_EQ(candidates.size(), 2U);
  EXPECT_EQ(candidates[0].choice, InterpretationChoice::NullableType);
}

TEST(DialectResolver, NestedTernaryRejectedFrom80)
{
  const auto & r = DialectResolver::standard();
  EXPECT_EQ(
    r.resolve_ambiguity(Construct::UnparenthesizedNestedTernary, PhpVersion::Php74),
    InterpretationChoice::LeftAssociative);
  EXPECT_EQ(
    r.resolve_ambiguity(Construct::UnparenthesizedNestedTernary, PhpVersion::Php80),
    InterpretationChoice::Reject);
}

TEST(DialectResolver, PlainGatesHaveNoCandidates)
{
  const auto & r = DialectResolver::standard();
  EXPECT_TRUE(r.candidates(Construct::Enums).empty());
  EXPECT_EQ(r.resolve_ambiguity(Construct::Enums, PhpVersion::Php81), InterpretationChoice::AsWritten);
}
