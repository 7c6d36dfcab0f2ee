// tests/unit/mapper/test_dialect_gates.cpp - version gates reported while mapping
#include <gtest/gtest.h>

#include <string>

#include "celerrate/ast/ast.hpp"
#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/dialect/dialect_resolver.hpp"
#include "celerrate/test_support/parse_helpers.hpp"

using namespace celerrate;
using celerrate::test_support::parse_php;
using celerrate::test_support::TestMapUnit;

namespace
{

struct GateCase
{
  Construct construct;
  const char * src;
};

// Each snippet uses exactly one gated construct.
const GateCase k_gate_cases[] = {
  {Construct::ClassConstVisibility, "<?php class A { private const X = 1; }"},
  {Construct::VoidReturnType, "<?php function f(): void {}"},
  {Construct::ShortListDestructuring, "<?php [$a, $b] = $c;"},
  {Construct::MultiCatch, "<?php try {} catch (A | B $e) {}"},
  {Construct::ObjectType, "<?php function f(object $o) {}"},
  {Construct::TypedProperties, "<?php class A { public int $x; }"},
  {Construct::ArrowFunctions, "<?php $f = fn($x) => $x;"},
  {Construct::NullCoalescingAssignment, "<?php $a ??= 1;"},
  {Construct::ArraySpread, "<?php $a = [...$b];"},
  {Construct::NumericLiteralSeparator, "<?php echo 1_000;"},
  {Construct::ConstructorPromotion, "<?php class A { public function __construct(public $x) {} }"},
  {Construct::UnionTypes, "<?php function f(int|string $x) {}"},
  {Construct::MatchExpression, "<?php $r = match ($x) { default => 1 };"},
  {Construct::NullsafeOperator, "<?php $r = $a?->b;"},
  {Construct::NamedArguments, "<?php f(x: 1);"},
  {Construct::Attributes, "<?php #[Pure] function f() {}"},
  {Construct::MixedType, "<?php function f(): mixed {}"},
  {Construct::StaticReturnType, "<?php class A { public function f(): static {} }"},
  {Construct::ThrowExpression, "<?php $x = $a ?? throw new E;"},
  {Construct::CatchWithoutVariable, "<?php try {} catch (E) {}"},
  {Construct::ReadonlyProperty, "<?php class A { public readonly int $x; }"},
  {Construct::Enums, "<?php enum Status {}"},
  {Construct::FirstClassCallable, "<?php $f = strlen(...);"},
  {Construct::NeverType, "<?php function f(): never {}"},
  {Construct::IntersectionTypes, "<?php function f(A&B $x) {}"},
  {Construct::NewInInitializer, "<?php function f($x = new Foo) {}"},
  {Construct::ReadonlyClass, "<?php readonly class A {}"},
};

PhpVersion previous(PhpVersion v)
{
  return static_cast<PhpVersion>(static_cast<int>(v) - 1);
}

}  // namespace

TEST(DialectGates, EachConstructGatedJustBeforeItsVersion)
{
  const auto & resolver = DialectResolver::standard();
  for (const GateCase & c : k_gate_cases) {
    SCOPED_TRACE(c.src);
    const PhpVersion min = resolver.min_version(c.construct);
    ASSERT_NE(min, k_oldest_php_version);

    const TestMapUnit at_min = parse_php(c.src, min);
    EXPECT_TRUE(at_min.diags().empty()) << at_min.dump();

    const TestMapUnit before = parse_php(c.src, previous(min));
    const auto gated = before.with_code(diag_code::k_construct_unavailable);
    ASSERT_EQ(gated.size(), 1U) << before.dump();
    EXPECT_EQ(gated[0].severity, Severity::Warning);
    EXPECT_NE(gated[0].message.find(std::string(describe(c.construct))), std::string::npos)
      << gated[0].message;
    EXPECT_NE(gated[0].message.find(std::string(to_string(min))), std::string::npos)
      << gated[0].message;
    EXPECT_FALSE(before.diags().has_errors());
  }
}

TEST(DialectGates, StrictPolicyOnlyChangesSeverity)
{
  for (const GateCase & c : k_gate_cases) {
    SCOPED_TRACE(c.src);
    const PhpVersion v = k_oldest_php_version;
    const TestMapUnit lenient = parse_php(c.src, v, GatePolicy::Downgrade);
    const TestMapUnit strict = parse_php(c.src, v, GatePolicy::Strict);

    EXPECT_EQ(lenient.dump(), strict.dump());
    ASSERT_EQ(lenient.diags().size(), strict.diags().size());
    EXPECT_FALSE(lenient.diags().has_errors());
    for (const auto & d : strict.diags().all()) {
      EXPECT_EQ(d.severity, Severity::Error) << d.message;
    }
  }
}

TEST(DialectGates, RemovedCasts)
{
  auto old = parse_php("<?php $a = (real) $x; $b = (unset) $y;", PhpVersion::Php74);
  EXPECT_TRUE(old.diags().empty()) << old.dump();
  EXPECT_EQ(cast<CastExpr>(old.expr<AssignExpr>(0)->value)->castKind, CastKind::Float);
  EXPECT_EQ(cast<CastExpr>(old.expr<AssignExpr>(1)->value)->castKind, CastKind::Unset);

  auto modern = parse_php("<?php $a = (real) $x; $b = (unset) $y;", PhpVersion::Php80);
  const auto removed = modern.with_code(diag_code::k_construct_removed);
  ASSERT_EQ(removed.size(), 2U);
  EXPECT_NE(removed[0].message.find("removed in PHP 8.0"), std::string::npos) << removed[0].message;
  // The cast is still mapped.
  EXPECT_EQ(cast<CastExpr>(modern.expr<AssignExpr>(0)->value)->castKind, CastKind::Float);
}

TEST(DialectGates, UnparenthesizedNestedTernary)
{
  const std::string src = "<?php $r = $a ? 1 : $b ? 2 : 3;";

  auto php74 = parse_php(src, PhpVersion::Php74);
  EXPECT_TRUE(php74.diags().empty()) << php74.dump();
  const auto * outer = dyn_cast<TernaryExpr>(php74.expr<AssignExpr>(0)->value);
  ASSERT_NE(outer, nullptr);
  EXPECT_TRUE(isa<TernaryExpr>(outer->condition));
  EXPECT_EQ(cast<IntLiteralExpr>(outer->elseExpr)->value, 3);

  auto php80 = parse_php(src, PhpVersion::Php80);
  const auto removed = php80.with_code(diag_code::k_construct_removed);
  ASSERT_EQ(removed.size(), 1U) << php80.dump();
  EXPECT_EQ(removed[0].severity, Severity::Error);
  // Same grouping; only the diagnostic differs.
  EXPECT_EQ(php74.dump(), php80.dump());
}

TEST(DialectGates, NestedTernaryAllowedWhenParenthesizedOrShort)
{
  auto parens = parse_php("<?php $r = ($a ? 1 : $b) ? 2 : 3;", PhpVersion::Php80);
  EXPECT_TRUE(parens.diags().empty()) << parens.dump();

  auto chain = parse_php("<?php $r = $a ?: $b ?: $c;", PhpVersion::Php80);
  EXPECT_TRUE(chain.diags().empty()) << chain.dump();
}

TEST(DialectGates, GatedConstructMappedLikeAcceptedOne)
{
  const std::string src = "<?php $r = match ($x) { 1 => 'a', default => 'b' };";
  auto old = parse_php(src, PhpVersion::Php74);
  auto modern = parse_php(src, PhpVersion::Php80);
  EXPECT_EQ(old.dump(), modern.dump());
  EXPECT_EQ(old.diags().size(), 1U);
  EXPECT_TRUE(modern.diags().empty());
}
