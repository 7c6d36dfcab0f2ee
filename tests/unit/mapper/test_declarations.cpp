// tests/unit/mapper/test_declarations.cpp - functions, class-likes and members
#include <gtest/gtest.h>

#include <string>

#include "celerrate/ast/ast.hpp"
#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/test_support/parse_helpers.hpp"

using namespace celerrate;
using celerrate::test_support::parse_php;

TEST(Declarations, FunctionWithParamsAndReturnType)
{
  auto unit = parse_php("<?php\nfunction &pick(array $xs, int $i = 0, string ...$rest): ?string { return null; }\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * fn = unit.decl<FunctionDecl>(0);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "pick");
  EXPECT_TRUE(fn->byRefReturn);
  ASSERT_EQ(fn->params.size(), 3U);

  EXPECT_EQ(fn->params[0]->name, "xs");
  const auto * xs_type = dyn_cast<NamedType>(fn->params[0]->type);
  ASSERT_NE(xs_type, nullptr);
  EXPECT_TRUE(xs_type->isBuiltin);
  EXPECT_EQ(xs_type->name, "array");

  ASSERT_NE(fn->params[1]->defaultValue, nullptr);
  EXPECT_EQ(cast<IntLiteralExpr>(fn->params[1]->defaultValue)->value, 0);

  EXPECT_TRUE(fn->params[2]->isVariadic);
  EXPECT_EQ(fn->params[2]->name, "rest");

  const auto * ret = dyn_cast<NullableType>(fn->returnType);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(cast<NamedType>(ret->inner)->name, "string");

  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->stmts.size(), 1U);
  EXPECT_TRUE(isa<ReturnStmt>(fn->body->stmts[0]));
}

TEST(Declarations, ByReferenceParameter)
{
  auto unit = parse_php("<?php\nfunction bump(int &$n) { $n++; }\n");
  const auto * fn = unit.decl<FunctionDecl>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->params.size(), 1U);
  EXPECT_TRUE(fn->params[0]->byRef);
  EXPECT_EQ(fn->params[0]->name, "n");
}

TEST(Declarations, ClassHeader)
{
  auto unit = parse_php(
    "<?php\nabstract class Repo extends \\Base\\Model implements Countable, Acme\\Store {}\n"
    "final class Leaf {}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * repo = unit.decl<ClassDecl>(0);
  ASSERT_NE(repo, nullptr);
  EXPECT_EQ(repo->name, "Repo");
  EXPECT_TRUE(repo->isAbstract);
  EXPECT_FALSE(repo->isFinal);
  ASSERT_NE(repo->extends, nullptr);
  EXPECT_EQ(repo->extends->name, "Base\\Model");
  EXPECT_EQ(repo->extends->nameKind, NameKind::FullyQualified);
  ASSERT_EQ(repo->implements.size(), 2U);
  EXPECT_EQ(repo->implements[0]->name, "Countable");
  EXPECT_EQ(repo->implements[1]->name, "Acme\\Store");
  EXPECT_EQ(repo->implements[1]->nameKind, NameKind::Qualified);

  const auto * leaf = unit.decl<ClassDecl>(1);
  ASSERT_NE(leaf, nullptr);
  EXPECT_TRUE(leaf->isFinal);
  EXPECT_TRUE(leaf->members.empty());
}

TEST(Declarations, PropertiesAndMethods)
{
  auto unit = parse_php(
    "<?php\nclass Counter {\n"
    "  private static int $instances = 0, $peak;\n"
    "  var $legacy;\n"
    "  protected ?array $cache = null;\n"
    "  final public static function create(): static { return new static(); }\n"
    "  function tick() {}\n"
    "}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * cls = unit.decl<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 5U);

  const auto * counters = dyn_cast<PropertyDecl>(cls->members[0]);
  ASSERT_NE(counters, nullptr);
  EXPECT_EQ(counters->visibility, Visibility::Private);
  EXPECT_TRUE(counters->hasExplicitVisibility);
  EXPECT_TRUE(counters->isStatic);
  ASSERT_EQ(counters->items.size(), 2U);
  EXPECT_EQ(counters->items[0]->name, "instances");
  EXPECT_NE(counters->items[0]->defaultValue, nullptr);
  EXPECT_EQ(counters->items[1]->name, "peak");
  EXPECT_EQ(counters->items[1]->defaultValue, nullptr);

  const auto * legacy = dyn_cast<PropertyDecl>(cls->members[1]);
  ASSERT_NE(legacy, nullptr);
  EXPECT_EQ(legacy->visibility, Visibility::Public);
  EXPECT_FALSE(legacy->hasExplicitVisibility);
  EXPECT_EQ(legacy->type, nullptr);

  const auto * cache = dyn_cast<PropertyDecl>(cls->members[2]);
  ASSERT_NE(cache, nullptr);
  EXPECT_EQ(cache->visibility, Visibility::Protected);
  EXPECT_TRUE(isa<NullableType>(cache->type));

  const auto * create = dyn_cast<MethodDecl>(cls->members[3]);
  ASSERT_NE(create, nullptr);
  EXPECT_EQ(create->name, "create");
  EXPECT_TRUE(create->isFinal);
  EXPECT_TRUE(create->isStatic);
  EXPECT_EQ(create->visibility, Visibility::Public);
  EXPECT_TRUE(create->hasExplicitVisibility);
  const auto * ret = dyn_cast<NamedType>(create->returnType);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->name, "static");
  EXPECT_TRUE(ret->isBuiltin);

  const auto * tick = dyn_cast<MethodDecl>(cls->members[4]);
  ASSERT_NE(tick, nullptr);
  EXPECT_FALSE(tick->hasExplicitVisibility);
  EXPECT_EQ(tick->visibility, Visibility::Public);
}

TEST(Declarations, InterfaceMethodsHaveNoBody)
{
  auto unit = parse_php(
    "<?php\ninterface Shape extends Countable, Stringable {\n"
    "  const SIDES = 0;\n"
    "  public function area(): float;\n"
    "}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * shape = unit.decl<InterfaceDecl>(0);
  ASSERT_NE(shape, nullptr);
  EXPECT_EQ(shape->name, "Shape");
  ASSERT_EQ(shape->extends.size(), 2U);
  EXPECT_EQ(shape->extends[1]->name, "Stringable");
  ASSERT_EQ(shape->members.size(), 2U);
  EXPECT_TRUE(isa<ClassConstDecl>(shape->members[0]));

  const auto * area = dyn_cast<MethodDecl>(shape->members[1]);
  ASSERT_NE(area, nullptr);
  EXPECT_EQ(area->body, nullptr);
}

TEST(Declarations, TraitUse)
{
  auto unit = parse_php(
    "<?php\ntrait Greets { public function hi() { return 'hi'; } }\n"
    "class Person {\n  use Greets, Logs;\n  use Walks { Walks::go insteadof Runs; }\n}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * trait = unit.decl<TraitDecl>(0);
  ASSERT_NE(trait, nullptr);
  EXPECT_EQ(trait->members.size(), 1U);

  const auto * person = unit.decl<ClassDecl>(1);
  ASSERT_NE(person, nullptr);
  ASSERT_EQ(person->members.size(), 2U);

  const auto * plain = dyn_cast<TraitUseDecl>(person->members[0]);
  ASSERT_NE(plain, nullptr);
  ASSERT_EQ(plain->traits.size(), 2U);
  EXPECT_EQ(plain->traits[0]->name, "Greets");
  EXPECT_EQ(plain->traits[1]->name, "Logs");
  EXPECT_FALSE(plain->hasAdaptations);

  const auto * adapted = dyn_cast<TraitUseDecl>(person->members[1]);
  ASSERT_NE(adapted, nullptr);
  EXPECT_TRUE(adapted->hasAdaptations);
}

TEST(Declarations, BackedEnum)
{
  auto unit = parse_php(
    "<?php\nenum Suit: string implements HasLabel {\n"
    "  case Hearts = 'H';\n"
    "  case Spades = 'S';\n"
    "  public function label(): string { return $this->name; }\n"
    "}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * suit = unit.decl<EnumDecl>(0);
  ASSERT_NE(suit, nullptr);
  EXPECT_EQ(suit->name, "Suit");
  const auto * backing = dyn_cast<NamedType>(suit->backingType);
  ASSERT_NE(backing, nullptr);
  EXPECT_EQ(backing->name, "string");
  ASSERT_EQ(suit->implements.size(), 1U);
  EXPECT_EQ(suit->implements[0]->name, "HasLabel");

  ASSERT_EQ(suit->members.size(), 3U);
  const auto * hearts = dyn_cast<EnumCaseDecl>(suit->members[0]);
  ASSERT_NE(hearts, nullptr);
  EXPECT_EQ(hearts->name, "Hearts");
  ASSERT_NE(hearts->value, nullptr);
  EXPECT_EQ(cast<StringLiteralExpr>(hearts->value)->value, "H");
  EXPECT_TRUE(isa<MethodDecl>(suit->members[2]));
}

TEST(Declarations, PureEnumCasesHaveNoValue)
{
  auto unit = parse_php("<?php\nenum Status { case Active; case Inactive; }\n");
  const auto * status = unit.decl<EnumDecl>(0);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->backingType, nullptr);
  ASSERT_EQ(status->members.size(), 2U);
  EXPECT_EQ(cast<EnumCaseDecl>(status->members[1])->value, nullptr);
}

TEST(Declarations, GlobalAndClassConstants)
{
  auto unit = parse_php(
    "<?php\nconst A = 1, B = 'two';\n"
    "class K {\n  final protected const LIMIT = 10;\n  const MAX = 99;\n}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * consts = unit.decl<ConstDecl>(0);
  ASSERT_NE(consts, nullptr);
  ASSERT_EQ(consts->items.size(), 2U);
  EXPECT_EQ(consts->items[0]->name, "A");
  EXPECT_EQ(consts->items[1]->name, "B");

  const auto * k = unit.decl<ClassDecl>(1);
  ASSERT_NE(k, nullptr);
  ASSERT_EQ(k->members.size(), 2U);

  const auto * limit = dyn_cast<ClassConstDecl>(k->members[0]);
  ASSERT_NE(limit, nullptr);
  EXPECT_TRUE(limit->isFinal);
  EXPECT_EQ(limit->visibility, Visibility::Protected);
  EXPECT_TRUE(limit->hasExplicitVisibility);
  EXPECT_EQ(limit->type, nullptr);

  const auto * max = dyn_cast<ClassConstDecl>(k->members[1]);
  ASSERT_NE(max, nullptr);
  EXPECT_FALSE(max->hasExplicitVisibility);
  ASSERT_EQ(max->items.size(), 1U);
  EXPECT_EQ(cast<IntLiteralExpr>(max->items[0]->value)->value, 99);
}

TEST(Declarations, AttributesOnDeclarations)
{
  auto unit = parse_php(
    "<?php\n#[Entity, Table('users')]\nclass User {\n"
    "  #[\\Deprecated(reason: 'old')]\n  public function legacy(#[Sensitive] $secret) {}\n}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * user = unit.decl<ClassDecl>(0);
  ASSERT_NE(user, nullptr);
  ASSERT_EQ(user->attributes.size(), 2U);
  EXPECT_EQ(user->attributes[0]->name, "Entity");
  EXPECT_TRUE(user->attributes[0]->args.empty());
  EXPECT_EQ(user->attributes[1]->name, "Table");
  ASSERT_EQ(user->attributes[1]->args.size(), 1U);

  const auto * legacy = dyn_cast<MethodDecl>(user->members[0]);
  ASSERT_NE(legacy, nullptr);
  ASSERT_EQ(legacy->attributes.size(), 1U);
  EXPECT_EQ(legacy->attributes[0]->name, "Deprecated");
  ASSERT_EQ(legacy->attributes[0]->args.size(), 1U);
  EXPECT_EQ(legacy->attributes[0]->args[0]->name, "reason");

  ASSERT_EQ(legacy->params.size(), 1U);
  ASSERT_EQ(legacy->params[0]->attributes.size(), 1U);
  EXPECT_EQ(legacy->params[0]->attributes[0]->name, "Sensitive");
}

TEST(Declarations, ReadonlyMethodIsInvalid)
{
  auto unit = parse_php("<?php\nclass A {\n  readonly public function f() {}\n}\n");
  // The grammar may reject the modifier outright; either way nothing is dropped silently.
  EXPECT_TRUE(unit.diags().has_errors()) << unit.dump();
}

TEST(Declarations, ReadonlyClassGate)
{
  const std::string src = "<?php\nreadonly class Money {}\n";
  auto modern = parse_php(src, PhpVersion::Php82);
  ASSERT_NE(modern.decl<ClassDecl>(0), nullptr);
  EXPECT_TRUE(modern.decl<ClassDecl>(0)->isReadonly);
  EXPECT_TRUE(modern.diags().empty());

  auto older = parse_php(src, PhpVersion::Php81);
  ASSERT_NE(older.decl<ClassDecl>(0), nullptr);
  EXPECT_FALSE(older.decl<ClassDecl>(0)->isReadonly);
  EXPECT_EQ(older.with_code(diag_code::k_construct_unavailable).size(), 1U);
}
