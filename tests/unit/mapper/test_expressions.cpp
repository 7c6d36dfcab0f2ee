// tests/unit/mapper/test_expressions.cpp - expression mapping
#include <gtest/gtest.h>

#include <string>

#include "celerrate/ast/ast.hpp"
#include "celerrate/test_support/parse_helpers.hpp"

using namespace celerrate;
using celerrate::test_support::parse_php;
using celerrate::test_support::TestMapUnit;

namespace
{

/// Right-hand side of `$r = <expr>;`
const Expr * rhs(const TestMapUnit & unit)
{
  const auto * assign = unit.expr<AssignExpr>(0);
  return assign != nullptr ? assign->value : nullptr;
}

}  // namespace

TEST(Expressions, BinaryPrecedence)
{
  auto unit = parse_php("<?php $r = $a + $b * $c;");
  EXPECT_TRUE(unit.diags().empty());
  const auto * add = dyn_cast<BinaryExpr>(rhs(unit));
  ASSERT_NE(add, nullptr) << unit.dump();
  EXPECT_EQ(add->op, BinaryOp::Add);
  EXPECT_TRUE(isa<VariableExpr>(add->lhs));
  const auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
}

TEST(Expressions, ParenthesesLeaveNoNode)
{
  auto unit = parse_php("<?php $r = ($a + $b) * $c;");
  const auto * mul = dyn_cast<BinaryExpr>(rhs(unit));
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
  EXPECT_EQ(cast<BinaryExpr>(mul->lhs)->op, BinaryOp::Add);
}

TEST(Expressions, OperatorSpellings)
{
  struct Case
  {
    const char * src;
    BinaryOp op;
  };
  const Case cases[] = {
    {"<?php $r = $a . $b;", BinaryOp::Concat},
    {"<?php $r = $a ?? $b;", BinaryOp::Coalesce},
    {"<?php $r = $a <=> $b;", BinaryOp::Spaceship},
    {"<?php $r = $a === $b;", BinaryOp::Identical},
    {"<?php $r = $a !== $b;", BinaryOp::NotIdentical},
    {"<?php $r = $a ** $b;", BinaryOp::Pow},
    {"<?php $r = $a instanceof Foo;", BinaryOp::Instanceof},
    {"<?php $r = ($a and $b);", BinaryOp::LogicalAnd},
    {"<?php $r = ($a xor $b);", BinaryOp::LogicalXor},
    {"<?php $r = $a << 2;", BinaryOp::ShiftLeft},
  };
  for (const Case & c : cases) {
    SCOPED_TRACE(c.src);
    auto unit = parse_php(c.src);
    const auto * bin = dyn_cast<BinaryExpr>(rhs(unit));
    ASSERT_NE(bin, nullptr) << unit.dump();
    EXPECT_EQ(bin->op, c.op);
  }
}

TEST(Expressions, UnaryAndIncDec)
{
  auto unit = parse_php("<?php $r = !$a; $r = -$b; $r = @f(); $r = ~$c; ++$i; $j--;");
  const auto value_of = [&](size_t i) { return unit.expr<AssignExpr>(i)->value; };
  EXPECT_EQ(cast<UnaryExpr>(value_of(0))->op, UnaryOp::Not);
  EXPECT_EQ(cast<UnaryExpr>(value_of(1))->op, UnaryOp::Negate);
  EXPECT_EQ(cast<UnaryExpr>(value_of(2))->op, UnaryOp::Silence);
  EXPECT_EQ(cast<UnaryExpr>(value_of(3))->op, UnaryOp::BitNot);

  const auto * pre = unit.expr<IncDecExpr>(4);
  ASSERT_NE(pre, nullptr);
  EXPECT_EQ(pre->op, IncDecOp::PreIncrement);
  const auto * post = unit.expr<IncDecExpr>(5);
  ASSERT_NE(post, nullptr);
  EXPECT_EQ(post->op, IncDecOp::PostDecrement);
}

TEST(Expressions, Assignments)
{
  auto unit = parse_php("<?php $a = 1; $b .= 'x'; $c ??= []; $d = &$e;");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  EXPECT_EQ(unit.expr<AssignExpr>(0)->op, AssignOp::Assign);
  EXPECT_EQ(unit.expr<AssignExpr>(1)->op, AssignOp::Concat);
  EXPECT_EQ(unit.expr<AssignExpr>(2)->op, AssignOp::Coalesce);

  const auto * ref = unit.expr<AssignExpr>(3);
  ASSERT_NE(ref, nullptr);
  EXPECT_TRUE(ref->byRef);
  EXPECT_EQ(cast<VariableExpr>(ref->value)->name, "e");
}

TEST(Expressions, TernaryForms)
{
  auto unit = parse_php("<?php $r = $a ? $b : $c; $s = $a ?: $c;");
  const auto * full = dyn_cast<TernaryExpr>(unit.expr<AssignExpr>(0)->value);
  ASSERT_NE(full, nullptr);
  EXPECT_NE(full->thenExpr, nullptr);
  const auto * short_form = dyn_cast<TernaryExpr>(unit.expr<AssignExpr>(1)->value);
  ASSERT_NE(short_form, nullptr);
  EXPECT_EQ(short_form->thenExpr, nullptr);
  EXPECT_EQ(cast<VariableExpr>(short_form->elseExpr)->name, "c");
}

TEST(Expressions, CallsWithArguments)
{
  auto unit = parse_php("<?php $r = format($text, width: 80, ...$rest);");
  const auto * call = dyn_cast<CallExpr>(rhs(unit));
  ASSERT_NE(call, nullptr) << unit.dump();
  EXPECT_EQ(cast<NameExpr>(call->callee)->name, "format");
  ASSERT_EQ(call->args.size(), 3U);
  EXPECT_TRUE(call->args[0]->name.empty());
  EXPECT_EQ(call->args[1]->name, "width");
  EXPECT_TRUE(call->args[2]->isSpread);
  EXPECT_FALSE(call->isFirstClassCallable);
}

TEST(Expressions, FirstClassCallable)
{
  auto unit = parse_php("<?php $f = strlen(...); $g = $obj->run(...); $h = Foo::make(...);");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();
  EXPECT_TRUE(cast<CallExpr>(unit.expr<AssignExpr>(0)->value)->isFirstClassCallable);
  EXPECT_TRUE(cast<MethodCallExpr>(unit.expr<AssignExpr>(1)->value)->isFirstClassCallable);
  EXPECT_TRUE(cast<StaticCallExpr>(unit.expr<AssignExpr>(2)->value)->isFirstClassCallable);
}

TEST(Expressions, MemberAccess)
{
  auto unit = parse_php(
    "<?php $r = $user?->profile->name; $s = $svc->run(1); $t = Cfg::$cache; $u = Cfg::VERSION; "
    "$v = Foo::class; $w = $list[0]; $list[] = 3;");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * name = dyn_cast<PropertyFetchExpr>(unit.expr<AssignExpr>(0)->value);
  ASSERT_NE(name, nullptr);
  EXPECT_FALSE(name->nullsafe);
  EXPECT_EQ(cast<NameExpr>(name->name)->name, "name");
  const auto * profile = dyn_cast<PropertyFetchExpr>(name->object);
  ASSERT_NE(profile, nullptr);
  EXPECT_TRUE(profile->nullsafe);

  const auto * run = dyn_cast<MethodCallExpr>(unit.expr<AssignExpr>(1)->value);
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(cast<NameExpr>(run->name)->name, "run");
  EXPECT_EQ(run->args.size(), 1U);

  const auto * cache = dyn_cast<StaticPropertyFetchExpr>(unit.expr<AssignExpr>(2)->value);
  ASSERT_NE(cache, nullptr);
  EXPECT_EQ(cast<NameExpr>(cache->scope)->name, "Cfg");

  const auto * version = dyn_cast<ClassConstFetchExpr>(unit.expr<AssignExpr>(3)->value);
  ASSERT_NE(version, nullptr);
  EXPECT_EQ(cast<NameExpr>(version->name)->name, "VERSION");

  const auto * cls = dyn_cast<ClassConstFetchExpr>(unit.expr<AssignExpr>(4)->value);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cast<NameExpr>(cls->name)->name, "class");

  const auto * at = dyn_cast<SubscriptExpr>(unit.expr<AssignExpr>(5)->value);
  ASSERT_NE(at, nullptr);
  EXPECT_NE(at->index, nullptr);

  const auto * append = dyn_cast<SubscriptExpr>(unit.expr<AssignExpr>(6)->target);
  ASSERT_NE(append, nullptr);
  EXPECT_EQ(append->index, nullptr);
}

TEST(Expressions, NewExpressions)
{
  auto unit = parse_php("<?php $a = new Foo(1, 2); $b = new \\App\\Bar; $c = new $cls();");
  const auto * a = dyn_cast<NewExpr>(unit.expr<AssignExpr>(0)->value);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(cast<NameExpr>(a->classRef)->name, "Foo");
  EXPECT_EQ(a->args.size(), 2U);
  EXPECT_EQ(a->anonymousClass, nullptr);

  const auto * b = dyn_cast<NewExpr>(unit.expr<AssignExpr>(1)->value);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(cast<NameExpr>(b->classRef)->nameKind, NameKind::FullyQualified);
  EXPECT_TRUE(b->args.empty());

  const auto * c = dyn_cast<NewExpr>(unit.expr<AssignExpr>(2)->value);
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(isa<VariableExpr>(c->classRef));
}

TEST(Expressions, ClosuresAndArrowFunctions)
{
  auto unit = parse_php(
    "<?php $f = static function (int $x) use ($base, &$acc): int { return $x + $base; };\n"
    "$g = fn($y) => $y * 2;");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * closure = dyn_cast<ClosureExpr>(unit.expr<AssignExpr>(0)->value);
  ASSERT_NE(closure, nullptr);
  EXPECT_TRUE(closure->isStatic);
  ASSERT_EQ(closure->params.size(), 1U);
  ASSERT_EQ(closure->uses.size(), 2U);
  EXPECT_EQ(closure->uses[0]->name, "base");
  EXPECT_FALSE(closure->uses[0]->byRef);
  EXPECT_EQ(closure->uses[1]->name, "acc");
  EXPECT_TRUE(closure->uses[1]->byRef);
  ASSERT_NE(closure->returnType, nullptr);
  ASSERT_NE(closure->body, nullptr);

  const auto * arrow = dyn_cast<ArrowFunctionExpr>(unit.expr<AssignExpr>(1)->value);
  ASSERT_NE(arrow, nullptr);
  ASSERT_EQ(arrow->params.size(), 1U);
  EXPECT_EQ(arrow->params[0]->name, "y");
  EXPECT_TRUE(isa<BinaryExpr>(arrow->body));
}

TEST(Expressions, MatchArms)
{
  auto unit = parse_php(
    "<?php $r = match ($code) { 200, 201 => 'ok', 404 => 'missing', default => 'error' };");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * m = dyn_cast<MatchExpr>(rhs(unit));
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(cast<VariableExpr>(m->subject)->name, "code");
  ASSERT_EQ(m->arms.size(), 3U);
  EXPECT_EQ(m->arms[0]->conditions.size(), 2U);
  EXPECT_FALSE(m->arms[0]->isDefault);
  EXPECT_EQ(m->arms[1]->conditions.size(), 1U);
  EXPECT_TRUE(m->arms[2]->isDefault);
  EXPECT_TRUE(m->arms[2]->conditions.empty());
  EXPECT_EQ(cast<StringLiteralExpr>(m->arms[2]->body)->value, "error");
}

TEST(Expressions, ThrowInsideExpression)
{
  auto unit = parse_php("<?php $v = $input ?? throw new InvalidArgumentException();");
  const auto * coalesce = dyn_cast<BinaryExpr>(rhs(unit));
  ASSERT_NE(coalesce, nullptr) << unit.dump();
  EXPECT_TRUE(isa<ThrowExpr>(coalesce->rhs));
}

TEST(Expressions, ArraysWithKeysRefsAndSpread)
{
  auto unit = parse_php("<?php $r = ['a' => 1, &$b, ...$rest];");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();
  const auto * array = dyn_cast<ArrayLiteralExpr>(rhs(unit));
  ASSERT_NE(array, nullptr);
  ASSERT_EQ(array->elements.size(), 3U);
  EXPECT_EQ(cast<StringLiteralExpr>(array->elements[0]->key)->value, "a");
  EXPECT_TRUE(array->elements[1]->byRef);
  EXPECT_TRUE(array->elements[2]->isSpread);
}

TEST(Expressions, IncludeCloneYieldPrint)
{
  auto unit = parse_php(
    "<?php require_once __DIR__ . '/boot.php';\n$c = clone $o;\nprint 'x';\n"
    "function gen() { yield; yield 1; yield 'k' => 2; yield from other(); }\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * inc = unit.expr<IncludeExpr>(0);
  ASSERT_NE(inc, nullptr);
  EXPECT_EQ(inc->includeKind, IncludeKind::RequireOnce);
  EXPECT_TRUE(isa<BinaryExpr>(inc->operand));

  EXPECT_TRUE(isa<CloneExpr>(unit.expr<AssignExpr>(1)->value));
  EXPECT_NE(unit.expr<PrintExpr>(2), nullptr);

  const auto * gen = unit.decl<FunctionDecl>(3);
  ASSERT_NE(gen, nullptr);
  ASSERT_EQ(gen->body->stmts.size(), 4U);
  const auto yield_at = [&](size_t i) {
    return cast<YieldExpr>(cast<ExprStmt>(gen->body->stmts[i])->expr);
  };
  EXPECT_EQ(yield_at(0)->value, nullptr);
  EXPECT_NE(yield_at(1)->value, nullptr);
  EXPECT_EQ(yield_at(1)->key, nullptr);
  EXPECT_NE(yield_at(2)->key, nullptr);
  EXPECT_TRUE(yield_at(3)->isFrom);
}

TEST(Expressions, DynamicVariables)
{
  auto unit = parse_php("<?php $r = $$name;");
  const auto * var = dyn_cast<VariableExpr>(rhs(unit));
  ASSERT_NE(var, nullptr) << unit.dump();
  EXPECT_TRUE(var->name.empty());
  ASSERT_NE(var->nameExpr, nullptr);
}

TEST(Expressions, NameKinds)
{
  auto unit = parse_php("<?php f(); \\g(); A\\h(); namespace\\k();");
  const auto callee = [&](size_t i) { return cast<NameExpr>(unit.expr<CallExpr>(i)->callee); };
  EXPECT_EQ(callee(0)->nameKind, NameKind::Unqualified);
  EXPECT_EQ(callee(1)->nameKind, NameKind::FullyQualified);
  EXPECT_EQ(callee(1)->name, "g");
  EXPECT_EQ(callee(2)->nameKind, NameKind::Qualified);
  EXPECT_EQ(callee(2)->name, "A\\h");
  EXPECT_EQ(callee(3)->nameKind, NameKind::Relative);
  EXPECT_EQ(callee(3)->name, "k");
}
