// tests/unit/mapper/test_statements.cpp - statement mapping
#include <gtest/gtest.h>

#include <string>

#include "celerrate/ast/ast.hpp"
#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/test_support/parse_helpers.hpp"

using namespace celerrate;
using celerrate::test_support::parse_php;

TEST(Statements, EchoWithSeveralExpressions)
{
  auto unit = parse_php("<?php echo $a, 'b', 3;");
  const auto * echo = dyn_cast<EchoStmt>(unit.stmt(0));
  ASSERT_NE(echo, nullptr) << unit.dump();
  ASSERT_EQ(echo->exprs.size(), 3U);
  EXPECT_TRUE(isa<VariableExpr>(echo->exprs[0]));
  EXPECT_TRUE(isa<StringLiteralExpr>(echo->exprs[1]));
  EXPECT_TRUE(isa<IntLiteralExpr>(echo->exprs[2]));
}

TEST(Statements, ReturnWithAndWithoutValue)
{
  auto unit = parse_php("<?php function f() { return; } function g() { return 1; }");
  const auto * f = unit.decl<FunctionDecl>(0);
  const auto * g = unit.decl<FunctionDecl>(1);
  ASSERT_NE(f, nullptr);
  ASSERT_NE(g, nullptr);
  EXPECT_EQ(cast<ReturnStmt>(f->body->stmts[0])->value, nullptr);
  EXPECT_NE(cast<ReturnStmt>(g->body->stmts[0])->value, nullptr);
}

TEST(Statements, IfElseIfElse)
{
  auto unit = parse_php(
    "<?php\nif ($a) { f(); } elseif ($b) { g(); } elseif ($c) { h(); } else { k(); }\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * stmt = dyn_cast<IfStmt>(unit.stmt(0));
  ASSERT_NE(stmt, nullptr);
  EXPECT_EQ(cast<VariableExpr>(stmt->condition)->name, "a");
  EXPECT_EQ(stmt->thenBlock->stmts.size(), 1U);
  ASSERT_EQ(stmt->elseIfs.size(), 2U);
  EXPECT_EQ(cast<VariableExpr>(stmt->elseIfs[0]->condition)->name, "b");
  EXPECT_EQ(cast<VariableExpr>(stmt->elseIfs[1]->condition)->name, "c");
  ASSERT_NE(stmt->elseBlock, nullptr);
  EXPECT_EQ(stmt->elseBlock->stmts.size(), 1U);
}

TEST(Statements, Loops)
{
  auto unit = parse_php(
    "<?php\n"
    "while ($i < 10) { $i++; }\n"
    "do { $i--; } while ($i > 0);\n"
    "for ($i = 0, $j = 1; $i < $n; $i++, $j *= 2) { continue; }\n"
    "for (;;) { break; }\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * w = dyn_cast<WhileStmt>(unit.stmt(0));
  ASSERT_NE(w, nullptr);
  EXPECT_TRUE(isa<BinaryExpr>(w->condition));
  EXPECT_EQ(w->body->stmts.size(), 1U);

  const auto * d = dyn_cast<DoWhileStmt>(unit.stmt(1));
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->body->stmts.size(), 1U);
  EXPECT_EQ(cast<BinaryExpr>(d->condition)->op, BinaryOp::Greater);

  const auto * f = dyn_cast<ForStmt>(unit.stmt(2));
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->init.size(), 2U);
  EXPECT_EQ(f->condition.size(), 1U);
  ASSERT_EQ(f->step.size(), 2U);
  EXPECT_TRUE(isa<IncDecExpr>(f->step[0]));
  EXPECT_EQ(cast<AssignExpr>(f->step[1])->op, AssignOp::Mul);

  const auto * forever = dyn_cast<ForStmt>(unit.stmt(3));
  ASSERT_NE(forever, nullptr);
  EXPECT_TRUE(forever->init.empty());
  EXPECT_TRUE(forever->condition.empty());
  EXPECT_TRUE(forever->step.empty());
  ASSERT_EQ(forever->body->stmts.size(), 1U);
  EXPECT_TRUE(isa<BreakStmt>(forever->body->stmts[0]));
}

TEST(Statements, ForeachForms)
{
  auto unit = parse_php(
    "<?php\n"
    "foreach ($items as $item) {}\n"
    "foreach ($map as $key => &$value) {}\n"
    "foreach ($pairs as [$left, $right]) {}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * plain = dyn_cast<ForeachStmt>(unit.stmt(0));
  ASSERT_NE(plain, nullptr);
  EXPECT_EQ(cast<VariableExpr>(plain->subject)->name, "items");
  EXPECT_EQ(plain->key, nullptr);
  EXPECT_EQ(cast<VariableExpr>(plain->value)->name, "item");
  EXPECT_FALSE(plain->byRef);

  const auto * keyed = dyn_cast<ForeachStmt>(unit.stmt(1));
  ASSERT_NE(keyed, nullptr);
  ASSERT_NE(keyed->key, nullptr);
  EXPECT_EQ(cast<VariableExpr>(keyed->key)->name, "key");
  EXPECT_EQ(cast<VariableExpr>(keyed->value)->name, "value");
  EXPECT_TRUE(keyed->byRef);

  const auto * destructured = dyn_cast<ForeachStmt>(unit.stmt(2));
  ASSERT_NE(destructured, nullptr);
  const auto * list = dyn_cast<ListExpr>(destructured->value);
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(list->elements.size(), 2U);
}

TEST(Statements, SwitchCases)
{
  auto unit = parse_php(
    "<?php\nswitch ($x) {\n  case 1:\n  case 2:\n    f();\n    break;\n  default:\n    g();\n}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * sw = dyn_cast<SwitchStmt>(unit.stmt(0));
  ASSERT_NE(sw, nullptr);
  ASSERT_EQ(sw->cases.size(), 3U);
  EXPECT_EQ(cast<IntLiteralExpr>(sw->cases[0]->test)->value, 1);
  EXPECT_TRUE(sw->cases[0]->body.empty());
  EXPECT_EQ(sw->cases[1]->body.size(), 2U);
  EXPECT_EQ(sw->cases[2]->test, nullptr);
  EXPECT_EQ(sw->cases[2]->body.size(), 1U);
}

TEST(Statements, BreakAndContinueDepth)
{
  auto unit = parse_php("<?php while (1) { while (1) { break 2; continue; } }");
  const auto * outer = dyn_cast<WhileStmt>(unit.stmt(0));
  ASSERT_NE(outer, nullptr);
  const auto * inner = cast<WhileStmt>(outer->body->stmts[0]);
  const auto * brk = dyn_cast<BreakStmt>(inner->body->stmts[0]);
  ASSERT_NE(brk, nullptr);
  ASSERT_NE(brk->depth, nullptr);
  EXPECT_EQ(cast<IntLiteralExpr>(brk->depth)->value, 2);
  const auto * cont = dyn_cast<ContinueStmt>(inner->body->stmts[1]);
  ASSERT_NE(cont, nullptr);
  EXPECT_EQ(cont->depth, nullptr);
}

TEST(Statements, TryCatchFinally)
{
  auto unit = parse_php(
    "<?php\ntry { risky(); }\n"
    "catch (NotFound | \\App\\Gone $e) { log($e); }\n"
    "catch (Throwable) {}\n"
    "finally { cleanup(); }\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * t = dyn_cast<TryStmt>(unit.stmt(0));
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->body->stmts.size(), 1U);
  ASSERT_EQ(t->catches.size(), 2U);

  const CatchClause * multi = t->catches[0];
  ASSERT_EQ(multi->types.size(), 2U);
  EXPECT_EQ(multi->types[0]->name, "NotFound");
  EXPECT_EQ(multi->types[1]->name, "App\\Gone");
  EXPECT_EQ(multi->types[1]->nameKind, NameKind::FullyQualified);
  ASSERT_NE(multi->var, nullptr);
  EXPECT_EQ(multi->var->name, "e");

  EXPECT_EQ(t->catches[1]->var, nullptr);
  ASSERT_NE(t->finallyBlock, nullptr);
  EXPECT_EQ(t->finallyBlock->stmts.size(), 1U);
}

TEST(Statements, ThrowStatement)
{
  auto unit = parse_php("<?php throw new RuntimeException('x');");
  const auto * t = dyn_cast<ThrowStmt>(unit.stmt(0));
  ASSERT_NE(t, nullptr) << unit.dump();
  EXPECT_TRUE(isa<NewExpr>(t->operand));
  // A statement-level throw is fine before 8.0.
  auto old = parse_php("<?php throw new RuntimeException('x');", PhpVersion::Php74);
  EXPECT_TRUE(old.diags().empty());
}

TEST(Statements, GlobalStaticUnset)
{
  auto unit = parse_php(
    "<?php function f() {\n  global $db, $cfg;\n  static $hits = 0, $last;\n  unset($a, $b['k']);\n}\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * f = unit.decl<FunctionDecl>(0);
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->body->stmts.size(), 3U);

  const auto * g = dyn_cast<GlobalStmt>(f->body->stmts[0]);
  ASSERT_NE(g, nullptr);
  EXPECT_EQ(g->vars.size(), 2U);

  const auto * s = dyn_cast<StaticVarStmt>(f->body->stmts[1]);
  ASSERT_NE(s, nullptr);
  ASSERT_EQ(s->vars.size(), 2U);
  EXPECT_EQ(s->vars[0]->name, "hits");
  EXPECT_NE(s->vars[0]->init, nullptr);
  EXPECT_EQ(s->vars[1]->name, "last");
  EXPECT_EQ(s->vars[1]->init, nullptr);

  const auto * u = dyn_cast<UnsetStmt>(f->body->stmts[2]);
  ASSERT_NE(u, nullptr);
  ASSERT_EQ(u->exprs.size(), 2U);
  EXPECT_TRUE(isa<SubscriptExpr>(u->exprs[1]));
}

TEST(Statements, Namespaces)
{
  auto unit = parse_php("<?php\nnamespace App\\Models;\nclass User {}\n");
  const auto * ns = dyn_cast<NamespaceStmt>(unit.stmt(0));
  ASSERT_NE(ns, nullptr);
  EXPECT_EQ(ns->name, "App\\Models");
  EXPECT_EQ(ns->body, nullptr);
  EXPECT_NE(unit.decl<ClassDecl>(1), nullptr);

  auto braced = parse_php("<?php\nnamespace Lib { function f() {} }\nnamespace { f(); }\n");
  const auto * lib = dyn_cast<NamespaceStmt>(braced.stmt(0));
  ASSERT_NE(lib, nullptr);
  ASSERT_NE(lib->body, nullptr);
  EXPECT_EQ(lib->body->stmts.size(), 1U);
  const auto * global = dyn_cast<NamespaceStmt>(braced.stmt(1));
  ASSERT_NE(global, nullptr);
  EXPECT_TRUE(global->name.empty());
  ASSERT_NE(global->body, nullptr);
}

TEST(Statements, UseImports)
{
  auto unit = parse_php(
    "<?php\n"
    "use App\\Models\\User;\n"
    "use App\\Support\\Str as S;\n"
    "use function App\\Helpers\\tap;\n"
    "use const App\\VERSION;\n"
    "use App\\Http\\{Request, Response as Res};\n");
  EXPECT_TRUE(unit.diags().empty()) << unit.dump();

  const auto * user = dyn_cast<UseStmt>(unit.stmt(0));
  ASSERT_NE(user, nullptr);
  ASSERT_EQ(user->clauses.size(), 1U);
  EXPECT_EQ(user->clauses[0]->name, "App\\Models\\User");
  EXPECT_TRUE(user->clauses[0]->alias.empty());

  const auto * aliased = dyn_cast<UseStmt>(unit.stmt(1));
  ASSERT_NE(aliased, nullptr);
  EXPECT_EQ(aliased->clauses[0]->alias, "S");

  const auto * fn = dyn_cast<UseStmt>(unit.stmt(2));
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->useKind, UseKind::Function);

  const auto * cst = dyn_cast<UseStmt>(unit.stmt(3));
  ASSERT_NE(cst, nullptr);
  EXPECT_EQ(cst->useKind, UseKind::Const);

  const auto * group = dyn_cast<UseStmt>(unit.stmt(4));
  ASSERT_NE(group, nullptr);
  ASSERT_EQ(group->clauses.size(), 2U);
  EXPECT_EQ(group->clauses[0]->name, "App\\Http\\Request");
  EXPECT_EQ(group->clauses[1]->name, "App\\Http\\Response");
  EXPECT_EQ(group->clauses[1]->alias, "Res");
}

TEST(Statements, DeclareDirective)
{
  auto unit = parse_php("<?php\ndeclare(strict_types=1);\necho 1;\n");
  const auto * decl = dyn_cast<DeclareStmt>(unit.stmt(0));
  ASSERT_NE(decl, nullptr) << unit.dump();
  ASSERT_EQ(decl->directives.size(), 1U);
  EXPECT_EQ(decl->directives[0]->name, "strict_types");
  EXPECT_EQ(cast<IntLiteralExpr>(decl->directives[0]->value)->value, 1);
  EXPECT_EQ(decl->body, nullptr);
  EXPECT_TRUE(isa<EchoStmt>(unit.stmt(1)));
}

TEST(Statements, GotoAndLabel)
{
  auto unit = parse_php("<?php\nretry:\n$n++;\ngoto retry;\n");
  const auto * label = dyn_cast<LabelStmt>(unit.stmt(0));
  ASSERT_NE(label, nullptr) << unit.dump();
  EXPECT_EQ(label->label, "retry");
  const auto * jump = dyn_cast<GotoStmt>(unit.stmt(2));
  ASSERT_NE(jump, nullptr);
  EXPECT_EQ(jump->label, "retry");
}

TEST(Statements, EmptyStatement)
{
  auto unit = parse_php("<?php ;");
  EXPECT_TRUE(isa<EmptyStmt>(unit.stmt(0))) << unit.dump();
}
