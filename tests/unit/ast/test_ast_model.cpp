// tests/unit/ast/test_ast_model.cpp - Arena, casting and node helpers
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_context.hpp"
#include "celerrate/ast/ast_dumper.hpp"
#include "celerrate/basic/casting.hpp"

using namespace celerrate;

TEST(AstContext, InternSharesStorage)
{
  AstContext ctx;
  const std::string a = "Foo";
  const std::string b = "Foo";

  const std::string_view ia = ctx.intern(a);
  const std::string_view ib = ctx.intern(b);
  EXPECT_EQ(ia, "Foo");
  EXPECT_EQ(ia.data(), ib.data());
  EXPECT_EQ(ctx.get_string_count(), 1U);

  EXPECT_TRUE(ctx.intern("").empty());
}

TEST(AstContext, CopyToArenaKeepsOrder)
{
  AstContext ctx;
  std::vector<Expr *> exprs{
    ctx.create<IntLiteralExpr>(1), ctx.create<IntLiteralExpr>(2), ctx.create<IntLiteralExpr>(3)};

  const gsl::span<Expr *> copied = ctx.copy_to_arena(exprs);
  ASSERT_EQ(copied.size(), 3U);
  EXPECT_EQ(copied[0], exprs[0]);
  EXPECT_EQ(copied[2], exprs[2]);

  EXPECT_TRUE(ctx.copy_to_arena(std::vector<Expr *>{}).empty());
}

TEST(Casting, IsaFollowsCategories)
{
  AstContext ctx;
  const AstNode * lit = ctx.create<IntLiteralExpr>(7);
  const AstNode * type = ctx.create<NamedType>("int", true);

  EXPECT_TRUE(isa<Expr>(lit));
  EXPECT_TRUE(isa<IntLiteralExpr>(lit));
  EXPECT_FALSE(isa<TypeNode>(lit));
  EXPECT_TRUE((isa<FloatLiteralExpr, IntLiteralExpr>(lit)));
  EXPECT_TRUE(isa<TypeNode>(type));

  EXPECT_EQ(dyn_cast<FloatLiteralExpr>(lit), nullptr);
  ASSERT_NE(dyn_cast<IntLiteralExpr>(lit), nullptr);
  EXPECT_EQ(cast<IntLiteralExpr>(lit)->value, 7);

  const AstNode * none = nullptr;
  EXPECT_FALSE(isa<Expr>(none));
}

TEST(AstNodes, UnknownReasonOnlyForPlaceholders)
{
  AstContext ctx;
  const auto * unknown = ctx.create<UnknownStmt>(UnknownReason::SyntaxError, "ERROR");
  const auto * other = ctx.create<EmptyStmt>();

  EXPECT_EQ(unknown_reason(unknown), UnknownReason::SyntaxError);
  EXPECT_FALSE(unknown_reason(other).has_value());
  EXPECT_FALSE(unknown_reason(nullptr).has_value());
}

TEST(AstNodes, ConstructorNameIsCaseInsensitive)
{
  AstContext ctx;
  EXPECT_TRUE(ctx.create<MethodDecl>("__construct")->is_constructor());
  EXPECT_TRUE(ctx.create<MethodDecl>("__CONSTRUCT")->is_constructor());
  EXPECT_FALSE(ctx.create<MethodDecl>("construct")->is_constructor());
}

TEST(AstNodes, ClassPropertiesIncludePromotedOnes)
{
  AstContext ctx;
  auto * cls = ctx.create<ClassDecl>("Point");

  auto * declared = ctx.create<PropertyDecl>();
  declared->items = ctx.copy_to_arena(std::vector<PropertyItem *>{
    ctx.create<PropertyItem>("label", nullptr)});
  auto * promoted = ctx.create<PropertyDecl>();
  promoted->isPromoted = true;
  promoted->items =
    ctx.copy_to_arena(std::vector<PropertyItem *>{ctx.create<PropertyItem>("x", nullptr)});

  cls->members = ctx.copy_to_arena(std::vector<Decl *>{declared});
  cls->promotedProperties = ctx.copy_to_arena(std::vector<PropertyDecl *>{promoted});

  const auto props = cls->properties();
  ASSERT_EQ(props.size(), 2U);
  EXPECT_EQ(props[0]->name(), "label");
  EXPECT_EQ(props[1]->name(), "x");
  EXPECT_TRUE(props[1]->isPromoted);
}

TEST(AstDumper, PrintsKindsAndProperties)
{
  AstContext ctx;
  auto * lhs = ctx.create<VariableExpr>("a");
  auto * rhs = ctx.create<IntLiteralExpr>(1);
  auto * bin = ctx.create<BinaryExpr>(lhs, BinaryOp::Add, rhs);

  const std::string text = dump_to_string(bin);
  EXPECT_NE(text.find("BinaryExpr op='+'"), std::string::npos) << text;
  EXPECT_NE(text.find("|-VariableExpr name='a'"), std::string::npos) << text;
  EXPECT_NE(text.find("`-IntLiteralExpr 1"), std::string::npos) << text;
}
