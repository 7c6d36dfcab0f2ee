// celerrate/ast/ast.hpp - AST node class definitions for PHP
//
// LLVM/Clang style node hierarchy with classof() for RTTI. Every node is
// allocated in an AstContext arena and must stay trivially destructible.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "celerrate/ast/ast_enums.hpp"
#include "celerrate/basic/casting.hpp"
#include "celerrate/basic/span_tracker.hpp"

namespace celerrate
{

class Argument;
class ArrayElement;
class Attribute;
class BlockStmt;
class CatchClause;
class ClassDecl;
class ClosureUse;
class ConstItem;
class DeclareDirective;
class ElseIfClause;
class MatchArm;
class ParamDecl;
class PropertyDecl;
class PropertyItem;
class StaticVar;
class SwitchCase;
class UseClause;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node carries its NodeKind for RTTI and a Span with byte offsets
 * and 1-based line/column for both ends. Nodes are non-copyable and owned
 * by the AstContext that created them.
 */
class AstNode
{
public:
  const NodeKind kind;
  Span span_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] const Span & get_span() const noexcept { return span_; }
  [[nodiscard]] SourceRange get_range() const noexcept { return span_.to_source_range(); }

protected:
  explicit AstNode(NodeKind k, Span s = {}) : kind(k), span_(s) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(Span s = {}) : Base(K, s) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, Span s = {}) : NodeBase(s), value(v) {}
};

/// Also produced for integer literals that overflow int64, as PHP does.
class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, Span s = {}) : NodeBase(s), value(v) {}
};

/**
 * String literal in any quoting style.
 *
 * Without interpolation, value holds the decoded text and parts is empty.
 * With interpolation, parts holds StringLiteralExpr fragments and the
 * embedded expressions in source order; value holds the raw body text.
 * The quoting style is informational and ignored by structural equality.
 */
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;
  StringKind stringKind = StringKind::SingleQuoted;
  bool isInterpolated = false;
  gsl::span<Expr *> parts;

  explicit StringLiteralExpr(std::string_view v, Span s = {}) : NodeBase(s), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, Span s = {}) : NodeBase(s), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(Span s = {}) : NodeBase(s) {}
};

/// `array(...)` and `[...]` both map here.
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteralExpr>
{
public:
  gsl::span<ArrayElement *> elements;

  explicit ArrayLiteralExpr(Span s = {}) : NodeBase(s) {}
};

/// Destructuring target: `list(...)` or `[...]` on the left of `=` or in foreach.
class ListExpr : public NodeBase<ListExpr, Expr, NodeKind::ListExpr>
{
public:
  gsl::span<ArrayElement *> elements;

  explicit ListExpr(Span s = {}) : NodeBase(s) {}
};

/// `$name`, or `$$expr` / `${expr}` when nameExpr is set.
class VariableExpr : public NodeBase<VariableExpr, Expr, NodeKind::VariableExpr>
{
public:
  std::string_view name;  ///< Without the leading '$'; empty when dynamic
  Expr * nameExpr = nullptr;

  explicit VariableExpr(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

/// Identifier or namespaced name; stored without a leading backslash.
class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::NameExpr>
{
public:
  std::string_view name;
  NameKind nameKind = NameKind::Unqualified;

  NameExpr(std::string_view n, NameKind k, Span s = {}) : NodeBase(s), name(n), nameKind(k) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, Span s = {}) : NodeBase(s), lhs(l), op(o), rhs(r) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, Span s = {}) : NodeBase(s), op(o), operand(e) {}
};

class IncDecExpr : public NodeBase<IncDecExpr, Expr, NodeKind::IncDecExpr>
{
public:
  IncDecOp op;
  Expr * operand;

  IncDecExpr(IncDecOp o, Expr * e, Span s = {}) : NodeBase(s), op(o), operand(e) {}
};

/// Plain (`=`), compound (`+=`, `??=`, ...) and by-reference (`=&`) assignment.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::AssignExpr>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;
  bool byRef = false;

  AssignExpr(Expr * t, AssignOp o, Expr * v, Span s = {})
  : NodeBase(s), target(t), op(o), value(v)
  {
  }
};

/// `c ? a : b`; thenExpr is null for the short form `c ?: b`.
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::TernaryExpr>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, Span s = {})
  : NodeBase(s), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::CastExpr>
{
public:
  CastKind castKind;
  Expr * operand;

  CastExpr(CastKind k, Expr * e, Span s = {}) : NodeBase(s), castKind(k), operand(e) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Argument *> args;
  bool isFirstClassCallable = false;  ///< f(...)

  explicit CallExpr(Expr * c, Span s = {}) : NodeBase(s), callee(c) {}
};

class MethodCallExpr : public NodeBase<MethodCallExpr, Expr, NodeKind::MethodCallExpr>
{
public:
  Expr * object;
  Expr * name;  ///< NameExpr for identifiers, any expression for $obj->$m()
  gsl::span<Argument *> args;
  bool nullsafe = false;
  bool isFirstClassCallable = false;

  MethodCallExpr(Expr * o, Expr * n, Span s = {}) : NodeBase(s), object(o), name(n) {}
};

class StaticCallExpr : public NodeBase<StaticCallExpr, Expr, NodeKind::StaticCallExpr>
{
public:
  Expr * scope;
  Expr * name;
  gsl::span<Argument *> args;
  bool isFirstClassCallable = false;

  StaticCallExpr(Expr * sc, Expr * n, Span s = {}) : NodeBase(s), scope(sc), name(n) {}
};

class PropertyFetchExpr : public NodeBase<PropertyFetchExpr, Expr, NodeKind::PropertyFetchExpr>
{
public:
  Expr * object;
  Expr * name;
  bool nullsafe = false;

  PropertyFetchExpr(Expr * o, Expr * n, Span s = {}) : NodeBase(s), object(o), name(n) {}
};

class StaticPropertyFetchExpr
: public NodeBase<StaticPropertyFetchExpr, Expr, NodeKind::StaticPropertyFetchExpr>
{
public:
  Expr * scope;
  Expr * name;  ///< VariableExpr

  StaticPropertyFetchExpr(Expr * sc, Expr * n, Span s = {}) : NodeBase(s), scope(sc), name(n) {}
};

/// `Foo::BAR` and `Foo::class`.
class ClassConstFetchExpr
: public NodeBase<ClassConstFetchExpr, Expr, NodeKind::ClassConstFetchExpr>
{
public:
  Expr * scope;
  Expr * name;

  ClassConstFetchExpr(Expr * sc, Expr * n, Span s = {}) : NodeBase(s), scope(sc), name(n) {}
};

/// `$a[i]`; index is null for the append form `$a[]`.
class SubscriptExpr : public NodeBase<SubscriptExpr, Expr, NodeKind::SubscriptExpr>
{
public:
  Expr * base;
  Expr * index;

  SubscriptExpr(Expr * b, Expr * i, Span s = {}) : NodeBase(s), base(b), index(i) {}
};

/// `new Foo(...)`, or `new class(...) {...}` with anonymousClass set.
class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::NewExpr>
{
public:
  Expr * classRef = nullptr;
  ClassDecl * anonymousClass = nullptr;
  gsl::span<Argument *> args;  ///< Empty for anonymous classes, see ClassDecl::anonymousArgs

  explicit NewExpr(Span s = {}) : NodeBase(s) {}
};

class ClosureExpr : public NodeBase<ClosureExpr, Expr, NodeKind::ClosureExpr>
{
public:
  gsl::span<ParamDecl *> params;
  gsl::span<ClosureUse *> uses;
  TypeNode * returnType = nullptr;
  BlockStmt * body = nullptr;
  bool isStatic = false;
  bool byRefReturn = false;

  explicit ClosureExpr(Span s = {}) : NodeBase(s) {}
};

class ArrowFunctionExpr : public NodeBase<ArrowFunctionExpr, Expr, NodeKind::ArrowFunctionExpr>
{
public:
  gsl::span<ParamDecl *> params;
  TypeNode * returnType = nullptr;
  Expr * body = nullptr;
  bool isStatic = false;
  bool byRefReturn = false;

  explicit ArrowFunctionExpr(Span s = {}) : NodeBase(s) {}
};

class MatchExpr : public NodeBase<MatchExpr, Expr, NodeKind::MatchExpr>
{
public:
  Expr * subject;
  gsl::span<MatchArm *> arms;

  explicit MatchExpr(Expr * subj, Span s = {}) : NodeBase(s), subject(subj) {}
};

/// `throw` nested inside another expression.
class ThrowExpr : public NodeBase<ThrowExpr, Expr, NodeKind::ThrowExpr>
{
public:
  Expr * operand;

  explicit ThrowExpr(Expr * e, Span s = {}) : NodeBase(s), operand(e) {}
};

class CloneExpr : public NodeBase<CloneExpr, Expr, NodeKind::CloneExpr>
{
public:
  Expr * operand;

  explicit CloneExpr(Expr * e, Span s = {}) : NodeBase(s), operand(e) {}
};

class PrintExpr : public NodeBase<PrintExpr, Expr, NodeKind::PrintExpr>
{
public:
  Expr * operand;

  explicit PrintExpr(Expr * e, Span s = {}) : NodeBase(s), operand(e) {}
};

class IncludeExpr : public NodeBase<IncludeExpr, Expr, NodeKind::IncludeExpr>
{
public:
  IncludeKind includeKind;
  Expr * operand;

  IncludeExpr(IncludeKind k, Expr * e, Span s = {}) : NodeBase(s), includeKind(k), operand(e) {}
};

/// `yield`, `yield v`, `yield k => v`, `yield from e`.
class YieldExpr : public NodeBase<YieldExpr, Expr, NodeKind::YieldExpr>
{
public:
  Expr * key = nullptr;
  Expr * value = nullptr;
  bool isFrom = false;

  explicit YieldExpr(Span s = {}) : NodeBase(s) {}
};

/// `exit` / `die` with an optional status.
class ExitExpr : public NodeBase<ExitExpr, Expr, NodeKind::ExitExpr>
{
public:
  Expr * status;

  explicit ExitExpr(Expr * st, Span s = {}) : NodeBase(s), status(st) {}
};

class UnknownExpr : public NodeBase<UnknownExpr, Expr, NodeKind::UnknownExpr>
{
public:
  UnknownReason reason;
  std::string_view grammarKind;  ///< Kind name of the concrete node

  UnknownExpr(UnknownReason r, std::string_view gk, Span s = {})
  : NodeBase(s), reason(r), grammarKind(gk)
  {
  }
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Class name or builtin type such as `int`, `mixed`, `static`.
class NamedType : public NodeBase<NamedType, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;
  bool isBuiltin = false;
  NameKind nameKind = NameKind::Unqualified;

  NamedType(std::string_view n, bool builtin, Span s = {})
  : NodeBase(s), name(n), isBuiltin(builtin)
  {
  }
};

/// `?T`, and `T|null` where the resolver picks the nullable shape.
class NullableType : public NodeBase<NullableType, TypeNode, NodeKind::NullableType>
{
public:
  TypeNode * inner;

  explicit NullableType(TypeNode * t, Span s = {}) : NodeBase(s), inner(t) {}
};

class UnionType : public NodeBase<UnionType, TypeNode, NodeKind::UnionType>
{
public:
  gsl::span<TypeNode *> members;

  explicit UnionType(Span s = {}) : NodeBase(s) {}
};

class IntersectionType : public NodeBase<IntersectionType, TypeNode, NodeKind::IntersectionType>
{
public:
  gsl::span<TypeNode *> members;

  explicit IntersectionType(Span s = {}) : NodeBase(s) {}
};

class UnknownType : public NodeBase<UnknownType, TypeNode, NodeKind::UnknownType>
{
public:
  UnknownReason reason;
  std::string_view grammarKind;

  UnknownType(UnknownReason r, std::string_view gk, Span s = {})
  : NodeBase(s), reason(r), grammarKind(gk)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Call argument; name is empty for positional arguments.
class Argument : public NodeBase<Argument, AstNode, NodeKind::Argument>
{
public:
  std::string_view name;
  Expr * value;
  bool isSpread = false;

  Argument(std::string_view n, Expr * v, Span s = {}) : NodeBase(s), name(n), value(v) {}
};

/// Entry of an array literal or destructuring list.
class ArrayElement : public NodeBase<ArrayElement, AstNode, NodeKind::ArrayElement>
{
public:
  Expr * key = nullptr;
  Expr * value;
  bool byRef = false;
  bool isSpread = false;

  ArrayElement(Expr * k, Expr * v, Span s = {}) : NodeBase(s), key(k), value(v) {}
};

/// `a, b => body` or `default => body`.
class MatchArm : public NodeBase<MatchArm, AstNode, NodeKind::MatchArm>
{
public:
  gsl::span<Expr *> conditions;  ///< Empty for the default arm
  Expr * body = nullptr;
  bool isDefault = false;

  explicit MatchArm(Span s = {}) : NodeBase(s) {}
};

class ElseIfClause : public NodeBase<ElseIfClause, AstNode, NodeKind::ElseIfClause>
{
public:
  Expr * condition;
  BlockStmt * body;

  ElseIfClause(Expr * c, BlockStmt * b, Span s = {}) : NodeBase(s), condition(c), body(b) {}
};

/// `case x:` or `default:` (test is null) with the statements that follow.
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  Expr * test;
  gsl::span<Stmt *> body;

  explicit SwitchCase(Expr * t, Span s = {}) : NodeBase(s), test(t) {}
};

class CatchClause : public NodeBase<CatchClause, AstNode, NodeKind::CatchClause>
{
public:
  gsl::span<NameExpr *> types;
  VariableExpr * var = nullptr;  ///< Null for `catch (E)` without a variable
  BlockStmt * body = nullptr;

  explicit CatchClause(Span s = {}) : NodeBase(s) {}
};

/// Variable captured by `function () use ($x, &$y)`.
class ClosureUse : public NodeBase<ClosureUse, AstNode, NodeKind::ClosureUse>
{
public:
  std::string_view name;
  bool byRef = false;

  ClosureUse(std::string_view n, bool ref, Span s = {}) : NodeBase(s), name(n), byRef(ref) {}
};

/// One variable of `static $a = 1, $b;`.
class StaticVar : public NodeBase<StaticVar, AstNode, NodeKind::StaticVar>
{
public:
  std::string_view name;
  Expr * init;

  StaticVar(std::string_view n, Expr * i, Span s = {}) : NodeBase(s), name(n), init(i) {}
};

/// One imported name of a `use` statement; group prefixes are already joined.
class UseClause : public NodeBase<UseClause, AstNode, NodeKind::UseClause>
{
public:
  std::string_view name;
  std::string_view alias;
  UseKind useKind = UseKind::Normal;

  UseClause(std::string_view n, std::string_view a, Span s = {}) : NodeBase(s), name(n), alias(a)
  {
  }
};

class DeclareDirective : public NodeBase<DeclareDirective, AstNode, NodeKind::DeclareDirective>
{
public:
  std::string_view name;
  Expr * value;

  DeclareDirective(std::string_view n, Expr * v, Span s = {}) : NodeBase(s), name(n), value(v) {}
};

class PropertyItem : public NodeBase<PropertyItem, AstNode, NodeKind::PropertyItem>
{
public:
  std::string_view name;  ///< Without the leading '$'
  Expr * defaultValue;

  PropertyItem(std::string_view n, Expr * d, Span s = {}) : NodeBase(s), name(n), defaultValue(d)
  {
  }
};

class ConstItem : public NodeBase<ConstItem, AstNode, NodeKind::ConstItem>
{
public:
  std::string_view name;
  Expr * value;

  ConstItem(std::string_view n, Expr * v, Span s = {}) : NodeBase(s), name(n), value(v) {}
};

/// One attribute inside `#[...]`.
class Attribute : public NodeBase<Attribute, AstNode, NodeKind::Attribute>
{
public:
  std::string_view name;
  gsl::span<Argument *> args;

  explicit Attribute(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/**
 * Statement list. Braced bodies, alternative-syntax bodies and unbraced
 * single statements all become a BlockStmt.
 */
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> stmts;

  explicit BlockStmt(Span s = {}) : NodeBase(s) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, Span s = {}) : NodeBase(s), expr(e) {}
};

class EchoStmt : public NodeBase<EchoStmt, Stmt, NodeKind::EchoStmt>
{
public:
  gsl::span<Expr *> exprs;

  explicit EchoStmt(Span s = {}) : NodeBase(s) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;

  explicit ReturnStmt(Expr * v, Span s = {}) : NodeBase(s), value(v) {}
};

/// `else if` is flattened into elseIfs like `elseif`.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  BlockStmt * thenBlock;
  gsl::span<ElseIfClause *> elseIfs;
  BlockStmt * elseBlock = nullptr;

  IfStmt(Expr * c, BlockStmt * t, Span s = {}) : NodeBase(s), condition(c), thenBlock(t) {}
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  BlockStmt * body;

  WhileStmt(Expr * c, BlockStmt * b, Span s = {}) : NodeBase(s), condition(c), body(b) {}
};

class DoWhileStmt : public NodeBase<DoWhileStmt, Stmt, NodeKind::DoWhileStmt>
{
public:
  BlockStmt * body;
  Expr * condition;

  DoWhileStmt(BlockStmt * b, Expr * c, Span s = {}) : NodeBase(s), body(b), condition(c) {}
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  gsl::span<Expr *> init;
  gsl::span<Expr *> condition;
  gsl::span<Expr *> step;
  BlockStmt * body = nullptr;

  explicit ForStmt(Span s = {}) : NodeBase(s) {}
};

class ForeachStmt : public NodeBase<ForeachStmt, Stmt, NodeKind::ForeachStmt>
{
public:
  Expr * subject = nullptr;
  Expr * key = nullptr;
  Expr * value = nullptr;
  bool byRef = false;
  BlockStmt * body = nullptr;

  explicit ForeachStmt(Span s = {}) : NodeBase(s) {}
};

class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * subject;
  gsl::span<SwitchCase *> cases;

  explicit SwitchStmt(Expr * subj, Span s = {}) : NodeBase(s), subject(subj) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  Expr * depth;

  explicit BreakStmt(Expr * d, Span s = {}) : NodeBase(s), depth(d) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  Expr * depth;

  explicit ContinueStmt(Expr * d, Span s = {}) : NodeBase(s), depth(d) {}
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  BlockStmt * body;
  gsl::span<CatchClause *> catches;
  BlockStmt * finallyBlock = nullptr;

  explicit TryStmt(BlockStmt * b, Span s = {}) : NodeBase(s), body(b) {}
};

/// `throw e;` forming a whole statement.
class ThrowStmt : public NodeBase<ThrowStmt, Stmt, NodeKind::ThrowStmt>
{
public:
  Expr * operand;

  explicit ThrowStmt(Expr * e, Span s = {}) : NodeBase(s), operand(e) {}
};

class GlobalStmt : public NodeBase<GlobalStmt, Stmt, NodeKind::GlobalStmt>
{
public:
  gsl::span<Expr *> vars;

  explicit GlobalStmt(Span s = {}) : NodeBase(s) {}
};

class StaticVarStmt : public NodeBase<StaticVarStmt, Stmt, NodeKind::StaticVarStmt>
{
public:
  gsl::span<StaticVar *> vars;

  explicit StaticVarStmt(Span s = {}) : NodeBase(s) {}
};

class UnsetStmt : public NodeBase<UnsetStmt, Stmt, NodeKind::UnsetStmt>
{
public:
  gsl::span<Expr *> exprs;

  explicit UnsetStmt(Span s = {}) : NodeBase(s) {}
};

/// `namespace A\B;` (body null) or `namespace A\B { ... }`.
class NamespaceStmt : public NodeBase<NamespaceStmt, Stmt, NodeKind::NamespaceStmt>
{
public:
  std::string_view name;  ///< Empty for the global namespace block
  BlockStmt * body = nullptr;

  explicit NamespaceStmt(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class UseStmt : public NodeBase<UseStmt, Stmt, NodeKind::UseStmt>
{
public:
  UseKind useKind = UseKind::Normal;
  gsl::span<UseClause *> clauses;

  explicit UseStmt(Span s = {}) : NodeBase(s) {}
};

class DeclareStmt : public NodeBase<DeclareStmt, Stmt, NodeKind::DeclareStmt>
{
public:
  gsl::span<DeclareDirective *> directives;
  BlockStmt * body = nullptr;  ///< Null for `declare(...);`

  explicit DeclareStmt(Span s = {}) : NodeBase(s) {}
};

class GotoStmt : public NodeBase<GotoStmt, Stmt, NodeKind::GotoStmt>
{
public:
  std::string_view label;

  explicit GotoStmt(std::string_view l, Span s = {}) : NodeBase(s), label(l) {}
};

class LabelStmt : public NodeBase<LabelStmt, Stmt, NodeKind::LabelStmt>
{
public:
  std::string_view label;

  explicit LabelStmt(std::string_view l, Span s = {}) : NodeBase(s), label(l) {}
};

/// Text outside `<?php ... ?>`.
class InlineHtmlStmt : public NodeBase<InlineHtmlStmt, Stmt, NodeKind::InlineHtmlStmt>
{
public:
  std::string_view text;

  explicit InlineHtmlStmt(std::string_view t, Span s = {}) : NodeBase(s), text(t) {}
};

class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::EmptyStmt>
{
public:
  explicit EmptyStmt(Span s = {}) : NodeBase(s) {}
};

/// Declaration (class, function, const, ...) in statement position.
class DeclStmt : public NodeBase<DeclStmt, Stmt, NodeKind::DeclStmt>
{
public:
  Decl * decl;

  explicit DeclStmt(Decl * d, Span s = {}) : NodeBase(s), decl(d) {}
};

class UnknownStmt : public NodeBase<UnknownStmt, Stmt, NodeKind::UnknownStmt>
{
public:
  UnknownReason reason;
  std::string_view grammarKind;

  UnknownStmt(UnknownReason r, std::string_view gk, Span s = {})
  : NodeBase(s), reason(r), grammarKind(gk)
  {
  }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/**
 * Class declaration, including anonymous classes of `new class {}`.
 *
 * promotedProperties lists the properties synthesized from promoted
 * constructor parameters. They are reachable in traversal under their
 * ParamDecl, not as members.
 */
class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  std::string_view name;  ///< Empty for anonymous classes
  gsl::span<Attribute *> attributes;
  bool isAbstract = false;
  bool isFinal = false;
  bool isReadonly = false;
  bool isAnonymous = false;
  gsl::span<Argument *> anonymousArgs;
  NameExpr * extends = nullptr;
  gsl::span<NameExpr *> implements;
  gsl::span<Decl *> members;
  gsl::span<PropertyDecl *> promotedProperties;

  explicit ClassDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}

  /// Declared members followed by promoted properties
  [[nodiscard]] std::vector<const PropertyDecl *> properties() const;
};

class InterfaceDecl : public NodeBase<InterfaceDecl, Decl, NodeKind::InterfaceDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  gsl::span<NameExpr *> extends;
  gsl::span<Decl *> members;

  explicit InterfaceDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class TraitDecl : public NodeBase<TraitDecl, Decl, NodeKind::TraitDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  gsl::span<Decl *> members;
  gsl::span<PropertyDecl *> promotedProperties;

  explicit TraitDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::EnumDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  TypeNode * backingType = nullptr;
  gsl::span<NameExpr *> implements;
  gsl::span<Decl *> members;

  explicit EnumDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class EnumCaseDecl : public NodeBase<EnumCaseDecl, Decl, NodeKind::EnumCaseDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  Expr * value = nullptr;

  explicit EnumCaseDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  gsl::span<ParamDecl *> params;
  TypeNode * returnType = nullptr;
  BlockStmt * body = nullptr;
  bool byRefReturn = false;

  explicit FunctionDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}
};

class MethodDecl : public NodeBase<MethodDecl, Decl, NodeKind::MethodDecl>
{
public:
  std::string_view name;
  gsl::span<Attribute *> attributes;
  Visibility visibility = Visibility::Public;
  bool hasExplicitVisibility = false;
  bool isStatic = false;
  bool isAbstract = false;
  bool isFinal = false;
  bool byRefReturn = false;
  gsl::span<ParamDecl *> params;
  TypeNode * returnType = nullptr;
  BlockStmt * body = nullptr;  ///< Null for abstract and interface methods

  explicit MethodDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}

  [[nodiscard]] bool is_constructor() const noexcept;
};

/**
 * Property declaration; one item per declared name.
 *
 * A promoted property (isPromoted) has a zero-width span at the
 * parameter's first modifier, a single item without a default, and
 * shares its type node with promotedFrom. That type is not a child.
 */
class PropertyDecl : public NodeBase<PropertyDecl, Decl, NodeKind::PropertyDecl>
{
public:
  gsl::span<Attribute *> attributes;
  Visibility visibility = Visibility::Public;
  bool hasExplicitVisibility = false;
  std::optional<Visibility> setVisibility;  ///< `public private(set)`
  bool isStatic = false;
  bool isReadonly = false;
  TypeNode * type = nullptr;
  gsl::span<PropertyItem *> items;
  bool isPromoted = false;
  const ParamDecl * promotedFrom = nullptr;

  explicit PropertyDecl(Span s = {}) : NodeBase(s) {}

  [[nodiscard]] std::string_view name() const noexcept;
  [[nodiscard]] const Expr * default_value() const noexcept;
};

class ClassConstDecl : public NodeBase<ClassConstDecl, Decl, NodeKind::ClassConstDecl>
{
public:
  gsl::span<Attribute *> attributes;
  Visibility visibility = Visibility::Public;
  bool hasExplicitVisibility = false;
  bool isFinal = false;
  TypeNode * type = nullptr;
  gsl::span<ConstItem *> items;

  explicit ClassConstDecl(Span s = {}) : NodeBase(s) {}
};

/// `const A = 1, B = 2;` outside a class.
class ConstDecl : public NodeBase<ConstDecl, Decl, NodeKind::ConstDecl>
{
public:
  gsl::span<ConstItem *> items;

  explicit ConstDecl(Span s = {}) : NodeBase(s) {}
};

/**
 * Function, method, closure or arrow-function parameter.
 *
 * A promoted constructor parameter keeps its own span and carries the
 * synthesized PropertyDecl as promotedProperty.
 */
class ParamDecl : public NodeBase<ParamDecl, Decl, NodeKind::ParamDecl>
{
public:
  std::string_view name;  ///< Without the leading '$'
  gsl::span<Attribute *> attributes;
  TypeNode * type = nullptr;
  Expr * defaultValue = nullptr;
  bool byRef = false;
  bool isVariadic = false;
  std::optional<Visibility> promotedVisibility;
  bool isReadonly = false;
  PropertyDecl * promotedProperty = nullptr;

  explicit ParamDecl(std::string_view n, Span s = {}) : NodeBase(s), name(n) {}

  [[nodiscard]] bool is_promoted() const noexcept { return promotedProperty != nullptr; }
};

/// `use A, B;` inside a class body.
class TraitUseDecl : public NodeBase<TraitUseDecl, Decl, NodeKind::TraitUseDecl>
{
public:
  gsl::span<NameExpr *> traits;
  bool hasAdaptations = false;  ///< `{ A::foo insteadof B; }` block present

  explicit TraitUseDecl(Span s = {}) : NodeBase(s) {}
};

class UnknownDecl : public NodeBase<UnknownDecl, Decl, NodeKind::UnknownDecl>
{
public:
  UnknownReason reason;
  std::string_view grammarKind;

  UnknownDecl(UnknownReason r, std::string_view gk, Span s = {})
  : NodeBase(s), reason(r), grammarKind(gk)
  {
  }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> stmts;

  explicit Program(Span s = {}) : NodeBase(s) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline Span get_span(const AstNode * node) noexcept
{
  return node ? node->get_span() : Span{};
}

/// Reason and concrete kind of an Unknown placeholder; nullopt for other nodes.
[[nodiscard]] std::optional<UnknownReason> unknown_reason(const AstNode * node) noexcept;

}  // namespace celerrate
