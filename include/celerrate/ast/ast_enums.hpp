// celerrate/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and declaration attributes of the PHP AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace celerrate
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for classof-based RTTI, generated from ast_nodes.def.
 * Categories are contiguous so category checks are range comparisons.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"

#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "celerrate/ast/ast_nodes.def"
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< **
  // String
  Concat,  ///< .
  // Bitwise
  ShiftLeft,   ///< <<
  ShiftRight,  ///< >>
  BitAnd,      ///< &
  BitOr,       ///< |
  BitXor,      ///< ^
  // Logical
  And,         ///< &&
  Or,          ///< ||
  LogicalAnd,  ///< and
  LogicalOr,   ///< or
  LogicalXor,  ///< xor
  // Comparison
  Equal,         ///< ==
  NotEqual,      ///< != (also <>)
  Identical,     ///< ===
  NotIdentical,  ///< !==
  Less,          ///< <
  LessEqual,     ///< <=
  Greater,       ///< >
  GreaterEqual,  ///< >=
  Spaceship,     ///< <=>
  // Other
  Coalesce,    ///< ??
  Instanceof,  ///< instanceof
};

enum class UnaryOp : uint8_t {
  Not,      ///< !
  Negate,   ///< -
  Plus,     ///< +
  BitNot,   ///< ~
  Silence,  ///< @
};

enum class IncDecOp : uint8_t {
  PreIncrement,
  PreDecrement,
  PostIncrement,
  PostDecrement,
};

enum class AssignOp : uint8_t {
  Assign,      ///< =
  Add,         ///< +=
  Sub,         ///< -=
  Mul,         ///< *=
  Div,         ///< /=
  Mod,         ///< %=
  Pow,         ///< **=
  Concat,      ///< .=
  ShiftLeft,   ///< <<=
  ShiftRight,  ///< >>=
  BitAnd,      ///< &=
  BitOr,       ///< |=
  BitXor,      ///< ^=
  Coalesce,    ///< ??=
};

/// Canonical cast target; (integer) and (int) share Int, and so on.
enum class CastKind : uint8_t { Int, Float, String, Bool, Array, Object, Unset };

// ============================================================================
// Declaration attributes
// ============================================================================

enum class Visibility : uint8_t { Public, Protected, Private };

enum class NameKind : uint8_t {
  Unqualified,     ///< Foo
  Qualified,       ///< Foo\Bar
  FullyQualified,  ///< \Foo\Bar
  Relative,        ///< namespace\Foo
};

enum class StringKind : uint8_t { SingleQuoted, DoubleQuoted, Heredoc, Nowdoc };

enum class IncludeKind : uint8_t { Include, IncludeOnce, Require, RequireOnce };

enum class UseKind : uint8_t { Normal, Function, Const };

/// Why the mapper produced an Unknown placeholder.
enum class UnknownReason : uint8_t {
  SyntaxError,     ///< ERROR node from the grammar engine
  MissingToken,    ///< MISSING node from the grammar engine
  MissingChild,    ///< required child absent from the concrete node
  UnknownKind,     ///< grammar kind the mapper has no rule for
  UnexpectedKind,  ///< known kind in a position where it cannot be mapped
  NestingLimit,    ///< subtree deeper than MappingOptions::max_depth
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::Concat:
      return ".";
    case BinaryOp::ShiftLeft:
      return "<<";
    case BinaryOp::ShiftRight:
      return ">>";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::LogicalAnd:
      return "and";
    case BinaryOp::LogicalOr:
      return "or";
    case BinaryOp::LogicalXor:
      return "xor";
    case BinaryOp::Equal:
      return "==";
    case BinaryOp::NotEqual:
      return "!=";
    case BinaryOp::Identical:
      return "===";
    case BinaryOp::NotIdentical:
      return "!==";
    case BinaryOp::Less:
      return "<";
    case BinaryOp::LessEqual:
      return "<=";
    case BinaryOp::Greater:
      return ">";
    case BinaryOp::GreaterEqual:
      return ">=";
    case BinaryOp::Spaceship:
      return "<=>";
    case BinaryOp::Coalesce:
      return "??";
    case BinaryOp::Instanceof:
      return "instanceof";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Negate:
      return "-";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::Silence:
      return "@";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(IncDecOp op) noexcept
{
  switch (op) {
    case IncDecOp::PreIncrement:
      return "++x";
    case IncDecOp::PreDecrement:
      return "--x";
    case IncDecOp::PostIncrement:
      return "x++";
    case IncDecOp::PostDecrement:
      return "x--";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::Add:
      return "+=";
    case AssignOp::Sub:
      return "-=";
    case AssignOp::Mul:
      return "*=";
    case AssignOp::Div:
      return "/=";
    case AssignOp::Mod:
      return "%=";
    case AssignOp::Pow:
      return "**=";
    case AssignOp::Concat:
      return ".=";
    case AssignOp::ShiftLeft:
      return "<<=";
    case AssignOp::ShiftRight:
      return ">>=";
    case AssignOp::BitAnd:
      return "&=";
    case AssignOp::BitOr:
      return "|=";
    case AssignOp::BitXor:
      return "^=";
    case AssignOp::Coalesce:
      return "??=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(CastKind kind) noexcept
{
  switch (kind) {
    case CastKind::Int:
      return "int";
    case CastKind::Float:
      return "float";
    case CastKind::String:
      return "string";
    case CastKind::Bool:
      return "bool";
    case CastKind::Array:
      return "array";
    case CastKind::Object:
      return "object";
    case CastKind::Unset:
      return "unset";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Visibility v) noexcept
{
  switch (v) {
    case Visibility::Public:
      return "public";
    case Visibility::Protected:
      return "protected";
    case Visibility::Private:
      return "private";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(NameKind kind) noexcept
{
  switch (kind) {
    case NameKind::Unqualified:
      return "unqualified";
    case NameKind::Qualified:
      return "qualified";
    case NameKind::FullyQualified:
      return "fully_qualified";
    case NameKind::Relative:
      return "relative";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(StringKind kind) noexcept
{
  switch (kind) {
    case StringKind::SingleQuoted:
      return "single_quoted";
    case StringKind::DoubleQuoted:
      return "double_quoted";
    case StringKind::Heredoc:
      return "heredoc";
    case StringKind::Nowdoc:
      return "nowdoc";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(IncludeKind kind) noexcept
{
  switch (kind) {
    case IncludeKind::Include:
      return "include";
    case IncludeKind::IncludeOnce:
      return "include_once";
    case IncludeKind::Require:
      return "require";
    case IncludeKind::RequireOnce:
      return "require_once";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UseKind kind) noexcept
{
  switch (kind) {
    case UseKind::Normal:
      return "normal";
    case UseKind::Function:
      return "function";
    case UseKind::Const:
      return "const";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnknownReason reason) noexcept
{
  switch (reason) {
    case UnknownReason::SyntaxError:
      return "syntax_error";
    case UnknownReason::MissingToken:
      return "missing_token";
    case UnknownReason::MissingChild:
      return "missing_child";
    case UnknownReason::UnknownKind:
      return "unknown_kind";
    case UnknownReason::UnexpectedKind:
      return "unexpected_kind";
    case UnknownReason::NestingLimit:
      return "nesting_limit";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::UnknownExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::NamedType;
inline constexpr NodeKind k_last_type_kind = NodeKind::UnknownType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::BlockStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::UnknownStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::ClassDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::UnknownDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// Placeholder kinds produced for input the mapper could not build.
[[nodiscard]] constexpr bool is_unknown_kind(NodeKind kind) noexcept
{
  return kind == NodeKind::UnknownExpr || kind == NodeKind::UnknownType ||
         kind == NodeKind::UnknownStmt || kind == NodeKind::UnknownDecl;
}

}  // namespace celerrate
