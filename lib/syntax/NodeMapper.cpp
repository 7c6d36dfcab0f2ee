// celerrate/syntax/NodeMapper.cpp - Program mapping, dispatch and failure handling
#include <string>

#include <fmt/format.h>

#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

NodeMapper::NodeMapper(
  AstContext & ast, const SourceManager & sm, DiagnosticBag & diags, const MappingOptions & options)
: ast_(ast),
  sm_(sm),
  diags_(diags),
  options_(options),
  resolver_(DialectResolver::standard()),
  tracker_(sm)
{
  enclosing_.push_back(EnclosingKind::TopLevel);
}

// ============================================================================
// Program
// ============================================================================

Program * NodeMapper::map_program(ts_ll::Node program_node)
{
  // The root covers the whole buffer even when the grammar trims trailing
  // whitespace, so every statement span stays inside it.
  const Span whole = tracker_.make_span(0, static_cast<uint32_t>(sm_.size()));
  auto * program = ast_.create<Program>(whole);
  if (program_node.is_null()) {
    return program;
  }

  std::vector<Stmt *> stmts;
  map_statement_list(program_node, stmts);
  program->stmts = ast_.copy_to_arena(stmts);
  return program;
}

void NodeMapper::map_statement_list(ts_ll::Node parent, std::vector<Stmt *> & out, uint32_t from_byte)
{
  const std::vector<ts_ll::Node> children = parent.named_children();
  for (size_t i = 0; i < children.size(); ++i) {
    const ts_ll::Node & c = children[i];
    if (c.start_byte() < from_byte) continue;

    switch (classify_grammar_kind(c.kind())) {
      case GrammarKind::PhpTag:
      case GrammarKind::Comment:
        continue;
      case GrammarKind::Error: {
        // `$b = ;` recovers as ERROR followed by a stray empty statement;
        // both belong to one broken statement.
        uint32_t end = c.end_byte();
        if (
          i + 1 < children.size() &&
          classify_grammar_kind(children[i + 1].kind()) == GrammarKind::EmptyStatement) {
          end = children[++i].end_byte();
        }
        out.push_back(ast_.create<UnknownStmt>(
          UnknownReason::SyntaxError, ast_.intern(c.kind()),
          tracker_.make_span(c.start_byte(), end)));
        continue;
      }
      case GrammarKind::TextInterpolation:
        if (Stmt * html = map_inline_html(c)) {
          out.push_back(html);
        }
        continue;
      default:
        out.push_back(map_stmt(c));
    }
  }
}

Stmt * NodeMapper::map_inline_html(ts_ll::Node text_interpolation_node)
{
  const ts_ll::Node text_node = text_interpolation_node.first_child_of_kind("text");
  if (text_node.is_null()) {
    return nullptr;
  }
  return ast_.create<InlineHtmlStmt>(intern(text_node), span_of(text_node));
}

// ============================================================================
// Entry points with depth accounting
// ============================================================================

Stmt * NodeMapper::map_stmt(ts_ll::Node stmt_node)
{
  DepthGuard guard(*this);
  if (guard.exceeded()) {
    return make_unknown<UnknownStmt>(stmt_node, UnknownReason::NestingLimit, "statement");
  }
  return map_stmt_kind(stmt_node, classify_grammar_kind(stmt_node.kind()));
}

Expr * NodeMapper::map_expr(ts_ll::Node expr_node)
{
  DepthGuard guard(*this);
  if (guard.exceeded()) {
    return make_unknown<UnknownExpr>(expr_node, UnknownReason::NestingLimit, "expression");
  }
  return map_expr_kind(expr_node, classify_grammar_kind(expr_node.kind()));
}

TypeNode * NodeMapper::map_type(ts_ll::Node type_node)
{
  DepthGuard guard(*this);
  if (guard.exceeded()) {
    return make_unknown<UnknownType>(type_node, UnknownReason::NestingLimit, "type");
  }
  return map_type_kind(type_node, classify_grammar_kind(type_node.kind()));
}

UnknownDecl * NodeMapper::nesting_limit_decl(ts_ll::Node n)
{
  return make_unknown<UnknownDecl>(n, UnknownReason::NestingLimit, "declaration");
}

// ============================================================================
// Unknown placeholders
// ============================================================================

UnknownReason NodeMapper::failure_reason(ts_ll::Node n) const
{
  if (n.is_error()) return UnknownReason::SyntaxError;
  if (n.is_missing()) return UnknownReason::MissingToken;
  if (classify_grammar_kind(n.kind()) == GrammarKind::Unknown) return UnknownReason::UnknownKind;
  return UnknownReason::UnexpectedKind;
}

void NodeMapper::report_failure(ts_ll::Node n, UnknownReason reason, std::string_view position)
{
  const Span span = span_of(n);
  switch (reason) {
    case UnknownReason::SyntaxError:
    case UnknownReason::MissingToken:
      // Already reported by the syntax pre-pass over the concrete tree.
      return;
    case UnknownReason::UnknownKind:
      diags_
        .report_warning(
          span, fmt::format("unsupported grammar kind '{}' in {}", n.kind(), position),
          "not mapped")
        .with_code(diag_code::k_unknown_grammar_kind);
      return;
    case UnknownReason::UnexpectedKind:
      diags_
        .report_error(
          span, fmt::format("'{}' cannot appear as {}", n.kind(), position), "unexpected here")
        .with_code(diag_code::k_unexpected_kind);
      return;
    case UnknownReason::NestingLimit:
      diags_
        .report_error(
          span, fmt::format("{} nested deeper than {} levels", position, options_.max_depth),
          "nesting limit exceeded")
        .with_code(diag_code::k_nesting_limit);
      return;
    case UnknownReason::MissingChild:
      diags_.report_error(span, fmt::format("{} is missing", position))
        .with_code(diag_code::k_missing_child);
      return;
  }
}

template <typename UnknownT>
UnknownT * NodeMapper::make_unknown(ts_ll::Node n, UnknownReason reason, std::string_view position)
{
  report_failure(n, reason, position);
  return ast_.create<UnknownT>(reason, ast_.intern(n.kind()), span_of(n));
}

template <typename UnknownT>
UnknownT * NodeMapper::make_missing(ts_ll::Node parent, uint32_t offset, std::string_view what)
{
  const Span at = tracker_.make_point(offset);
  diags_
    .report_error(at, fmt::format("'{}' is missing its {}", parent.kind(), what), "expected here")
    .with_code(diag_code::k_missing_child);
  return ast_.create<UnknownT>(UnknownReason::MissingChild, ast_.intern(parent.kind()), at);
}

template UnknownExpr * NodeMapper::make_unknown<UnknownExpr>(
  ts_ll::Node, UnknownReason, std::string_view);
template UnknownStmt * NodeMapper::make_unknown<UnknownStmt>(
  ts_ll::Node, UnknownReason, std::string_view);
template UnknownType * NodeMapper::make_unknown<UnknownType>(
  ts_ll::Node, UnknownReason, std::string_view);
template UnknownDecl * NodeMapper::make_unknown<UnknownDecl>(
  ts_ll::Node, UnknownReason, std::string_view);

template UnknownExpr * NodeMapper::make_missing<UnknownExpr>(ts_ll::Node, uint32_t, std::string_view);
template UnknownStmt * NodeMapper::make_missing<UnknownStmt>(ts_ll::Node, uint32_t, std::string_view);
template UnknownType * NodeMapper::make_missing<UnknownType>(ts_ll::Node, uint32_t, std::string_view);
template UnknownDecl * NodeMapper::make_missing<UnknownDecl>(ts_ll::Node, uint32_t, std::string_view);

// ============================================================================
// Dialect gates
// ============================================================================

bool NodeMapper::check_construct(Construct c, const Span & at)
{
  const ConstructStatus status = resolver_.status(c, options_.version);
  if (status == ConstructStatus::Enabled) {
    return true;
  }

  const Severity severity =
    options_.policy == GatePolicy::Strict ? Severity::Error : Severity::Warning;

  if (status == ConstructStatus::NotYetAvailable) {
    diags_
      .report(
        severity, at,
        fmt::format(
          "use of {} requires PHP {} (active dialect is PHP {})", describe(c),
          to_string(resolver_.min_version(c)), to_string(options_.version)),
        "not available in this dialect")
      .with_code(diag_code::k_construct_unavailable);
  } else {
    diags_
      .report(
        severity, at,
        fmt::format(
          "use of {} was removed in PHP {} (active dialect is PHP {})", describe(c),
          to_string(resolver_.removed_in(c).value_or(options_.version)),
          to_string(options_.version)),
        "removed in this dialect")
      .with_code(diag_code::k_construct_removed);
  }
  return false;
}

void NodeMapper::report_invalid_modifier(ts_ll::Node at, std::string message)
{
  diags_.report_error(span_of(at), std::move(message), "modifier not allowed here")
    .with_code(diag_code::k_invalid_modifier);
}

// ============================================================================
// Enclosing declarations
// ============================================================================

NodeMapper::EnclosingKind NodeMapper::enclosing() const noexcept { return enclosing_.back(); }

NodeMapper::EnclosingKind NodeMapper::enclosing_class_kind() const noexcept
{
  for (auto it = enclosing_.rbegin(); it != enclosing_.rend(); ++it) {
    switch (*it) {
      case EnclosingKind::Class:
      case EnclosingKind::Interface:
      case EnclosingKind::Trait:
      case EnclosingKind::Enum:
        return *it;
      default:
        break;
    }
  }
  return EnclosingKind::TopLevel;
}

// ============================================================================
// Field access
// ============================================================================

ts_ll::Node NodeMapper::field_or_kind(ts_ll::Node n, std::string_view field, GrammarKind kind)
{
  const ts_ll::Node by_field = n.child_by_field(field);
  if (!by_field.is_null()) {
    return by_field;
  }
  for (const ts_ll::Node & c : n.named_children()) {
    if (classify_grammar_kind(c.kind()) == kind) {
      return c;
    }
  }
  return ts_ll::Node();
}

ts_ll::Node NodeMapper::find_token(ts_ll::Node n, std::string_view token)
{
  const uint32_t count = n.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = n.child(i);
    if (!c.is_named() && c.kind() == token) {
      return c;
    }
  }
  return ts_ll::Node();
}

ts_ll::Node NodeMapper::field_or_index(ts_ll::Node n, std::string_view field, uint32_t index)
{
  const ts_ll::Node by_field = n.child_by_field(field);
  if (!by_field.is_null()) {
    return by_field;
  }
  const std::vector<ts_ll::Node> named = n.named_children();
  return index < named.size() ? named[index] : ts_ll::Node();
}

bool NodeMapper::has_reference_modifier(ts_ll::Node n)
{
  return !n.first_child_of_kind("reference_modifier").is_null() || n.has_token("&");
}

bool NodeMapper::is_type_kind(GrammarKind kind) noexcept
{
  switch (kind) {
    case GrammarKind::NamedType:
    case GrammarKind::PrimitiveType:
    case GrammarKind::OptionalType:
    case GrammarKind::UnionType:
    case GrammarKind::IntersectionType:
    case GrammarKind::DnfType:
    case GrammarKind::BottomType:
      return true;
    default:
      return false;
  }
}

bool NodeMapper::is_modifier_kind(GrammarKind kind) noexcept
{
  switch (kind) {
    case GrammarKind::VisibilityModifier:
    case GrammarKind::StaticModifier:
    case GrammarKind::ReadonlyModifier:
    case GrammarKind::AbstractModifier:
    case GrammarKind::FinalModifier:
    case GrammarKind::VarModifier:
      return true;
    default:
      return false;
  }
}

}  // namespace celerrate
