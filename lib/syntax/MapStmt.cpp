// celerrate/syntax/MapStmt.cpp - CST -> AST for statements
#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

namespace
{

std::string_view strip_dollar(std::string_view s)
{
  if (!s.empty() && s.front() == '$') s.remove_prefix(1);
  return s;
}

UseKind use_kind_of(ts_ll::Node n, UseKind fallback)
{
  if (n.has_token("function")) return UseKind::Function;
  if (n.has_token("const")) return UseKind::Const;
  return fallback;
}

bool is_simple_statement(GrammarKind kind)
{
  return kind == GrammarKind::ExpressionStatement || kind == GrammarKind::EchoStatement ||
         kind == GrammarKind::ReturnStatement;
}

bool same_node(ts_ll::Node a, ts_ll::Node b)
{
  return a.start_byte() == b.start_byte() && a.end_byte() == b.end_byte() && a.kind() == b.kind();
}

}  // namespace

Stmt * NodeMapper::map_stmt_kind(ts_ll::Node n, GrammarKind kind)
{
  if (n.is_missing()) {
    return make_unknown<UnknownStmt>(n, UnknownReason::MissingToken, "a statement");
  }
  // A broken simple statement is not trusted as typed; the syntax pre-pass
  // already reported the ERROR or MISSING node inside it.
  if (n.has_error() && is_simple_statement(kind)) {
    return make_unknown<UnknownStmt>(n, UnknownReason::SyntaxError, "a statement");
  }

  switch (kind) {
    case GrammarKind::EmptyStatement:
      return ast_.create<EmptyStmt>(span_of(n));
    case GrammarKind::CompoundStatement:
      return map_compound(n);
    case GrammarKind::ExpressionStatement:
      return map_expression_statement(n);
    case GrammarKind::EchoStatement:
      return map_echo(n);
    case GrammarKind::ReturnStatement:
      return map_return(n);
    case GrammarKind::IfStatement:
      return map_if(n);
    case GrammarKind::WhileStatement:
      return map_while(n);
    case GrammarKind::DoStatement:
      return map_do(n);
    case GrammarKind::ForStatement:
      return map_for(n);
    case GrammarKind::ForeachStatement:
      return map_foreach(n);
    case GrammarKind::SwitchStatement:
      return map_switch(n);
    case GrammarKind::BreakStatement:
      return map_break_continue(n, true);
    case GrammarKind::ContinueStatement:
      return map_break_continue(n, false);
    case GrammarKind::TryStatement:
      return map_try(n);
    case GrammarKind::GlobalDeclaration:
      return map_global(n);
    case GrammarKind::FunctionStaticDeclaration:
      return map_static_vars(n);
    case GrammarKind::UnsetStatement:
      return map_unset(n);
    case GrammarKind::NamespaceDefinition:
      return map_namespace(n);
    case GrammarKind::NamespaceUseDeclaration:
      return map_namespace_use(n);
    case GrammarKind::DeclareStatement:
      return map_declare(n);
    case GrammarKind::ExitStatement:
      return map_exit_statement(n);

    case GrammarKind::GotoStatement: {
      const ts_ll::Node label = n.first_child_of_kind("name");
      return ast_.create<GotoStmt>(
        label.is_null() ? std::string_view{} : intern(label), span_of(n));
    }
    case GrammarKind::NamedLabelStatement: {
      const ts_ll::Node label = n.first_child_of_kind("name");
      return ast_.create<LabelStmt>(
        label.is_null() ? std::string_view{} : intern(label), span_of(n));
    }

    case GrammarKind::Text:
      return ast_.create<InlineHtmlStmt>(intern(n), span_of(n));
    case GrammarKind::TextInterpolation:
      if (Stmt * html = map_inline_html(n)) {
        return html;
      }
      return ast_.create<EmptyStmt>(span_of(n));

    case GrammarKind::FunctionDefinition:
    case GrammarKind::ClassDeclaration:
    case GrammarKind::InterfaceDeclaration:
    case GrammarKind::TraitDeclaration:
    case GrammarKind::EnumDeclaration:
    case GrammarKind::ConstDeclaration:
      return ast_.create<DeclStmt>(map_decl_kind(n, kind), span_of(n));

    default:
      return make_unknown<UnknownStmt>(n, failure_reason(n), "a statement");
  }
}

// ============================================================================
// Blocks and bodies
// ============================================================================

BlockStmt * NodeMapper::map_compound(ts_ll::Node compound_node)
{
  auto * block = ast_.create<BlockStmt>(span_of(compound_node));
  std::vector<Stmt *> stmts;
  map_statement_list(compound_node, stmts);
  block->stmts = ast_.copy_to_arena(stmts);
  return block;
}

BlockStmt * NodeMapper::map_body(ts_ll::Node body_node, ts_ll::Node owner)
{
  if (body_node.is_null()) {
    return empty_block(owner, owner.end_byte(), "body");
  }

  switch (classify_grammar_kind(body_node.kind())) {
    case GrammarKind::CompoundStatement:
    case GrammarKind::ColonBlock:
      return map_compound(body_node);
    case GrammarKind::EmptyStatement:
      return ast_.create<BlockStmt>(span_of(body_node));
    default: {
      // Unbraced single statement.
      auto * block = ast_.create<BlockStmt>(span_of(body_node));
      std::vector<Stmt *> stmts{map_stmt(body_node)};
      block->stmts = ast_.copy_to_arena(stmts);
      return block;
    }
  }
}

BlockStmt * NodeMapper::map_body_after(ts_ll::Node owner, ts_ll::Node after)
{
  const ts_ll::Node body = owner.child_by_field("body");
  if (!body.is_null()) {
    return map_body(body, owner);
  }
  if (after.is_null()) {
    return empty_block(owner, owner.end_byte(), "body");
  }

  const uint32_t count = owner.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = owner.child(i);
    if (c.is_extra() || c.start_byte() < after.end_byte() || same_node(c, after)) {
      continue;
    }
    if (c.is_named()) {
      return map_body(c, owner);
    }
    if (c.kind() == ";") {
      return ast_.create<BlockStmt>(span_of(c));
    }
    if (c.kind() == ":") {
      return map_alt_body(owner, c);
    }
  }
  return empty_block(owner, after.end_byte(), "body");
}

BlockStmt * NodeMapper::map_alt_body(ts_ll::Node owner, ts_ll::Node colon)
{
  std::vector<Stmt *> stmts;
  uint32_t end = colon.end_byte();

  const uint32_t count = owner.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = owner.child(i);
    if (c.is_extra() || c.start_byte() < colon.end_byte()) continue;
    if (!c.is_named()) break;  // endfor, endforeach, endwhile, enddeclare

    const GrammarKind kind = classify_grammar_kind(c.kind());
    if (kind == GrammarKind::PhpTag) continue;
    if (kind == GrammarKind::TextInterpolation) {
      if (Stmt * html = map_inline_html(c)) stmts.push_back(html);
    } else {
      stmts.push_back(map_stmt(c));
    }
    end = c.end_byte();
  }

  auto * block = ast_.create<BlockStmt>(tracker_.make_span(colon.start_byte(), end));
  block->stmts = ast_.copy_to_arena(stmts);
  return block;
}

BlockStmt * NodeMapper::empty_block(ts_ll::Node parent, uint32_t offset, std::string_view what)
{
  diags_
    .report_error(
      tracker_.make_point(offset), fmt::format("'{}' is missing its {}", parent.kind(), what),
      "expected here")
    .with_code(diag_code::k_missing_child);
  return ast_.create<BlockStmt>(tracker_.make_point(offset));
}

// ============================================================================
// Simple statements
// ============================================================================

Stmt * NodeMapper::map_expression_statement(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  if (named.empty()) {
    return ast_.create<ExprStmt>(
      make_missing<UnknownExpr>(n, n.start_byte(), "expression"), span_of(n));
  }

  const ts_ll::Node e = named.front();
  if (classify_grammar_kind(e.kind()) == GrammarKind::ThrowExpression) {
    const std::vector<ts_ll::Node> operand = e.named_children();
    Expr * value = operand.empty() ? make_missing<UnknownExpr>(e, e.end_byte(), "operand")
                                   : map_expr(operand.front());
    return ast_.create<ThrowStmt>(value, span_of(n));
  }
  return ast_.create<ExprStmt>(map_expr(e), span_of(n));
}

void NodeMapper::append_flattened(ts_ll::Node n, std::vector<Expr *> & out)
{
  if (classify_grammar_kind(n.kind()) == GrammarKind::SequenceExpression) {
    for (const ts_ll::Node & c : n.named_children()) {
      append_flattened(c, out);
    }
    return;
  }
  out.push_back(map_expr(n));
}

std::vector<Expr *> NodeMapper::map_expression_list(ts_ll::Node n)
{
  std::vector<Expr *> out;
  for (const ts_ll::Node & c : n.named_children()) {
    append_flattened(c, out);
  }
  return out;
}

EchoStmt * NodeMapper::map_echo(ts_ll::Node n)
{
  auto * stmt = ast_.create<EchoStmt>(span_of(n));
  stmt->exprs = ast_.copy_to_arena(map_expression_list(n));
  return stmt;
}

ReturnStmt * NodeMapper::map_return(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  return ast_.create<ReturnStmt>(named.empty() ? nullptr : map_expr(named.front()), span_of(n));
}

Stmt * NodeMapper::map_break_continue(ts_ll::Node n, bool is_break)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  Expr * depth = named.empty() ? nullptr : map_expr(named.front());
  if (is_break) {
    return ast_.create<BreakStmt>(depth, span_of(n));
  }
  return ast_.create<ContinueStmt>(depth, span_of(n));
}

Stmt * NodeMapper::map_exit_statement(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  auto * exit = ast_.create<ExitExpr>(named.empty() ? nullptr : map_expr(named.front()), span_of(n));
  return ast_.create<ExprStmt>(exit, span_of(n));
}

GlobalStmt * NodeMapper::map_global(ts_ll::Node n)
{
  auto * stmt = ast_.create<GlobalStmt>(span_of(n));
  stmt->vars = ast_.copy_to_arena(map_expression_list(n));
  return stmt;
}

StaticVarStmt * NodeMapper::map_static_vars(ts_ll::Node n)
{
  std::vector<StaticVar *> vars;
  for (const ts_ll::Node & decl : n.named_children()) {
    if (classify_grammar_kind(decl.kind()) != GrammarKind::StaticVariableDeclaration) continue;

    const ts_ll::Node name = field_or_kind(decl, "name", GrammarKind::VariableName);
    const ts_ll::Node value = field_or_index(decl, "value", 1);
    vars.push_back(ast_.create<StaticVar>(
      name.is_null() ? std::string_view{} : ast_.intern(strip_dollar(text(name))),
      value.is_null() ? nullptr : map_initializer(value), span_of(decl)));
  }

  auto * stmt = ast_.create<StaticVarStmt>(span_of(n));
  stmt->vars = ast_.copy_to_arena(vars);
  return stmt;
}

UnsetStmt * NodeMapper::map_unset(ts_ll::Node n)
{
  auto * stmt = ast_.create<UnsetStmt>(span_of(n));
  stmt->exprs = ast_.copy_to_arena(map_expression_list(n));
  return stmt;
}

// ============================================================================
// Conditionals
// ============================================================================

IfStmt * NodeMapper::map_if(ts_ll::Node n)
{
  const ts_ll::Node cond = field_or_kind(n, "condition", GrammarKind::ParenthesizedExpression);
  Expr * condition =
    cond.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "condition") : map_expr(cond);
  BlockStmt * then_block = map_body(n.child_by_field("body"), n);

  auto * stmt = ast_.create<IfStmt>(condition, then_block, span_of(n));

  std::vector<ElseIfClause *> elseifs;
  BlockStmt * else_block = nullptr;
  map_else_if_chain(n, elseifs, else_block);
  stmt->elseIfs = ast_.copy_to_arena(elseifs);
  stmt->elseBlock = else_block;
  return stmt;
}

void NodeMapper::map_else_if_chain(
  ts_ll::Node if_node, std::vector<ElseIfClause *> & elseifs, BlockStmt *& else_block)
{
  std::vector<ts_ll::Node> alternatives = if_node.children_by_field("alternative");
  if (alternatives.empty()) {
    for (const ts_ll::Node & c : if_node.named_children()) {
      const GrammarKind k = classify_grammar_kind(c.kind());
      if (k == GrammarKind::ElseIfClause || k == GrammarKind::ElseClause) {
        alternatives.push_back(c);
      }
    }
  }

  for (const ts_ll::Node & alt : alternatives) {
    const GrammarKind kind = classify_grammar_kind(alt.kind());

    if (kind == GrammarKind::ElseIfClause) {
      const ts_ll::Node cond = field_or_kind(alt, "condition", GrammarKind::ParenthesizedExpression);
      Expr * condition = cond.is_null()
                           ? make_missing<UnknownExpr>(alt, alt.start_byte(), "condition")
                           : map_expr(cond);
      elseifs.push_back(ast_.create<ElseIfClause>(
        condition, map_body(alt.child_by_field("body"), alt), span_of(alt)));
      continue;
    }

    if (kind != GrammarKind::ElseClause) {
      // ERROR and other stray nodes in an alternative position.
      report_failure(alt, failure_reason(alt), "an else branch");
      continue;
    }

    ts_ll::Node body = alt.child_by_field("body");
    if (body.is_null()) {
      const std::vector<ts_ll::Node> named = alt.named_children();
      if (!named.empty()) body = named.front();
    }

    const bool is_else_if = !body.is_null() &&
                            classify_grammar_kind(body.kind()) == GrammarKind::IfStatement;
    if (
      is_else_if && resolver_.resolve_ambiguity(Construct::ElseIfSpelling, options_.version) ==
                      InterpretationChoice::FlatElseIf) {
      // `else if (c) {...}` joins the chain; its own branches follow it.
      const ts_ll::Node cond =
        field_or_kind(body, "condition", GrammarKind::ParenthesizedExpression);
      Expr * condition = cond.is_null()
                           ? make_missing<UnknownExpr>(body, body.start_byte(), "condition")
                           : map_expr(cond);
      BlockStmt * inner_then = map_body(body.child_by_field("body"), body);
      const uint32_t end = std::max(
        inner_then->get_span().end_byte, cond.is_null() ? body.start_byte() : cond.end_byte());
      elseifs.push_back(ast_.create<ElseIfClause>(
        condition, inner_then, tracker_.make_span(alt.start_byte(), end)));
      map_else_if_chain(body, elseifs, else_block);
      continue;
    }

    else_block = map_body(body, alt);
  }
}

SwitchStmt * NodeMapper::map_switch(ts_ll::Node n)
{
  const ts_ll::Node cond = field_or_kind(n, "condition", GrammarKind::ParenthesizedExpression);
  Expr * subject =
    cond.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "subject") : map_expr(cond);
  auto * stmt = ast_.create<SwitchStmt>(subject, span_of(n));

  const ts_ll::Node block = field_or_kind(n, "body", GrammarKind::SwitchBlock);
  std::vector<SwitchCase *> cases;
  if (!block.is_null()) {
    for (const ts_ll::Node & c : block.named_children()) {
      const GrammarKind k = classify_grammar_kind(c.kind());
      if (k == GrammarKind::CaseStatement || k == GrammarKind::DefaultStatement) {
        cases.push_back(map_switch_case(c));
      }
    }
  }
  stmt->cases = ast_.copy_to_arena(cases);
  return stmt;
}

SwitchCase * NodeMapper::map_switch_case(ts_ll::Node n)
{
  Expr * test = nullptr;
  uint32_t body_start = n.start_byte();

  if (classify_grammar_kind(n.kind()) == GrammarKind::CaseStatement) {
    const ts_ll::Node value = field_or_index(n, "value", 0);
    if (value.is_null()) {
      test = make_missing<UnknownExpr>(n, n.end_byte(), "value");
    } else {
      test = map_expr(value);
      body_start = value.end_byte();
    }
  }

  auto * sc = ast_.create<SwitchCase>(test, span_of(n));
  std::vector<Stmt *> body;
  map_statement_list(n, body, body_start);
  sc->body = ast_.copy_to_arena(body);
  return sc;
}

// ============================================================================
// Loops
// ============================================================================

WhileStmt * NodeMapper::map_while(ts_ll::Node n)
{
  const ts_ll::Node cond = field_or_kind(n, "condition", GrammarKind::ParenthesizedExpression);
  Expr * condition =
    cond.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "condition") : map_expr(cond);
  return ast_.create<WhileStmt>(condition, map_body_after(n, cond), span_of(n));
}

DoWhileStmt * NodeMapper::map_do(ts_ll::Node n)
{
  const ts_ll::Node body = field_or_index(n, "body", 0);
  BlockStmt * block = map_body(body, n);

  ts_ll::Node cond = n.child_by_field("condition");
  if (cond.is_null()) {
    for (const ts_ll::Node & c : n.named_children()) {
      if (c.start_byte() >= block->get_span().end_byte && !c.is_extra()) {
        cond = c;
        break;
      }
    }
  }
  Expr * condition =
    cond.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "condition") : map_expr(cond);
  return ast_.create<DoWhileStmt>(block, condition, span_of(n));
}

ForStmt * NodeMapper::map_for(ts_ll::Node n)
{
  // The header sections are found by counting ';' tokens, which works for
  // grammar releases with and without field names on them.
  std::vector<Expr *> sections[3];
  uint32_t section = 0;
  bool in_header = false;
  ts_ll::Node close;

  const uint32_t count = n.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = n.child(i);
    if (c.is_extra()) continue;

    if (!c.is_named()) {
      const std::string_view tok = c.kind();
      if (!in_header) {
        in_header = tok == "(";
        continue;
      }
      if (tok == ";") {
        if (section < 2) ++section;
      } else if (tok == ")") {
        close = c;
        break;
      }
      continue;
    }
    if (in_header) {
      append_flattened(c, sections[section]);
    }
  }

  auto * stmt = ast_.create<ForStmt>(span_of(n));
  stmt->init = ast_.copy_to_arena(sections[0]);
  stmt->condition = ast_.copy_to_arena(sections[1]);
  stmt->step = ast_.copy_to_arena(sections[2]);
  stmt->body = map_body_after(n, close);
  return stmt;
}

ForeachStmt * NodeMapper::map_foreach(ts_ll::Node n)
{
  auto * stmt = ast_.create<ForeachStmt>(span_of(n));
  const ts_ll::Node close = find_token(n, ")");

  std::vector<ts_ll::Node> header;
  for (const ts_ll::Node & c : n.named_children()) {
    if (!close.is_null() && c.start_byte() >= close.end_byte()) break;
    header.push_back(c);
  }

  stmt->subject = header.empty() ? make_missing<UnknownExpr>(n, n.start_byte(), "subject")
                                 : map_expr(header[0]);

  if (header.size() < 2) {
    stmt->value = make_missing<UnknownExpr>(
      n, close.is_null() ? n.end_byte() : close.start_byte(), "value");
  } else {
    ts_ll::Node value = header[1];
    if (classify_grammar_kind(value.kind()) == GrammarKind::ForeachPair) {
      const std::vector<ts_ll::Node> pair = value.named_children();
      if (pair.size() >= 2) {
        stmt->key = map_expr(pair[0]);
        value = pair[1];
      } else {
        value = ts_ll::Node();
        stmt->value = make_missing<UnknownExpr>(header[1], header[1].end_byte(), "value");
      }
    }
    if (!value.is_null()) {
      if (classify_grammar_kind(value.kind()) == GrammarKind::ByRef) {
        stmt->byRef = true;
        const std::vector<ts_ll::Node> inner = value.named_children();
        stmt->value = inner.empty() ? make_missing<UnknownExpr>(value, value.end_byte(), "target")
                                    : map_assign_target(inner.front());
      } else {
        stmt->value = map_assign_target(value);
      }
    }
  }

  stmt->body = map_body_after(n, close);
  return stmt;
}

// ============================================================================
// Exceptions
// ============================================================================

TryStmt * NodeMapper::map_try(ts_ll::Node n)
{
  const ts_ll::Node body = field_or_kind(n, "body", GrammarKind::CompoundStatement);
  auto * stmt = ast_.create<TryStmt>(map_body(body, n), span_of(n));

  std::vector<CatchClause *> catches;
  for (const ts_ll::Node & c : n.named_children()) {
    switch (classify_grammar_kind(c.kind())) {
      case GrammarKind::CatchClause:
        catches.push_back(map_catch(c));
        break;
      case GrammarKind::FinallyClause:
        stmt->finallyBlock =
          map_body(field_or_kind(c, "body", GrammarKind::CompoundStatement), c);
        break;
      default:
        break;
    }
  }
  stmt->catches = ast_.copy_to_arena(catches);
  return stmt;
}

CatchClause * NodeMapper::map_catch(ts_ll::Node n)
{
  auto * clause = ast_.create<CatchClause>(span_of(n));

  std::vector<NameExpr *> types;
  const ts_ll::Node type_node = field_or_kind(n, "type", GrammarKind::TypeList);
  if (!type_node.is_null()) {
    const GrammarKind tk = classify_grammar_kind(type_node.kind());
    std::vector<ts_ll::Node> members;
    if (tk == GrammarKind::TypeList) {
      members = type_node.named_children();
    } else {
      members.push_back(type_node);
    }
    for (const ts_ll::Node & m : members) {
      ts_ll::Node name_node = m;
      if (classify_grammar_kind(m.kind()) == GrammarKind::NamedType) {
        const std::vector<ts_ll::Node> inner = m.named_children();
        if (!inner.empty()) name_node = inner.front();
      }
      types.push_back(map_name(name_node));
    }
    if (types.size() > 1) {
      (void)check_construct(Construct::MultiCatch, type_node);
    }
  } else {
    diags_
      .report_error(
        tracker_.make_point(n.start_byte()), "'catch_clause' is missing its exception type",
        "expected here")
      .with_code(diag_code::k_missing_child);
  }
  clause->types = ast_.copy_to_arena(types);

  const ts_ll::Node var = field_or_kind(n, "name", GrammarKind::VariableName);
  if (var.is_null()) {
    (void)check_construct(Construct::CatchWithoutVariable, n);
  } else {
    clause->var = ast_.create<VariableExpr>(ast_.intern(strip_dollar(text(var))), span_of(var));
  }

  clause->body = map_body(field_or_kind(n, "body", GrammarKind::CompoundStatement), n);
  return clause;
}

// ============================================================================
// Namespaces and declarations
// ============================================================================

NamespaceStmt * NodeMapper::map_namespace(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::NamespaceName);
  auto * stmt = ast_.create<NamespaceStmt>(
    name.is_null() ? std::string_view{} : intern(name), span_of(n));

  const ts_ll::Node body = field_or_kind(n, "body", GrammarKind::CompoundStatement);
  if (!body.is_null()) {
    stmt->body = map_compound(body);
  }
  return stmt;
}

UseStmt * NodeMapper::map_namespace_use(ts_ll::Node n)
{
  auto * stmt = ast_.create<UseStmt>(span_of(n));
  stmt->useKind = use_kind_of(n, UseKind::Normal);

  std::vector<UseClause *> clauses;
  map_use_clauses(n, {}, stmt->useKind, clauses);

  // `use A\B\{C, D as E};`
  ts_ll::Node prefix;
  for (const ts_ll::Node & c : n.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (
      k == GrammarKind::NamespaceName || k == GrammarKind::QualifiedName ||
      k == GrammarKind::Name) {
      prefix = c;
    } else if (k == GrammarKind::NamespaceUseGroup) {
      std::string_view prefix_text = prefix.is_null() ? std::string_view{} : text(prefix);
      if (!prefix_text.empty() && prefix_text.front() == '\\') prefix_text.remove_prefix(1);
      map_use_clauses(c, prefix_text, stmt->useKind, clauses);
    }
  }

  stmt->clauses = ast_.copy_to_arena(clauses);
  return stmt;
}

void NodeMapper::map_use_clauses(
  ts_ll::Node n, std::string_view prefix, UseKind default_kind, std::vector<UseClause *> & out)
{
  for (const ts_ll::Node & clause : n.named_children()) {
    if (classify_grammar_kind(clause.kind()) != GrammarKind::NamespaceUseClause) continue;

    ts_ll::Node name;
    ts_ll::Node alias = clause.child_by_field("alias");
    for (const ts_ll::Node & c : clause.named_children()) {
      const GrammarKind k = classify_grammar_kind(c.kind());
      if (k == GrammarKind::NamespaceAliasingClause) {
        if (alias.is_null()) alias = c.first_child_of_kind("name");
      } else if (
        k == GrammarKind::Name || k == GrammarKind::QualifiedName ||
        k == GrammarKind::NamespaceName) {
        if (name.is_null()) {
          name = c;
        } else if (alias.is_null()) {
          alias = c;  // `A as B` without an aliasing clause node
        }
      }
    }

    std::string_view name_text = name.is_null() ? std::string_view{} : text(name);
    if (!name_text.empty() && name_text.front() == '\\') name_text.remove_prefix(1);
    std::string full;
    if (!prefix.empty()) {
      full.append(prefix);
      if (full.back() != '\\') full.push_back('\\');
    }
    full.append(name_text);

    auto * uc = ast_.create<UseClause>(
      ast_.intern(full), alias.is_null() ? std::string_view{} : intern(alias), span_of(clause));
    uc->useKind = use_kind_of(clause, default_kind);
    out.push_back(uc);
  }
}

DeclareStmt * NodeMapper::map_declare(ts_ll::Node n)
{
  auto * stmt = ast_.create<DeclareStmt>(span_of(n));

  std::vector<DeclareDirective *> directives;
  for (const ts_ll::Node & d : n.named_children()) {
    if (classify_grammar_kind(d.kind()) != GrammarKind::DeclareDirective) continue;

    // The directive name is an anonymous keyword token in most grammar releases.
    const ts_ll::Node first = d.child(0);
    const std::vector<ts_ll::Node> named = d.named_children();
    Expr * value = named.empty() ? make_missing<UnknownExpr>(d, d.end_byte(), "value")
                                 : map_expr(named.back());
    directives.push_back(ast_.create<DeclareDirective>(
      first.is_null() ? std::string_view{} : intern(first), value, span_of(d)));
  }
  stmt->directives = ast_.copy_to_arena(directives);

  // `declare(strict_types=1);` has no body.
  const ts_ll::Node close = find_token(n, ")");
  bool has_body = !n.child_by_field("body").is_null();
  if (!has_body && !close.is_null()) {
    const uint32_t count = n.child_count();
    for (uint32_t i = 0; i < count; ++i) {
      const ts_ll::Node c = n.child(i);
      if (c.is_extra() || c.start_byte() < close.end_byte()) continue;
      has_body = c.kind() != ";";
      break;
    }
  }
  if (has_body) {
    stmt->body = map_body_after(n, close);
  }
  return stmt;
}

}  // namespace celerrate
