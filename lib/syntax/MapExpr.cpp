// celerrate/syntax/MapExpr.cpp - CST -> AST for expressions
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

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

std::string lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/// Anonymous operator token of a node, taken from the `operator` field when present.
std::string_view operator_token(ts_ll::Node n)
{
  const ts_ll::Node by_field = n.child_by_field("operator");
  if (!by_field.is_null()) {
    return by_field.kind();
  }
  const uint32_t count = n.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = n.child(i);
    if (!c.is_named() && !c.is_extra()) {
      return c.kind();
    }
  }
  return {};
}

std::optional<BinaryOp> binary_op_from(std::string_view tok)
{
  static const std::pair<std::string_view, BinaryOp> k_ops[] = {
    {"+", BinaryOp::Add},
    {"-", BinaryOp::Sub},
    {"*", BinaryOp::Mul},
    {"/", BinaryOp::Div},
    {"%", BinaryOp::Mod},
    {"**", BinaryOp::Pow},
    {".", BinaryOp::Concat},
    {"<<", BinaryOp::ShiftLeft},
    {">>", BinaryOp::ShiftRight},
    {"&", BinaryOp::BitAnd},
    {"|", BinaryOp::BitOr},
    {"^", BinaryOp::BitXor},
    {"&&", BinaryOp::And},
    {"||", BinaryOp::Or},
    {"and", BinaryOp::LogicalAnd},
    {"or", BinaryOp::LogicalOr},
    {"xor", BinaryOp::LogicalXor},
    {"==", BinaryOp::Equal},
    {"!=", BinaryOp::NotEqual},
    {"<>", BinaryOp::NotEqual},
    {"===", BinaryOp::Identical},
    {"!==", BinaryOp::NotIdentical},
    {"<", BinaryOp::Less},
    {"<=", BinaryOp::LessEqual},
    {">", BinaryOp::Greater},
    {">=", BinaryOp::GreaterEqual},
    {"<=>", BinaryOp::Spaceship},
    {"??", BinaryOp::Coalesce},
    {"instanceof", BinaryOp::Instanceof},
  };
  const std::string key = lower(tok);
  for (const auto & [spelling, op] : k_ops) {
    if (spelling == key) return op;
  }
  return std::nullopt;
}

std::optional<AssignOp> assign_op_from(std::string_view tok)
{
  static const std::pair<std::string_view, AssignOp> k_ops[] = {
    {"+=", AssignOp::Add},        {"-=", AssignOp::Sub},          {"*=", AssignOp::Mul},
    {"/=", AssignOp::Div},        {"%=", AssignOp::Mod},          {"**=", AssignOp::Pow},
    {".=", AssignOp::Concat},     {"<<=", AssignOp::ShiftLeft},   {">>=", AssignOp::ShiftRight},
    {"&=", AssignOp::BitAnd},     {"|=", AssignOp::BitOr},        {"^=", AssignOp::BitXor},
    {"??=", AssignOp::Coalesce},
  };
  for (const auto & [spelling, op] : k_ops) {
    if (spelling == tok) return op;
  }
  return std::nullopt;
}

bool is_name_kind(GrammarKind kind) noexcept
{
  switch (kind) {
    case GrammarKind::Name:
    case GrammarKind::QualifiedName:
    case GrammarKind::NamespaceName:
    case GrammarKind::RelativeScope:
      return true;
    default:
      return false;
  }
}

}  // namespace

Expr * NodeMapper::map_expr_kind(ts_ll::Node n, GrammarKind kind)
{
  if (n.is_missing()) {
    return make_unknown<UnknownExpr>(n, UnknownReason::MissingToken, "an expression");
  }

  switch (kind) {
    case GrammarKind::ParenthesizedExpression: {
      const std::vector<ts_ll::Node> named = n.named_children();
      if (named.empty()) {
        return make_missing<UnknownExpr>(n, n.start_byte(), "expression");
      }
      return map_expr(named.front());
    }

    case GrammarKind::AssignmentExpression:
      return map_assignment(n, false);
    case GrammarKind::ReferenceAssignmentExpression:
      return map_assignment(n, true);
    case GrammarKind::AugmentedAssignmentExpression:
      return map_augmented_assignment(n);
    case GrammarKind::BinaryExpression:
      return map_binary(n);
    case GrammarKind::UnaryOpExpression:
    case GrammarKind::ErrorSuppressionExpression:
      return map_unary(n);
    case GrammarKind::UpdateExpression:
      return map_update(n);
    case GrammarKind::CastExpression:
      return map_cast(n);
    case GrammarKind::ConditionalExpression:
      return map_conditional(n);

    case GrammarKind::FunctionCallExpression:
      return map_function_call(n);
    case GrammarKind::MemberCallExpression:
      return map_member_call(n, false);
    case GrammarKind::NullsafeMemberCallExpression:
      return map_member_call(n, true);
    case GrammarKind::ScopedCallExpression:
      return map_scoped_call(n);
    case GrammarKind::MemberAccessExpression:
      return map_member_access(n, false);
    case GrammarKind::NullsafeMemberAccessExpression:
      return map_member_access(n, true);
    case GrammarKind::ScopedPropertyAccessExpression:
      return map_scoped_property(n);
    case GrammarKind::ClassConstantAccessExpression:
      return map_class_constant(n);
    case GrammarKind::SubscriptExpression:
      return map_subscript(n);
    case GrammarKind::ObjectCreationExpression:
      return map_object_creation(n);

    case GrammarKind::AnonymousFunction:
      return map_closure(n);
    case GrammarKind::ArrowFunction:
      return map_arrow_function(n);
    case GrammarKind::ArrayCreationExpression:
      return map_array(n);
    case GrammarKind::ListLiteral:
      return map_list(n);
    case GrammarKind::MatchExpression:
      return map_match(n);
    case GrammarKind::ThrowExpression:
      return map_throw(n);

    case GrammarKind::CloneExpression:
    case GrammarKind::PrintIntrinsic: {
      const std::vector<ts_ll::Node> named = n.named_children();
      Expr * operand = named.empty() ? make_missing<UnknownExpr>(n, n.end_byte(), "operand")
                                     : map_expr(named.front());
      if (kind == GrammarKind::CloneExpression) {
        return ast_.create<CloneExpr>(operand, span_of(n));
      }
      return ast_.create<PrintExpr>(operand, span_of(n));
    }

    case GrammarKind::IncludeExpression:
      return map_include(n, IncludeKind::Include);
    case GrammarKind::IncludeOnceExpression:
      return map_include(n, IncludeKind::IncludeOnce);
    case GrammarKind::RequireExpression:
      return map_include(n, IncludeKind::Require);
    case GrammarKind::RequireOnceExpression:
      return map_include(n, IncludeKind::RequireOnce);
    case GrammarKind::YieldExpression:
      return map_yield(n);
    case GrammarKind::ExitStatement: {
      const std::vector<ts_ll::Node> named = n.named_children();
      return ast_.create<ExitExpr>(named.empty() ? nullptr : map_expr(named.front()), span_of(n));
    }

    case GrammarKind::VariableName:
      return map_variable(n);
    case GrammarKind::DynamicVariableName:
      return map_dynamic_variable(n);

    case GrammarKind::Integer:
      return map_integer(n);
    case GrammarKind::Float:
      return map_float(n);
    case GrammarKind::Boolean:
      return map_boolean(n);
    case GrammarKind::Null:
      return ast_.create<NullLiteralExpr>(span_of(n));
    case GrammarKind::String:
    case GrammarKind::EncapsedString:
      return map_string(n);
    case GrammarKind::Heredoc:
      return map_heredoc(n);
    case GrammarKind::Nowdoc:
      return map_nowdoc(n);

    case GrammarKind::Name:
    case GrammarKind::QualifiedName:
    case GrammarKind::NamespaceName:
    case GrammarKind::RelativeScope:
      return map_name(n);

    default:
      return make_unknown<UnknownExpr>(n, failure_reason(n), "an expression");
  }
}

// ============================================================================
// Assignment
// ============================================================================

Expr * NodeMapper::map_assignment(ts_ll::Node n, bool by_ref)
{
  const ts_ll::Node left = field_or_index(n, "left", 0);
  ts_ll::Node right = field_or_index(n, "right", 1);

  // Some grammar releases wrap `=& $x` in a by_ref node on the right.
  if (!right.is_null() && classify_grammar_kind(right.kind()) == GrammarKind::ByRef) {
    by_ref = true;
    const std::vector<ts_ll::Node> inner = right.named_children();
    right = inner.empty() ? ts_ll::Node() : inner.front();
  }
  by_ref = by_ref || n.has_token("&");

  Expr * target =
    left.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "target") : map_assign_target(left);
  Expr * value =
    right.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "value") : map_expr(right);

  auto * assign = ast_.create<AssignExpr>(target, AssignOp::Assign, value, span_of(n));
  assign->byRef = by_ref;
  return assign;
}

Expr * NodeMapper::map_augmented_assignment(ts_ll::Node n)
{
  const std::string_view tok = operator_token(n);
  const std::optional<AssignOp> op = assign_op_from(tok);
  if (!op) {
    return make_unknown<UnknownExpr>(n, UnknownReason::UnexpectedKind, "a compound assignment");
  }
  if (*op == AssignOp::Coalesce) {
    const ts_ll::Node at = find_token(n, "??=");
    (void)check_construct(Construct::NullCoalescingAssignment, at.is_null() ? n : at);
  }

  const ts_ll::Node left = field_or_index(n, "left", 0);
  const ts_ll::Node right = field_or_index(n, "right", 1);
  Expr * target =
    left.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "target") : map_expr(left);
  Expr * value =
    right.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "value") : map_expr(right);
  return ast_.create<AssignExpr>(target, *op, value, span_of(n));
}

Expr * NodeMapper::map_assign_target(ts_ll::Node n)
{
  switch (classify_grammar_kind(n.kind())) {
    case GrammarKind::ListLiteral:
      return map_list(n);
    case GrammarKind::ArrayCreationExpression:
      if (n.child_count() > 0 && n.child(0).kind() == "[") {
        return map_array_as_list(n);
      }
      return map_expr(n);
    default:
      return map_expr(n);
  }
}

// ============================================================================
// Operators
// ============================================================================

Expr * NodeMapper::map_binary(ts_ll::Node n)
{
  const ts_ll::Node left = field_or_index(n, "left", 0);
  const ts_ll::Node right = field_or_index(n, "right", 1);

  const std::optional<BinaryOp> op = binary_op_from(operator_token(n));
  if (!op) {
    return make_unknown<UnknownExpr>(n, UnknownReason::UnexpectedKind, "a binary operation");
  }

  Expr * lhs =
    left.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "left operand") : map_expr(left);
  Expr * rhs =
    right.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "right operand") : map_expr(right);
  return ast_.create<BinaryExpr>(lhs, *op, rhs, span_of(n));
}

Expr * NodeMapper::map_unary(ts_ll::Node n)
{
  UnaryOp op = UnaryOp::Silence;
  if (classify_grammar_kind(n.kind()) == GrammarKind::UnaryOpExpression) {
    const std::string_view tok = operator_token(n);
    if (tok == "!") {
      op = UnaryOp::Not;
    } else if (tok == "-") {
      op = UnaryOp::Negate;
    } else if (tok == "+") {
      op = UnaryOp::Plus;
    } else if (tok == "~") {
      op = UnaryOp::BitNot;
    } else if (tok != "@") {
      return make_unknown<UnknownExpr>(n, UnknownReason::UnexpectedKind, "a unary operation");
    }
  }

  ts_ll::Node operand = n.child_by_field("argument");
  if (operand.is_null()) {
    const std::vector<ts_ll::Node> named = n.named_children();
    if (!named.empty()) operand = named.back();
  }
  Expr * e =
    operand.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "operand") : map_expr(operand);
  return ast_.create<UnaryExpr>(op, e, span_of(n));
}

Expr * NodeMapper::map_update(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  if (named.empty()) {
    return ast_.create<IncDecExpr>(
      IncDecOp::PostIncrement, make_missing<UnknownExpr>(n, n.start_byte(), "operand"), span_of(n));
  }

  const ts_ll::Node first = n.child(0);
  const bool prefix = !first.is_named();
  const std::string_view tok = prefix ? first.kind() : n.child(n.child_count() - 1).kind();
  const bool inc = tok == "++";

  IncDecOp op;
  if (prefix) {
    op = inc ? IncDecOp::PreIncrement : IncDecOp::PreDecrement;
  } else {
    op = inc ? IncDecOp::PostIncrement : IncDecOp::PostDecrement;
  }
  return ast_.create<IncDecExpr>(op, map_expr(named.front()), span_of(n));
}

Expr * NodeMapper::map_cast(ts_ll::Node n)
{
  const ts_ll::Node type = field_or_kind(n, "type", GrammarKind::CastType);
  ts_ll::Node value = n.child_by_field("value");
  if (value.is_null()) {
    const std::vector<ts_ll::Node> named = n.named_children();
    if (!named.empty() && (type.is_null() || named.back().start_byte() >= type.end_byte())) {
      value = named.back();
    }
  }

  if (type.is_null()) {
    return make_missing<UnknownExpr>(n, n.start_byte(), "cast type");
  }

  // Every spelling collapses onto one CastKind.
  const std::string spelling = lower(text(type));
  CastKind kind;
  if (spelling == "int" || spelling == "integer") {
    kind = CastKind::Int;
  } else if (spelling == "float" || spelling == "double") {
    kind = CastKind::Float;
  } else if (spelling == "real") {
    kind = CastKind::Float;
    (void)check_construct(Construct::RealCast, type);
  } else if (spelling == "string" || spelling == "binary") {
    kind = CastKind::String;
  } else if (spelling == "bool" || spelling == "boolean") {
    kind = CastKind::Bool;
  } else if (spelling == "array") {
    kind = CastKind::Array;
  } else if (spelling == "object") {
    kind = CastKind::Object;
  } else if (spelling == "unset") {
    kind = CastKind::Unset;
    (void)check_construct(Construct::UnsetCast, type);
  } else {
    return make_unknown<UnknownExpr>(type, UnknownReason::UnexpectedKind, "a cast type");
  }

  Expr * operand =
    value.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "operand") : map_expr(value);
  return ast_.create<CastExpr>(kind, operand, span_of(n));
}

Expr * NodeMapper::map_conditional(ts_ll::Node n)
{
  ts_ll::Node cond = n.child_by_field("condition");
  ts_ll::Node body = n.child_by_field("body");
  ts_ll::Node alt = n.child_by_field("alternative");

  if (cond.is_null() || alt.is_null()) {
    // Position the operands around the `?` and `:` tokens.
    const ts_ll::Node question = find_token(n, "?");
    const ts_ll::Node colon = find_token(n, ":");
    for (const ts_ll::Node & c : n.named_children()) {
      if (!question.is_null() && c.end_byte() <= question.start_byte()) {
        if (cond.is_null()) cond = c;
      } else if (!colon.is_null() && c.start_byte() >= colon.end_byte()) {
        if (alt.is_null()) alt = c;
      } else if (body.is_null()) {
        body = c;
      }
    }
  }

  Expr * condition =
    cond.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "condition") : map_expr(cond);
  Expr * then_expr = body.is_null() ? nullptr : map_expr(body);
  Expr * else_expr =
    alt.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "else branch") : map_expr(alt);

  auto * ternary = ast_.create<TernaryExpr>(condition, then_expr, else_expr, span_of(n));

  // `a ? b : c ? d : e` arrives left-nested; only chains of `?:` stay legal after 8.0.
  const auto * inner = dyn_cast<TernaryExpr>(condition);
  const bool unparenthesized = inner != nullptr &&
                               classify_grammar_kind(cond.kind()) == GrammarKind::ConditionalExpression;
  const bool both_short = inner != nullptr && inner->thenExpr == nullptr && then_expr == nullptr;
  if (
    unparenthesized && !both_short &&
    resolver_.resolve_ambiguity(Construct::UnparenthesizedNestedTernary, options_.version) ==
      InterpretationChoice::Reject) {
    const PhpVersion removed = resolver_.removed_in(Construct::UnparenthesizedNestedTernary)
                                 .value_or(options_.version);
    diags_
      .report_error(
        span_of(n),
        fmt::format(
          "use of {} was removed in PHP {} (active dialect is PHP {})",
          describe(Construct::UnparenthesizedNestedTernary), to_string(removed),
          to_string(options_.version)),
        "add parentheses to choose an order")
      .with_code(diag_code::k_construct_removed);
  }
  return ternary;
}

// ============================================================================
// Calls and member access
// ============================================================================

std::vector<Argument *> NodeMapper::map_arguments(ts_ll::Node args_node, bool & first_class_callable)
{
  std::vector<Argument *> out;
  first_class_callable = false;
  if (args_node.is_null()) return out;

  bool any_named_child = false;
  for (const ts_ll::Node & c : args_node.named_children()) {
    any_named_child = true;
    switch (classify_grammar_kind(c.kind())) {
      case GrammarKind::Argument:
        out.push_back(map_argument(c));
        break;
      case GrammarKind::VariadicPlaceholder:
        first_class_callable = true;
        break;
      case GrammarKind::VariadicUnpacking: {
        const std::vector<ts_ll::Node> inner = c.named_children();
        Expr * value = inner.empty() ? make_missing<UnknownExpr>(c, c.end_byte(), "operand")
                                     : map_expr(inner.front());
        auto * arg = ast_.create<Argument>(std::string_view{}, value, span_of(c));
        arg->isSpread = true;
        out.push_back(arg);
        break;
      }
      default:
        out.push_back(ast_.create<Argument>(std::string_view{}, map_expr(c), span_of(c)));
        break;
    }
  }

  // `f(...)` in grammar releases without a variadic_placeholder node.
  if (!any_named_child && args_node.has_token("...")) {
    first_class_callable = true;
  }
  if (first_class_callable) {
    (void)check_construct(Construct::FirstClassCallable, args_node);
  }
  return out;
}

Argument * NodeMapper::map_argument(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();

  ts_ll::Node name = n.child_by_field("name");
  if (name.is_null() && n.has_token(":") && named.size() >= 2 &&
      classify_grammar_kind(named.front().kind()) == GrammarKind::Name) {
    name = named.front();
  }

  ts_ll::Node value;
  for (const ts_ll::Node & c : named) {
    if (!name.is_null() && c.start_byte() < name.end_byte()) continue;
    if (classify_grammar_kind(c.kind()) == GrammarKind::ReferenceModifier) continue;
    value = c;
  }

  bool spread = n.has_token("...");
  if (!value.is_null() && classify_grammar_kind(value.kind()) == GrammarKind::VariadicUnpacking) {
    spread = true;
    const std::vector<ts_ll::Node> inner = value.named_children();
    value = inner.empty() ? ts_ll::Node() : inner.front();
  }

  Expr * v = value.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "value") : map_expr(value);
  auto * arg = ast_.create<Argument>(
    name.is_null() ? std::string_view{} : intern(name), v, span_of(n));
  arg->isSpread = spread;

  if (!name.is_null()) {
    (void)check_construct(Construct::NamedArguments, name);
  }
  return arg;
}

Expr * NodeMapper::map_function_call(ts_ll::Node n)
{
  const ts_ll::Node fn = field_or_index(n, "function", 0);
  Expr * callee = fn.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "callee")
                               : map_member_name(fn);

  auto * call = ast_.create<CallExpr>(callee, span_of(n));
  bool fcc = false;
  call->args =
    ast_.copy_to_arena(map_arguments(field_or_kind(n, "arguments", GrammarKind::Arguments), fcc));
  call->isFirstClassCallable = fcc;
  return call;
}

Expr * NodeMapper::map_member_call(ts_ll::Node n, bool nullsafe)
{
  const ts_ll::Node object = field_or_index(n, "object", 0);
  const ts_ll::Node name = field_or_index(n, "name", 1);

  if (nullsafe) {
    const ts_ll::Node op = find_token(n, "?->");
    (void)check_construct(Construct::NullsafeOperator, op.is_null() ? n : op);
  }

  auto * call = ast_.create<MethodCallExpr>(
    object.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "object") : map_expr(object),
    name.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "method name")
                   : map_member_name(name),
    span_of(n));
  call->nullsafe = nullsafe;

  bool fcc = false;
  call->args =
    ast_.copy_to_arena(map_arguments(field_or_kind(n, "arguments", GrammarKind::Arguments), fcc));
  call->isFirstClassCallable = fcc;
  return call;
}

Expr * NodeMapper::map_scoped_call(ts_ll::Node n)
{
  const ts_ll::Node scope = field_or_index(n, "scope", 0);
  const ts_ll::Node name = field_or_index(n, "name", 1);

  auto * call = ast_.create<StaticCallExpr>(
    scope.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "scope") : map_member_name(scope),
    name.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "method name")
                   : map_member_name(name),
    span_of(n));

  bool fcc = false;
  call->args =
    ast_.copy_to_arena(map_arguments(field_or_kind(n, "arguments", GrammarKind::Arguments), fcc));
  call->isFirstClassCallable = fcc;
  return call;
}

Expr * NodeMapper::map_member_access(ts_ll::Node n, bool nullsafe)
{
  const ts_ll::Node object = field_or_index(n, "object", 0);
  const ts_ll::Node name = field_or_index(n, "name", 1);

  if (nullsafe) {
    const ts_ll::Node op = find_token(n, "?->");
    (void)check_construct(Construct::NullsafeOperator, op.is_null() ? n : op);
  }

  auto * fetch = ast_.create<PropertyFetchExpr>(
    object.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "object") : map_expr(object),
    name.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "property name")
                   : map_member_name(name),
    span_of(n));
  fetch->nullsafe = nullsafe;
  return fetch;
}

Expr * NodeMapper::map_scoped_property(ts_ll::Node n)
{
  const ts_ll::Node scope = field_or_index(n, "scope", 0);
  const ts_ll::Node name = field_or_index(n, "name", 1);
  return ast_.create<StaticPropertyFetchExpr>(
    scope.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "scope") : map_member_name(scope),
    name.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "property name") : map_expr(name),
    span_of(n));
}

Expr * NodeMapper::map_class_constant(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  Expr * scope = named.empty() ? make_missing<UnknownExpr>(n, n.start_byte(), "scope")
                               : map_member_name(named.front());

  Expr * name = nullptr;
  if (named.size() >= 2) {
    name = map_member_name(named[1]);
  } else {
    // `Foo::class` where `class` stayed a keyword token.
    const ts_ll::Node colons = find_token(n, "::");
    const uint32_t count = n.child_count();
    for (uint32_t i = 0; i < count && !colons.is_null(); ++i) {
      const ts_ll::Node c = n.child(i);
      if (!c.is_named() && c.start_byte() >= colons.end_byte()) {
        name = ast_.create<NameExpr>(intern(c), NameKind::Unqualified, span_of(c));
        break;
      }
    }
    if (name == nullptr) {
      name = make_missing<UnknownExpr>(n, n.end_byte(), "constant name");
    }
  }
  return ast_.create<ClassConstFetchExpr>(scope, name, span_of(n));
}

Expr * NodeMapper::map_subscript(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  Expr * base = named.empty() ? make_missing<UnknownExpr>(n, n.start_byte(), "base")
                              : map_expr(named.front());
  Expr * index = named.size() >= 2 ? map_expr(named[1]) : nullptr;
  return ast_.create<SubscriptExpr>(base, index, span_of(n));
}

Expr * NodeMapper::map_member_name(ts_ll::Node n)
{
  switch (classify_grammar_kind(n.kind())) {
    case GrammarKind::Name:
    case GrammarKind::QualifiedName:
    case GrammarKind::NamespaceName:
    case GrammarKind::RelativeScope:
      return map_name(n);
    default:
      return map_expr(n);
  }
}

// ============================================================================
// Object creation and functions
// ============================================================================

Expr * NodeMapper::map_object_creation(ts_ll::Node n)
{
  auto * expr = ast_.create<NewExpr>(span_of(n));

  const ts_ll::Node anon = n.first_child_of_kind("anonymous_class");
  if (!anon.is_null()) {
    expr->anonymousClass = map_anonymous_class(anon, anon.first_child_of_kind("arguments"));
    return expr;
  }
  if (n.has_token("class")) {
    expr->anonymousClass = map_anonymous_class(n, n.first_child_of_kind("arguments"));
    return expr;
  }

  ts_ll::Node class_ref;
  ts_ll::Node args;
  for (const ts_ll::Node & c : n.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (k == GrammarKind::Arguments) {
      args = c;
    } else if (class_ref.is_null() && k != GrammarKind::AttributeList) {
      class_ref = c;
    }
  }

  expr->classRef = class_ref.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "class name")
                                       : map_member_name(class_ref);
  if (!args.is_null()) {
    bool fcc = false;
    expr->args = ast_.copy_to_arena(map_arguments(args, fcc));
  }
  return expr;
}

Expr * NodeMapper::map_closure(ts_ll::Node n)
{
  auto * closure = ast_.create<ClosureExpr>(span_of(n));
  closure->isStatic = !n.first_child_of_kind("static_modifier").is_null() || n.has_token("static");
  closure->byRefReturn = has_reference_modifier(n);

  EnclosingScope scope(*this, EnclosingKind::Closure);
  const ts_ll::Node params = field_or_kind(n, "parameters", GrammarKind::FormalParameters);
  closure->params = ast_.copy_to_arena(map_params(params));

  std::vector<ClosureUse *> uses;
  const ts_ll::Node use_clause = n.first_child_of_kind("anonymous_function_use_clause");
  if (!use_clause.is_null()) {
    for (const ts_ll::Node & c : use_clause.named_children()) {
      ts_ll::Node var = c;
      const bool by_ref = classify_grammar_kind(c.kind()) == GrammarKind::ByRef;
      if (by_ref) {
        var = c.first_child_of_kind("variable_name");
      }
      if (var.is_null() || classify_grammar_kind(var.kind()) != GrammarKind::VariableName) {
        report_failure(c, failure_reason(c), "a closure use list");
        continue;
      }
      uses.push_back(
        ast_.create<ClosureUse>(ast_.intern(strip_dollar(text(var))), by_ref, span_of(c)));
    }
  }
  closure->uses = ast_.copy_to_arena(uses);

  closure->returnType = map_return_type(return_type_node(n, params));
  closure->body = map_body(field_or_kind(n, "body", GrammarKind::CompoundStatement), n);
  return closure;
}

Expr * NodeMapper::map_arrow_function(ts_ll::Node n)
{
  const ts_ll::Node fn = find_token(n, "fn");
  (void)check_construct(Construct::ArrowFunctions, fn.is_null() ? n : fn);

  auto * arrow = ast_.create<ArrowFunctionExpr>(span_of(n));
  arrow->isStatic = !n.first_child_of_kind("static_modifier").is_null() || n.has_token("static");
  arrow->byRefReturn = has_reference_modifier(n);

  EnclosingScope scope(*this, EnclosingKind::Closure);
  const ts_ll::Node params = field_or_kind(n, "parameters", GrammarKind::FormalParameters);
  arrow->params = ast_.copy_to_arena(map_params(params));
  arrow->returnType = map_return_type(return_type_node(n, params));

  ts_ll::Node body = n.child_by_field("body");
  if (body.is_null()) {
    const ts_ll::Node arrow_tok = find_token(n, "=>");
    for (const ts_ll::Node & c : n.named_children()) {
      if (!arrow_tok.is_null() && c.start_byte() >= arrow_tok.end_byte()) {
        body = c;
        break;
      }
    }
  }
  arrow->body = body.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "body") : map_expr(body);
  return arrow;
}

// ============================================================================
// Arrays and destructuring
// ============================================================================

ArrayLiteralExpr * NodeMapper::map_array(ts_ll::Node n)
{
  auto * array = ast_.create<ArrayLiteralExpr>(span_of(n));
  std::vector<ArrayElement *> elements;
  for (const ts_ll::Node & c : n.named_children()) {
    if (classify_grammar_kind(c.kind()) == GrammarKind::ArrayElementInitializer) {
      elements.push_back(map_array_element(c));
    } else {
      elements.push_back(ast_.create<ArrayElement>(nullptr, map_expr(c), span_of(c)));
    }
  }
  array->elements = ast_.copy_to_arena(elements);
  return array;
}

ArrayElement * NodeMapper::map_array_element(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  const bool has_key = n.has_token("=>") && named.size() >= 2;

  Expr * key = has_key ? map_expr(named.front()) : nullptr;
  ts_ll::Node value = named.empty() ? ts_ll::Node() : named.back();

  bool by_ref = false;
  bool spread = n.has_token("...");
  if (!value.is_null()) {
    switch (classify_grammar_kind(value.kind())) {
      case GrammarKind::ByRef: {
        by_ref = true;
        const std::vector<ts_ll::Node> inner = value.named_children();
        value = inner.empty() ? ts_ll::Node() : inner.front();
        break;
      }
      case GrammarKind::VariadicUnpacking: {
        spread = true;
        const std::vector<ts_ll::Node> inner = value.named_children();
        value = inner.empty() ? ts_ll::Node() : inner.front();
        break;
      }
      default:
        break;
    }
  }
  if (spread) {
    (void)check_construct(Construct::ArraySpread, n);
  }

  Expr * v = value.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "value") : map_expr(value);
  auto * element = ast_.create<ArrayElement>(key, v, span_of(n));
  element->byRef = by_ref;
  element->isSpread = spread;
  return element;
}

ListExpr * NodeMapper::map_list(ts_ll::Node n)
{
  if (n.child_count() > 0 && n.child(0).kind() == "[") {
    (void)check_construct(Construct::ShortListDestructuring, n);
  }

  auto * list = ast_.create<ListExpr>(span_of(n));
  std::vector<ArrayElement *> elements;

  // Elements are separated by ',' tokens; an empty slot is a hole.
  std::vector<ts_ll::Node> slot;
  bool slot_has_arrow = false;
  uint32_t slot_start = n.start_byte();

  auto flush = [&](uint32_t at) {
    if (slot.empty()) {
      elements.push_back(ast_.create<ArrayElement>(nullptr, nullptr, tracker_.make_point(at)));
    } else if (slot.size() == 1 &&
               classify_grammar_kind(slot.front().kind()) == GrammarKind::ArrayElementInitializer) {
      const ts_ll::Node init = slot.front();
      const std::vector<ts_ll::Node> inner = init.named_children();
      const bool keyed = init.has_token("=>") && inner.size() >= 2;
      ts_ll::Node value = inner.empty() ? ts_ll::Node() : inner.back();
      bool by_ref = false;
      if (!value.is_null() && classify_grammar_kind(value.kind()) == GrammarKind::ByRef) {
        by_ref = true;
        const std::vector<ts_ll::Node> v = value.named_children();
        value = v.empty() ? ts_ll::Node() : v.front();
      }
      auto * element = ast_.create<ArrayElement>(
        keyed ? map_expr(inner.front()) : nullptr,
        value.is_null() ? make_missing<UnknownExpr>(init, init.end_byte(), "target")
                        : map_assign_target(value),
        span_of(init));
      element->byRef = by_ref;
      elements.push_back(element);
    } else {
      const bool keyed = slot_has_arrow && slot.size() >= 2;
      ts_ll::Node value = slot.back();
      bool by_ref = false;
      if (classify_grammar_kind(value.kind()) == GrammarKind::ByRef) {
        by_ref = true;
        const std::vector<ts_ll::Node> v = value.named_children();
        value = v.empty() ? ts_ll::Node() : v.front();
      }
      auto * element = ast_.create<ArrayElement>(
        keyed ? map_expr(slot.front()) : nullptr,
        value.is_null() ? make_missing<UnknownExpr>(slot.back(), slot.back().end_byte(), "target")
                        : map_assign_target(value),
        span_between(slot.front(), slot.back()));
      element->byRef = by_ref;
      elements.push_back(element);
    }
    slot.clear();
    slot_has_arrow = false;
  };

  bool open = false;
  const uint32_t count = n.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = n.child(i);
    if (c.is_extra()) continue;
    if (!c.is_named()) {
      const std::string_view tok = c.kind();
      if (!open) {
        if (tok == "(" || tok == "[") {
          open = true;
          slot_start = c.end_byte();
        }
        continue;
      }
      if (tok == ",") {
        flush(slot.empty() ? c.start_byte() : slot_start);
        slot_start = c.end_byte();
      } else if (tok == "=>") {
        slot_has_arrow = true;
      } else if (tok == ")" || tok == "]") {
        // A trailing comma leaves no hole.
        if (!slot.empty()) flush(slot_start);
        break;
      }
      continue;
    }
    if (open) {
      slot.push_back(c);
    }
  }

  list->elements = ast_.copy_to_arena(elements);
  return list;
}

ListExpr * NodeMapper::map_array_as_list(ts_ll::Node n)
{
  (void)check_construct(Construct::ShortListDestructuring, n);

  auto * list = ast_.create<ListExpr>(span_of(n));
  std::vector<ArrayElement *> elements;
  for (const ts_ll::Node & c : n.named_children()) {
    if (classify_grammar_kind(c.kind()) != GrammarKind::ArrayElementInitializer) {
      elements.push_back(ast_.create<ArrayElement>(nullptr, map_assign_target(c), span_of(c)));
      continue;
    }
    const std::vector<ts_ll::Node> inner = c.named_children();
    const bool keyed = c.has_token("=>") && inner.size() >= 2;
    ts_ll::Node value = inner.empty() ? ts_ll::Node() : inner.back();
    bool by_ref = false;
    if (!value.is_null() && classify_grammar_kind(value.kind()) == GrammarKind::ByRef) {
      by_ref = true;
      const std::vector<ts_ll::Node> v = value.named_children();
      value = v.empty() ? ts_ll::Node() : v.front();
    }
    auto * element = ast_.create<ArrayElement>(
      keyed ? map_expr(inner.front()) : nullptr,
      value.is_null() ? make_missing<UnknownExpr>(c, c.end_byte(), "target")
                      : map_assign_target(value),
      span_of(c));
    element->byRef = by_ref;
    elements.push_back(element);
  }
  list->elements = ast_.copy_to_arena(elements);
  return list;
}

// ============================================================================
// match, throw, include, yield
// ============================================================================

Expr * NodeMapper::map_match(ts_ll::Node n)
{
  const ts_ll::Node keyword = find_token(n, "match");
  (void)check_construct(Construct::MatchExpression, keyword.is_null() ? n : keyword);

  const ts_ll::Node cond = field_or_kind(n, "condition", GrammarKind::ParenthesizedExpression);
  auto * match = ast_.create<MatchExpr>(
    cond.is_null() ? make_missing<UnknownExpr>(n, n.start_byte(), "subject") : map_expr(cond),
    span_of(n));

  std::vector<MatchArm *> arms;
  const ts_ll::Node block = field_or_kind(n, "body", GrammarKind::MatchBlock);
  if (!block.is_null()) {
    for (const ts_ll::Node & c : block.named_children()) {
      const GrammarKind k = classify_grammar_kind(c.kind());
      if (k == GrammarKind::MatchConditionalExpression || k == GrammarKind::MatchDefaultExpression) {
        arms.push_back(map_match_arm(c));
      } else {
        report_failure(c, failure_reason(c), "a match arm");
      }
    }
  }
  match->arms = ast_.copy_to_arena(arms);
  return match;
}

MatchArm * NodeMapper::map_match_arm(ts_ll::Node n)
{
  auto * arm = ast_.create<MatchArm>(span_of(n));
  arm->isDefault = classify_grammar_kind(n.kind()) == GrammarKind::MatchDefaultExpression;

  ts_ll::Node body = n.child_by_field("return_expression");
  if (body.is_null()) {
    const std::vector<ts_ll::Node> named = n.named_children();
    if (!named.empty()) body = named.back();
  }

  if (!arm->isDefault) {
    std::vector<Expr *> conditions;
    const ts_ll::Node list =
      field_or_kind(n, "conditional_expressions", GrammarKind::MatchConditionList);
    if (!list.is_null()) {
      for (const ts_ll::Node & c : list.named_children()) {
        conditions.push_back(map_expr(c));
      }
    }
    arm->conditions = ast_.copy_to_arena(conditions);
  }

  arm->body = body.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "arm body") : map_expr(body);
  return arm;
}

Expr * NodeMapper::map_throw(ts_ll::Node n)
{
  // Statement-level throws become ThrowStmt before reaching here.
  const ts_ll::Node keyword = find_token(n, "throw");
  (void)check_construct(Construct::ThrowExpression, keyword.is_null() ? n : keyword);

  const std::vector<ts_ll::Node> named = n.named_children();
  Expr * operand = named.empty() ? make_missing<UnknownExpr>(n, n.end_byte(), "operand")
                                 : map_expr(named.front());
  return ast_.create<ThrowExpr>(operand, span_of(n));
}

Expr * NodeMapper::map_include(ts_ll::Node n, IncludeKind kind)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  Expr * operand = named.empty() ? make_missing<UnknownExpr>(n, n.end_byte(), "path")
                                 : map_expr(named.front());
  return ast_.create<IncludeExpr>(kind, operand, span_of(n));
}

Expr * NodeMapper::map_yield(ts_ll::Node n)
{
  auto * yield = ast_.create<YieldExpr>(span_of(n));
  const std::vector<ts_ll::Node> named = n.named_children();
  if (named.empty()) {
    return yield;
  }

  yield->isFrom = n.has_token("from");
  const ts_ll::Node operand = named.front();
  if (!yield->isFrom && classify_grammar_kind(operand.kind()) == GrammarKind::ArrayElementInitializer) {
    const std::vector<ts_ll::Node> inner = operand.named_children();
    if (operand.has_token("=>") && inner.size() >= 2) {
      yield->key = map_expr(inner.front());
      yield->value = map_expr(inner.back());
    } else if (!inner.empty()) {
      yield->value = map_expr(inner.front());
    }
    return yield;
  }
  yield->value = map_expr(operand);
  return yield;
}

// ============================================================================
// Variables and names
// ============================================================================

Expr * NodeMapper::map_variable(ts_ll::Node n)
{
  return ast_.create<VariableExpr>(ast_.intern(strip_dollar(text(n))), span_of(n));
}

Expr * NodeMapper::map_dynamic_variable(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  auto * var = ast_.create<VariableExpr>(std::string_view{}, span_of(n));
  var->nameExpr = named.empty() ? make_missing<UnknownExpr>(n, n.end_byte(), "variable name")
                                : map_expr(named.front());
  return var;
}

NameExpr * NodeMapper::map_name(ts_ll::Node n)
{
  ts_ll::Node name_node = n;
  if (classify_grammar_kind(n.kind()) == GrammarKind::NamedType) {
    for (const ts_ll::Node & c : n.named_children()) {
      if (is_name_kind(classify_grammar_kind(c.kind()))) {
        name_node = c;
        break;
      }
    }
  }

  NameKind kind = NameKind::Unqualified;
  const std::string_view name = qualified_text(name_node, kind);
  return ast_.create<NameExpr>(name, kind, span_of(n));
}

}  // namespace celerrate
