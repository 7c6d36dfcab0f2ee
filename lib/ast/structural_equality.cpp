// celerrate/ast/structural_equality.cpp
#include "celerrate/ast/structural_equality.hpp"

#include "celerrate/ast/children.hpp"
#include "celerrate/ast/visitor.hpp"

namespace celerrate
{

namespace
{

// Visits the left-hand node; other_ is the right-hand node of the same kind.
class FieldComparator : public ConstAstVisitor<FieldComparator, bool>
{
public:
  explicit FieldComparator(const AstNode * other) : other_(other) {}

  bool visit_node(const AstNode * /*node*/) { return true; }

  // --- Expressions ---
  bool visit_int_literal_expr(const IntLiteralExpr * a) { return a->value == rhs(a)->value; }
  bool visit_float_literal_expr(const FloatLiteralExpr * a) { return a->value == rhs(a)->value; }
  bool visit_string_literal_expr(const StringLiteralExpr * a)
  {
    const auto * b = rhs(a);
    return a->isInterpolated == b->isInterpolated && (a->isInterpolated || a->value == b->value);
  }
  bool visit_bool_literal_expr(const BoolLiteralExpr * a) { return a->value == rhs(a)->value; }
  bool visit_variable_expr(const VariableExpr * a) { return a->name == rhs(a)->name; }
  bool visit_name_expr(const NameExpr * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->nameKind == b->nameKind;
  }
  bool visit_binary_expr(const BinaryExpr * a) { return a->op == rhs(a)->op; }
  bool visit_unary_expr(const UnaryExpr * a) { return a->op == rhs(a)->op; }
  bool visit_inc_dec_expr(const IncDecExpr * a) { return a->op == rhs(a)->op; }
  bool visit_assign_expr(const AssignExpr * a)
  {
    const auto * b = rhs(a);
    return a->op == b->op && a->byRef == b->byRef;
  }
  bool visit_ternary_expr(const TernaryExpr * a)
  {
    return (a->thenExpr == nullptr) == (rhs(a)->thenExpr == nullptr);
  }
  bool visit_cast_expr(const CastExpr * a) { return a->castKind == rhs(a)->castKind; }
  bool visit_call_expr(const CallExpr * a)
  {
    return a->isFirstClassCallable == rhs(a)->isFirstClassCallable;
  }
  bool visit_method_call_expr(const MethodCallExpr * a)
  {
    const auto * b = rhs(a);
    return a->nullsafe == b->nullsafe && a->isFirstClassCallable == b->isFirstClassCallable;
  }
  bool visit_static_call_expr(const StaticCallExpr * a)
  {
    return a->isFirstClassCallable == rhs(a)->isFirstClassCallable;
  }
  bool visit_property_fetch_expr(const PropertyFetchExpr * a)
  {
    return a->nullsafe == rhs(a)->nullsafe;
  }
  bool visit_new_expr(const NewExpr * a)
  {
    return (a->anonymousClass == nullptr) == (rhs(a)->anonymousClass == nullptr);
  }
  bool visit_closure_expr(const ClosureExpr * a)
  {
    const auto * b = rhs(a);
    return a->isStatic == b->isStatic && a->byRefReturn == b->byRefReturn &&
           a->uses.size() == b->uses.size();
  }
  bool visit_arrow_function_expr(const ArrowFunctionExpr * a)
  {
    const auto * b = rhs(a);
    return a->isStatic == b->isStatic && a->byRefReturn == b->byRefReturn;
  }
  bool visit_include_expr(const IncludeExpr * a) { return a->includeKind == rhs(a)->includeKind; }
  bool visit_yield_expr(const YieldExpr * a)
  {
    const auto * b = rhs(a);
    return a->isFrom == b->isFrom && (a->key == nullptr) == (b->key == nullptr);
  }
  bool visit_unknown_expr(const UnknownExpr * a) { return a->reason == rhs(a)->reason; }

  // --- Types ---
  bool visit_named_type(const NamedType * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->isBuiltin == b->isBuiltin && a->nameKind == b->nameKind;
  }
  bool visit_unknown_type(const UnknownType * a) { return a->reason == rhs(a)->reason; }

  // --- Supporting nodes ---
  bool visit_argument(const Argument * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->isSpread == b->isSpread;
  }
  bool visit_array_element(const ArrayElement * a)
  {
    const auto * b = rhs(a);
    return a->byRef == b->byRef && a->isSpread == b->isSpread &&
           (a->key == nullptr) == (b->key == nullptr);
  }
  bool visit_match_arm(const MatchArm * a) { return a->isDefault == rhs(a)->isDefault; }
  bool visit_switch_case(const SwitchCase * a)
  {
    return (a->test == nullptr) == (rhs(a)->test == nullptr);
  }
  bool visit_catch_clause(const CatchClause * a)
  {
    return (a->var == nullptr) == (rhs(a)->var == nullptr);
  }
  bool visit_closure_use(const ClosureUse * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->byRef == b->byRef;
  }
  bool visit_static_var(const StaticVar * a) { return a->name == rhs(a)->name; }
  bool visit_use_clause(const UseClause * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->alias == b->alias && a->useKind == b->useKind;
  }
  bool visit_declare_directive(const DeclareDirective * a) { return a->name == rhs(a)->name; }
  bool visit_property_item(const PropertyItem * a) { return a->name == rhs(a)->name; }
  bool visit_const_item(const ConstItem * a) { return a->name == rhs(a)->name; }
  bool visit_attribute(const Attribute * a) { return a->name == rhs(a)->name; }

  // --- Statements ---
  bool visit_if_stmt(const IfStmt * a)
  {
    return (a->elseBlock == nullptr) == (rhs(a)->elseBlock == nullptr);
  }
  bool visit_for_stmt(const ForStmt * a)
  {
    const auto * b = rhs(a);
    return a->init.size() == b->init.size() && a->condition.size() == b->condition.size() &&
           a->step.size() == b->step.size();
  }
  bool visit_foreach_stmt(const ForeachStmt * a)
  {
    const auto * b = rhs(a);
    return a->byRef == b->byRef && (a->key == nullptr) == (b->key == nullptr);
  }
  bool visit_try_stmt(const TryStmt * a)
  {
    return (a->finallyBlock == nullptr) == (rhs(a)->finallyBlock == nullptr);
  }
  bool visit_namespace_stmt(const NamespaceStmt * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && (a->body == nullptr) == (b->body == nullptr);
  }
  bool visit_use_stmt(const UseStmt * a) { return a->useKind == rhs(a)->useKind; }
  bool visit_declare_stmt(const DeclareStmt * a)
  {
    return (a->body == nullptr) == (rhs(a)->body == nullptr);
  }
  bool visit_goto_stmt(const GotoStmt * a) { return a->label == rhs(a)->label; }
  bool visit_label_stmt(const LabelStmt * a) { return a->label == rhs(a)->label; }
  bool visit_inline_html_stmt(const InlineHtmlStmt * a) { return a->text == rhs(a)->text; }
  bool visit_unknown_stmt(const UnknownStmt * a) { return a->reason == rhs(a)->reason; }

  // --- Declarations ---
  bool visit_class_decl(const ClassDecl * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->isAbstract == b->isAbstract && a->isFinal == b->isFinal &&
           a->isReadonly == b->isReadonly && a->isAnonymous == b->isAnonymous &&
           (a->extends == nullptr) == (b->extends == nullptr) &&
           a->promotedProperties.size() == b->promotedProperties.size();
  }
  bool visit_interface_decl(const InterfaceDecl * a) { return a->name == rhs(a)->name; }
  bool visit_trait_decl(const TraitDecl * a) { return a->name == rhs(a)->name; }
  bool visit_enum_decl(const EnumDecl * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && (a->backingType == nullptr) == (b->backingType == nullptr);
  }
  bool visit_enum_case_decl(const EnumCaseDecl * a) { return a->name == rhs(a)->name; }
  bool visit_function_decl(const FunctionDecl * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->byRefReturn == b->byRefReturn &&
           a->params.size() == b->params.size() &&
           (a->returnType == nullptr) == (b->returnType == nullptr);
  }
  bool visit_method_decl(const MethodDecl * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->visibility == b->visibility && a->isStatic == b->isStatic &&
           a->isAbstract == b->isAbstract && a->isFinal == b->isFinal &&
           a->byRefReturn == b->byRefReturn && a->params.size() == b->params.size() &&
           (a->returnType == nullptr) == (b->returnType == nullptr) &&
           (a->body == nullptr) == (b->body == nullptr);
  }
  bool visit_property_decl(const PropertyDecl * a)
  {
    const auto * b = rhs(a);
    return a->visibility == b->visibility && a->setVisibility == b->setVisibility &&
           a->isStatic == b->isStatic && a->isReadonly == b->isReadonly &&
           a->isPromoted == b->isPromoted && (a->type == nullptr) == (b->type == nullptr);
  }
  bool visit_class_const_decl(const ClassConstDecl * a)
  {
    const auto * b = rhs(a);
    return a->visibility == b->visibility && a->isFinal == b->isFinal &&
           (a->type == nullptr) == (b->type == nullptr);
  }
  bool visit_param_decl(const ParamDecl * a)
  {
    const auto * b = rhs(a);
    return a->name == b->name && a->byRef == b->byRef && a->isVariadic == b->isVariadic &&
           a->promotedVisibility == b->promotedVisibility && a->isReadonly == b->isReadonly &&
           (a->type == nullptr) == (b->type == nullptr) &&
           (a->defaultValue == nullptr) == (b->defaultValue == nullptr);
  }
  bool visit_trait_use_decl(const TraitUseDecl * a)
  {
    return a->hasAdaptations == rhs(a)->hasAdaptations;
  }
  bool visit_unknown_decl(const UnknownDecl * a) { return a->reason == rhs(a)->reason; }

private:
  template <typename T>
  const T * rhs(const T * /*lhs*/) const
  {
    return static_cast<const T *>(other_);
  }

  const AstNode * other_;
};

}  // namespace

bool fields_equal(const AstNode * lhs, const AstNode * rhs)
{
  if (lhs == nullptr || rhs == nullptr) {
    return lhs == rhs;
  }
  if (lhs->get_kind() != rhs->get_kind()) {
    return false;
  }
  FieldComparator comparator(rhs);
  return comparator.visit(lhs);
}

bool structurally_equal(const AstNode * lhs, const AstNode * rhs)
{
  if (!fields_equal(lhs, rhs)) {
    return false;
  }
  if (lhs == nullptr) {
    return true;
  }

  const auto left_children = children_of(lhs);
  const auto right_children = children_of(rhs);
  if (left_children.size() != right_children.size()) {
    return false;
  }
  for (size_t i = 0; i < left_children.size(); ++i) {
    if (!structurally_equal(left_children[i], right_children[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace celerrate
