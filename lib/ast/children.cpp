// celerrate/ast/children.cpp
#include "celerrate/ast/children.hpp"

#include "celerrate/ast/visitor.hpp"

namespace celerrate
{

namespace
{

class ChildCollector : public ConstAstVisitor<ChildCollector>
{
public:
  explicit ChildCollector(std::vector<const AstNode *> & out) : out_(out) {}

  // Leaves (literals, names, Unknown placeholders, ...) have no children.
  void visit_node(const AstNode * /*node*/) {}

  // --- expressions ---
  void visit_string_literal_expr(const StringLiteralExpr * n) { add_all(n->parts); }
  void visit_array_literal_expr(const ArrayLiteralExpr * n) { add_all(n->elements); }
  void visit_list_expr(const ListExpr * n) { add_all(n->elements); }
  void visit_variable_expr(const VariableExpr * n) { add(n->nameExpr); }
  void visit_binary_expr(const BinaryExpr * n)
  {
    add(n->lhs);
    add(n->rhs);
  }
  void visit_unary_expr(const UnaryExpr * n) { add(n->operand); }
  void visit_inc_dec_expr(const IncDecExpr * n) { add(n->operand); }
  void visit_assign_expr(const AssignExpr * n)
  {
    add(n->target);
    add(n->value);
  }
  void visit_ternary_expr(const TernaryExpr * n)
  {
    add(n->condition);
    add(n->thenExpr);
    add(n->elseExpr);
  }
  void visit_cast_expr(const CastExpr * n) { add(n->operand); }
  void visit_call_expr(const CallExpr * n)
  {
    add(n->callee);
    add_all(n->args);
  }
  void visit_method_call_expr(const MethodCallExpr * n)
  {
    add(n->object);
    add(n->name);
    add_all(n->args);
  }
  void visit_static_call_expr(const StaticCallExpr * n)
  {
    add(n->scope);
    add(n->name);
    add_all(n->args);
  }
  void visit_property_fetch_expr(const PropertyFetchExpr * n)
  {
    add(n->object);
    add(n->name);
  }
  void visit_static_property_fetch_expr(const StaticPropertyFetchExpr * n)
  {
    add(n->scope);
    add(n->name);
  }
  void visit_class_const_fetch_expr(const ClassConstFetchExpr * n)
  {
    add(n->scope);
    add(n->name);
  }
  void visit_subscript_expr(const SubscriptExpr * n)
  {
    add(n->base);
    add(n->index);
  }
  void visit_new_expr(const NewExpr * n)
  {
    add(n->classRef);
    add(n->anonymousClass);
    add_all(n->args);
  }
  void visit_closure_expr(const ClosureExpr * n)
  {
    add_all(n->params);
    add_all(n->uses);
    add(n->returnType);
    add(n->body);
  }
  void visit_arrow_function_expr(const ArrowFunctionExpr * n)
  {
    add_all(n->params);
    add(n->returnType);
    add(n->body);
  }
  void visit_match_expr(const MatchExpr * n)
  {
    add(n->subject);
    add_all(n->arms);
  }
  void visit_throw_expr(const ThrowExpr * n) { add(n->operand); }
  void visit_clone_expr(const CloneExpr * n) { add(n->operand); }
  void visit_print_expr(const PrintExpr * n) { add(n->operand); }
  void visit_include_expr(const IncludeExpr * n) { add(n->operand); }
  void visit_yield_expr(const YieldExpr * n)
  {
    add(n->key);
    add(n->value);
  }
  void visit_exit_expr(const ExitExpr * n) { add(n->status); }

  // --- types ---
  void visit_nullable_type(const NullableType * n) { add(n->inner); }
  void visit_union_type(const UnionType * n) { add_all(n->members); }
  void visit_intersection_type(const IntersectionType * n) { add_all(n->members); }

  // --- support ---
  void visit_argument(const Argument * n) { add(n->value); }
  void visit_array_element(const ArrayElement * n)
  {
    add(n->key);
    add(n->value);
  }
  void visit_match_arm(const MatchArm * n)
  {
    add_all(n->conditions);
    add(n->body);
  }
  void visit_else_if_clause(const ElseIfClause * n)
  {
    add(n->condition);
    add(n->body);
  }
  void visit_switch_case(const SwitchCase * n)
  {
    add(n->test);
    add_all(n->body);
  }
  void visit_catch_clause(const CatchClause * n)
  {
    add_all(n->types);
    add(n->var);
    add(n->body);
  }
  void visit_static_var(const StaticVar * n) { add(n->init); }
  void visit_declare_directive(const DeclareDirective * n) { add(n->value); }
  void visit_property_item(const PropertyItem * n) { add(n->defaultValue); }
  void visit_const_item(const ConstItem * n) { add(n->value); }
  void visit_attribute(const Attribute * n) { add_all(n->args); }

  // --- statements ---
  void visit_block_stmt(const BlockStmt * n) { add_all(n->stmts); }
  void visit_expr_stmt(const ExprStmt * n) { add(n->expr); }
  void visit_echo_stmt(const EchoStmt * n) { add_all(n->exprs); }
  void visit_return_stmt(const ReturnStmt * n) { add(n->value); }
  void visit_if_stmt(const IfStmt * n)
  {
    add(n->condition);
    add(n->thenBlock);
    add_all(n->elseIfs);
    add(n->elseBlock);
  }
  void visit_while_stmt(const WhileStmt * n)
  {
    add(n->condition);
    add(n->body);
  }
  void visit_do_while_stmt(const DoWhileStmt * n)
  {
    add(n->body);
    add(n->condition);
  }
  void visit_for_stmt(const ForStmt * n)
  {
    add_all(n->init);
    add_all(n->condition);
    add_all(n->step);
    add(n->body);
  }
  void visit_foreach_stmt(const ForeachStmt * n)
  {
    add(n->subject);
    add(n->key);
    add(n->value);
    add(n->body);
  }
  void visit_switch_stmt(const SwitchStmt * n)
  {
    add(n->subject);
    add_all(n->cases);
  }
  void visit_break_stmt(const BreakStmt * n) { add(n->depth); }
  void visit_continue_stmt(const ContinueStmt * n) { add(n->depth); }
  void visit_try_stmt(const TryStmt * n)
  {
    add(n->body);
    add_all(n->catches);
    add(n->finallyBlock);
  }
  void visit_throw_stmt(const ThrowStmt * n) { add(n->operand); }
  void visit_global_stmt(const GlobalStmt * n) { add_all(n->vars); }
  void visit_static_var_stmt(const StaticVarStmt * n) { add_all(n->vars); }
  void visit_unset_stmt(const UnsetStmt * n) { add_all(n->exprs); }
  void visit_namespace_stmt(const NamespaceStmt * n) { add(n->body); }
  void visit_use_stmt(const UseStmt * n) { add_all(n->clauses); }
  void visit_declare_stmt(const DeclareStmt * n)
  {
    add_all(n->directives);
    add(n->body);
  }
  void visit_decl_stmt(const DeclStmt * n) { add(n->decl); }

  // --- declarations ---
  void visit_class_decl(const ClassDecl * n)
  {
    add_all(n->attributes);
    add_all(n->anonymousArgs);
    add(n->extends);
    add_all(n->implements);
    add_all(n->members);
  }
  void visit_interface_decl(const InterfaceDecl * n)
  {
    add_all(n->attributes);
    add_all(n->extends);
    add_all(n->members);
  }
  void visit_trait_decl(const TraitDecl * n)
  {
    add_all(n->attributes);
    add_all(n->members);
  }
  void visit_enum_decl(const EnumDecl * n)
  {
    add_all(n->attributes);
    add(n->backingType);
    add_all(n->implements);
    add_all(n->members);
  }
  void visit_enum_case_decl(const EnumCaseDecl * n)
  {
    add_all(n->attributes);
    add(n->value);
  }
  void visit_function_decl(const FunctionDecl * n)
  {
    add_all(n->attributes);
    add_all(n->params);
    add(n->returnType);
    add(n->body);
  }
  void visit_method_decl(const MethodDecl * n)
  {
    add_all(n->attributes);
    add_all(n->params);
    add(n->returnType);
    add(n->body);
  }
  void visit_property_decl(const PropertyDecl * n)
  {
    add_all(n->attributes);
    if (!n->isPromoted) {
      add(n->type);
    }
    add_all(n->items);
  }
  void visit_class_const_decl(const ClassConstDecl * n)
  {
    add_all(n->attributes);
    add(n->type);
    add_all(n->items);
  }
  void visit_const_decl(const ConstDecl * n) { add_all(n->items); }
  void visit_param_decl(const ParamDecl * n)
  {
    add_all(n->attributes);
    add(n->promotedProperty);
    add(n->type);
    add(n->defaultValue);
  }
  void visit_trait_use_decl(const TraitUseDecl * n) { add_all(n->traits); }

  void visit_program(const Program * n) { add_all(n->stmts); }

private:
  void add(const AstNode * child)
  {
    if (child != nullptr) {
      out_.push_back(child);
    }
  }

  template <typename T>
  void add_all(gsl::span<T *> nodes)
  {
    for (const T * child : nodes) {
      add(child);
    }
  }

  std::vector<const AstNode *> & out_;
};

}  // namespace

std::vector<const AstNode *> children_of(const AstNode * node)
{
  std::vector<const AstNode *> out;
  ChildCollector collector(out);
  collector.visit(node);
  return out;
}

}  // namespace celerrate
