// celerrate/syntax/node_mapper.hpp - tree-sitter-php CST -> AST mapper
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_context.hpp"
#include "celerrate/basic/diagnostic.hpp"
#include "celerrate/basic/source_manager.hpp"
#include "celerrate/basic/span_tracker.hpp"
#include "celerrate/dialect/dialect_resolver.hpp"
#include "celerrate/syntax/grammar_kind.hpp"
#include "celerrate/syntax/mapping_options.hpp"
#include "celerrate/syntax/ts_ll.hpp"

namespace celerrate
{

/**
 * Recursive transformer from the concrete tree to the AST.
 *
 * Owns no memory: nodes go to the AstContext, problems to the DiagnosticBag.
 * The only state carried through recursion is the dialect, the diagnostics
 * sink, the depth counter and a stack of enclosing declaration kinds.
 *
 * Every grammar kind listed in grammar_kinds.def has one rule. A concrete
 * node that cannot be mapped in its position becomes an Unknown placeholder
 * and the rest of the tree is mapped as usual.
 */
class NodeMapper
{
public:
  NodeMapper(
    AstContext & ast, const SourceManager & sm, DiagnosticBag & diags,
    const MappingOptions & options);

  NodeMapper(const NodeMapper &) = delete;
  NodeMapper & operator=(const NodeMapper &) = delete;

  [[nodiscard]] Program * map_program(ts_ll::Node program_node);

  [[nodiscard]] Stmt * map_stmt(ts_ll::Node stmt_node);
  [[nodiscard]] Expr * map_expr(ts_ll::Node expr_node);
  [[nodiscard]] TypeNode * map_type(ts_ll::Node type_node);

private:
  // What encloses the node being mapped; decides whether promotion is legal.
  enum class EnclosingKind : uint8_t {
    TopLevel,
    Class,
    Interface,
    Trait,
    Enum,
    Function,
    Method,
    Constructor,
    Closure,
  };

  class EnclosingScope
  {
  public:
    EnclosingScope(NodeMapper & mapper, EnclosingKind kind) : mapper_(mapper)
    {
      mapper_.enclosing_.push_back(kind);
    }
    ~EnclosingScope() { mapper_.enclosing_.pop_back(); }

    EnclosingScope(const EnclosingScope &) = delete;
    EnclosingScope & operator=(const EnclosingScope &) = delete;

  private:
    NodeMapper & mapper_;
  };

  // Collects the properties synthesized from promoted parameters of one class body.
  class PromotionScope
  {
  public:
    explicit PromotionScope(NodeMapper & mapper)
    : mapper_(mapper), saved_(mapper.promotedSink_)
    {
      mapper_.promotedSink_ = &properties;
    }
    ~PromotionScope() { mapper_.promotedSink_ = saved_; }

    PromotionScope(const PromotionScope &) = delete;
    PromotionScope & operator=(const PromotionScope &) = delete;

    std::vector<PropertyDecl *> properties;

  private:
    NodeMapper & mapper_;
    std::vector<PropertyDecl *> * saved_;
  };

  // Counts concrete nesting; exceeded() turns the subtree into Unknown.
  class DepthGuard
  {
  public:
    explicit DepthGuard(NodeMapper & mapper) : mapper_(mapper) { ++mapper_.depth_; }
    ~DepthGuard() { --mapper_.depth_; }

    DepthGuard(const DepthGuard &) = delete;
    DepthGuard & operator=(const DepthGuard &) = delete;

    [[nodiscard]] bool exceeded() const noexcept
    {
      return mapper_.depth_ > mapper_.options_.max_depth;
    }

  private:
    NodeMapper & mapper_;
  };

  struct Modifiers
  {
    std::optional<Visibility> visibility;
    ts_ll::Node visibilityNode;
    std::optional<Visibility> setVisibility;
    ts_ll::Node setVisibilityNode;
    bool isStatic = false;
    bool isAbstract = false;
    bool isFinal = false;
    bool isReadonly = false;
    bool isVar = false;
    ts_ll::Node readonlyNode;
    ts_ll::Node first;  ///< Earliest modifier token in source order
  };

  // --- NodeMapper.cpp: program, dispatch helpers, failure handling ---
  /// Maps the statement children of `parent` that start at or after `from_byte`.
  void map_statement_list(ts_ll::Node parent, std::vector<Stmt *> & out, uint32_t from_byte = 0);
  [[nodiscard]] Stmt * map_inline_html(ts_ll::Node text_interpolation_node);

  [[nodiscard]] UnknownReason failure_reason(ts_ll::Node n) const;
  void report_failure(ts_ll::Node n, UnknownReason reason, std::string_view position);
  template <typename UnknownT>
  [[nodiscard]] UnknownT * make_unknown(ts_ll::Node n, UnknownReason reason, std::string_view position);
  template <typename UnknownT>
  [[nodiscard]] UnknownT * make_missing(ts_ll::Node parent, uint32_t offset, std::string_view what);
  [[nodiscard]] UnknownDecl * nesting_limit_decl(ts_ll::Node n);

  [[nodiscard]] bool check_construct(Construct c, const Span & at);
  [[nodiscard]] bool check_construct(Construct c, ts_ll::Node at) { return check_construct(c, span_of(at)); }
  void report_invalid_modifier(ts_ll::Node at, std::string message);

  [[nodiscard]] EnclosingKind enclosing() const noexcept;
  [[nodiscard]] EnclosingKind enclosing_class_kind() const noexcept;

  // --- MapStmt.cpp ---
  [[nodiscard]] Stmt * map_stmt_kind(ts_ll::Node n, GrammarKind kind);
  [[nodiscard]] BlockStmt * map_compound(ts_ll::Node compound_node);
  [[nodiscard]] BlockStmt * map_body(ts_ll::Node body_node, ts_ll::Node owner);
  [[nodiscard]] BlockStmt * map_body_after(ts_ll::Node owner, ts_ll::Node after);
  [[nodiscard]] BlockStmt * map_alt_body(ts_ll::Node owner, ts_ll::Node colon);
  [[nodiscard]] BlockStmt * empty_block(ts_ll::Node parent, uint32_t offset, std::string_view what);
  [[nodiscard]] Stmt * map_expression_statement(ts_ll::Node n);
  [[nodiscard]] EchoStmt * map_echo(ts_ll::Node n);
  [[nodiscard]] ReturnStmt * map_return(ts_ll::Node n);
  [[nodiscard]] IfStmt * map_if(ts_ll::Node n);
  void map_else_if_chain(
    ts_ll::Node if_node, std::vector<ElseIfClause *> & elseifs, BlockStmt *& else_block);
  [[nodiscard]] WhileStmt * map_while(ts_ll::Node n);
  [[nodiscard]] DoWhileStmt * map_do(ts_ll::Node n);
  [[nodiscard]] ForStmt * map_for(ts_ll::Node n);
  [[nodiscard]] ForeachStmt * map_foreach(ts_ll::Node n);
  [[nodiscard]] SwitchStmt * map_switch(ts_ll::Node n);
  [[nodiscard]] SwitchCase * map_switch_case(ts_ll::Node n);
  [[nodiscard]] Stmt * map_break_continue(ts_ll::Node n, bool is_break);
  [[nodiscard]] TryStmt * map_try(ts_ll::Node n);
  [[nodiscard]] CatchClause * map_catch(ts_ll::Node n);
  [[nodiscard]] GlobalStmt * map_global(ts_ll::Node n);
  [[nodiscard]] StaticVarStmt * map_static_vars(ts_ll::Node n);
  [[nodiscard]] UnsetStmt * map_unset(ts_ll::Node n);
  [[nodiscard]] NamespaceStmt * map_namespace(ts_ll::Node n);
  [[nodiscard]] UseStmt * map_namespace_use(ts_ll::Node n);
  void map_use_clauses(
    ts_ll::Node n, std::string_view prefix, UseKind default_kind, std::vector<UseClause *> & out);
  [[nodiscard]] DeclareStmt * map_declare(ts_ll::Node n);
  [[nodiscard]] Stmt * map_exit_statement(ts_ll::Node n);
  [[nodiscard]] std::vector<Expr *> map_expression_list(ts_ll::Node n);
  void append_flattened(ts_ll::Node n, std::vector<Expr *> & out);

  // --- MapDecl.cpp ---
  [[nodiscard]] Decl * map_decl_kind(ts_ll::Node n, GrammarKind kind);
  [[nodiscard]] FunctionDecl * map_function(ts_ll::Node n);
  [[nodiscard]] ClassDecl * map_class(ts_ll::Node n);
  [[nodiscard]] ClassDecl * map_anonymous_class(ts_ll::Node n, ts_ll::Node args_node);
  void map_class_header(ts_ll::Node n, ClassDecl * decl);
  [[nodiscard]] InterfaceDecl * map_interface(ts_ll::Node n);
  [[nodiscard]] TraitDecl * map_trait(ts_ll::Node n);
  [[nodiscard]] EnumDecl * map_enum(ts_ll::Node n);
  [[nodiscard]] EnumCaseDecl * map_enum_case(ts_ll::Node n);
  [[nodiscard]] std::vector<Decl *> map_members(ts_ll::Node body_node);
  [[nodiscard]] Decl * map_member(ts_ll::Node n);
  [[nodiscard]] PropertyDecl * map_property(ts_ll::Node n);
  [[nodiscard]] MethodDecl * map_method(ts_ll::Node n);
  [[nodiscard]] Decl * map_const_declaration(ts_ll::Node n, bool in_class);
  [[nodiscard]] ConstItem * map_const_element(ts_ll::Node n);
  [[nodiscard]] TraitUseDecl * map_trait_use(ts_ll::Node n);
  [[nodiscard]] std::vector<ParamDecl *> map_params(ts_ll::Node formal_parameters_node);
  [[nodiscard]] ParamDecl * map_param(ts_ll::Node n);
  [[nodiscard]] PropertyDecl * promote_param(ts_ll::Node n, ParamDecl * param, const Modifiers & mods);
  [[nodiscard]] std::vector<Attribute *> map_attributes(ts_ll::Node decl_node);
  [[nodiscard]] std::vector<NameExpr *> map_name_list(ts_ll::Node clause_node);
  [[nodiscard]] Modifiers collect_modifiers(ts_ll::Node decl_node);
  void apply_property_modifiers(const Modifiers & mods, PropertyDecl * prop);
  [[nodiscard]] Expr * map_initializer(ts_ll::Node value_node);

  // --- MapExpr.cpp ---
  [[nodiscard]] Expr * map_expr_kind(ts_ll::Node n, GrammarKind kind);
  [[nodiscard]] Expr * map_assignment(ts_ll::Node n, bool by_ref);
  [[nodiscard]] Expr * map_augmented_assignment(ts_ll::Node n);
  [[nodiscard]] Expr * map_assign_target(ts_ll::Node n);
  [[nodiscard]] Expr * map_binary(ts_ll::Node n);
  [[nodiscard]] Expr * map_unary(ts_ll::Node n);
  [[nodiscard]] Expr * map_update(ts_ll::Node n);
  [[nodiscard]] Expr * map_cast(ts_ll::Node n);
  [[nodiscard]] Expr * map_conditional(ts_ll::Node n);
  [[nodiscard]] Expr * map_function_call(ts_ll::Node n);
  [[nodiscard]] Expr * map_member_call(ts_ll::Node n, bool nullsafe);
  [[nodiscard]] Expr * map_scoped_call(ts_ll::Node n);
  [[nodiscard]] Expr * map_member_access(ts_ll::Node n, bool nullsafe);
  [[nodiscard]] Expr * map_scoped_property(ts_ll::Node n);
  [[nodiscard]] Expr * map_class_constant(ts_ll::Node n);
  [[nodiscard]] Expr * map_subscript(ts_ll::Node n);
  [[nodiscard]] Expr * map_object_creation(ts_ll::Node n);
  [[nodiscard]] Expr * map_closure(ts_ll::Node n);
  [[nodiscard]] Expr * map_arrow_function(ts_ll::Node n);
  [[nodiscard]] ArrayLiteralExpr * map_array(ts_ll::Node n);
  [[nodiscard]] ArrayElement * map_array_element(ts_ll::Node n);
  [[nodiscard]] ListExpr * map_list(ts_ll::Node n);
  /// `[$a, $b]` parsed as an array literal in assignment-target position.
  [[nodiscard]] ListExpr * map_array_as_list(ts_ll::Node n);
  [[nodiscard]] Expr * map_match(ts_ll::Node n);
  [[nodiscard]] MatchArm * map_match_arm(ts_ll::Node n);
  [[nodiscard]] Expr * map_throw(ts_ll::Node n);
  [[nodiscard]] Expr * map_include(ts_ll::Node n, IncludeKind kind);
  [[nodiscard]] Expr * map_yield(ts_ll::Node n);
  [[nodiscard]] Expr * map_variable(ts_ll::Node n);
  [[nodiscard]] Expr * map_dynamic_variable(ts_ll::Node n);
  [[nodiscard]] NameExpr * map_name(ts_ll::Node n);
  [[nodiscard]] Expr * map_member_name(ts_ll::Node n);
  [[nodiscard]] std::vector<Argument *> map_arguments(ts_ll::Node args_node, bool & first_class_callable);
  [[nodiscard]] Argument * map_argument(ts_ll::Node n);

  // --- MapType.cpp ---
  [[nodiscard]] TypeNode * map_type_kind(ts_ll::Node n, GrammarKind kind);
  [[nodiscard]] TypeNode * map_named_type(ts_ll::Node n);
  [[nodiscard]] TypeNode * map_union_type(ts_ll::Node n);
  [[nodiscard]] TypeNode * map_intersection_type(ts_ll::Node n);
  [[nodiscard]] TypeNode * map_dnf_type(ts_ll::Node n);
  void check_type_gates(TypeNode * type, bool is_return_type);
  [[nodiscard]] TypeNode * map_return_type(ts_ll::Node type_node);
  /// Return type of a function-like node, with or without the return_type field.
  [[nodiscard]] static ts_ll::Node return_type_node(ts_ll::Node n, ts_ll::Node params);

  // --- MapSupport.cpp: literals and names ---
  [[nodiscard]] Expr * map_integer(ts_ll::Node n);
  [[nodiscard]] Expr * map_float(ts_ll::Node n);
  [[nodiscard]] Expr * map_boolean(ts_ll::Node n);
  [[nodiscard]] Expr * map_string(ts_ll::Node n);
  /// String body in [begin, end): literal text, escapes and embedded expressions.
  /// Heredoc bodies lose `indent` leading whitespace characters on every line.
  [[nodiscard]] Expr * map_encapsed(
    ts_ll::Node n, StringKind kind, ts_ll::Node body, uint32_t begin, uint32_t end,
    uint32_t indent = 0);
  [[nodiscard]] Expr * map_heredoc(ts_ll::Node n);
  [[nodiscard]] Expr * map_nowdoc(ts_ll::Node n);
  void report_malformed_literal(ts_ll::Node n, std::string message);
  [[nodiscard]] std::string_view qualified_text(ts_ll::Node n, NameKind & kind);

  // --- Small accessors shared by all files ---
  [[nodiscard]] std::string_view text(ts_ll::Node n) const { return n.text(sm_); }
  [[nodiscard]] std::string_view intern(ts_ll::Node n) { return ast_.intern(text(n)); }
  [[nodiscard]] Span span_of(ts_ll::Node n) const { return tracker_.make_span(n.range()); }
  [[nodiscard]] Span span_between(ts_ll::Node first, ts_ll::Node last) const
  {
    return tracker_.make_span(first.start_byte(), last.end_byte());
  }

  /// The named field when present, else the first named child of `kind`.
  [[nodiscard]] static ts_ll::Node field_or_kind(
    ts_ll::Node n, std::string_view field, GrammarKind kind);
  /// The named field when present, else the n-th named child.
  [[nodiscard]] static ts_ll::Node field_or_index(ts_ll::Node n, std::string_view field, uint32_t index);
  /// First anonymous child spelled `token`, or a null node.
  [[nodiscard]] static ts_ll::Node find_token(ts_ll::Node n, std::string_view token);
  /// `&` before a function name or parameter, as a token or reference_modifier node.
  [[nodiscard]] static bool has_reference_modifier(ts_ll::Node n);
  [[nodiscard]] static bool is_type_kind(GrammarKind kind) noexcept;
  [[nodiscard]] static bool is_modifier_kind(GrammarKind kind) noexcept;

  AstContext & ast_;
  const SourceManager & sm_;
  DiagnosticBag & diags_;
  const MappingOptions options_;
  const DialectResolver & resolver_;
  const SpanTracker tracker_;

  uint32_t depth_ = 0;
  std::vector<EnclosingKind> enclosing_;
  std::vector<PropertyDecl *> * promotedSink_ = nullptr;
};

}  // namespace celerrate
