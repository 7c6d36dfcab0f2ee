// celerrate/ast/ast_dumper.hpp - Debug AST tree output
//
// This header provides utilities for dumping AST nodes in a human-readable
// tree format, useful for debugging and for golden tests.
//
#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_enums.hpp"
#include "celerrate/ast/children.hpp"
#include "celerrate/ast/visitor.hpp"

namespace celerrate
{

// ============================================================================
// AstDumper - Debug AST output
// ============================================================================

/**
 * Dumps AST nodes in a human-readable tree format.
 *
 * @code
 *   Program
 *   `-DeclStmt
 *     `-ClassDecl name='User'
 *       `-MethodDecl name='__construct' public
 *         `-ParamDecl name='id' promoted='private'
 *           |-PropertyDecl name='id' private [promoted]
 *           `-NamedType name='int' [builtin]
 * @endcode
 *
 * Children come from children_of(), so the dump shows exactly the
 * traversal order.
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os, bool show_spans = false)
  : os_(os), showSpans_(show_spans)
  {
  }

  /// Dump an AST node and its subtree
  void dump(const AstNode * node)
  {
    if (node == nullptr) {
      os_ << "<null>\n";
      return;
    }
    print_node(node, true);
  }

  /// Property for display: either {"key", "value"} or {"", "value"} for bare values
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}

    Prop(std::string_view k, int64_t v) : key(k), value(std::to_string(v)) {}
  };

  // ===========================================================================
  // Property visitors; anything not listed prints only its kind.
  // ===========================================================================

  void visit_node(const AstNode * /*node*/) {}

  // --- Expressions ---
  void visit_int_literal_expr(const IntLiteralExpr * node)
  {
    props_.emplace_back(std::to_string(node->value));
  }
  void visit_float_literal_expr(const FloatLiteralExpr * node)
  {
    props_.emplace_back(std::to_string(node->value));
  }
  void visit_string_literal_expr(const StringLiteralExpr * node)
  {
    props_.emplace_back("\"" + std::string(node->value) + "\"");
    props_.emplace_back(to_string(node->stringKind));
    if (node->isInterpolated) props_.emplace_back("[interpolated]");
  }
  void visit_bool_literal_expr(const BoolLiteralExpr * node)
  {
    props_.emplace_back(node->value ? "true" : "false");
  }
  void visit_variable_expr(const VariableExpr * node)
  {
    if (!node->nameExpr) props_.emplace_back("name", node->name);
  }
  void visit_name_expr(const NameExpr * node)
  {
    props_.emplace_back("name", node->name);
    if (node->nameKind != NameKind::Unqualified) props_.emplace_back(to_string(node->nameKind));
  }
  void visit_binary_expr(const BinaryExpr * node) { props_.emplace_back("op", to_string(node->op)); }
  void visit_unary_expr(const UnaryExpr * node) { props_.emplace_back("op", to_string(node->op)); }
  void visit_inc_dec_expr(const IncDecExpr * node) { props_.emplace_back("op", to_string(node->op)); }
  void visit_assign_expr(const AssignExpr * node)
  {
    props_.emplace_back("op", to_string(node->op));
    if (node->byRef) props_.emplace_back("[by-ref]");
  }
  void visit_ternary_expr(const TernaryExpr * node)
  {
    if (!node->thenExpr) props_.emplace_back("[short]");
  }
  void visit_cast_expr(const CastExpr * node) { props_.emplace_back("to", to_string(node->castKind)); }
  void visit_call_expr(const CallExpr * node)
  {
    if (node->isFirstClassCallable) props_.emplace_back("[callable]");
  }
  void visit_method_call_expr(const MethodCallExpr * node)
  {
    if (node->nullsafe) props_.emplace_back("[nullsafe]");
    if (node->isFirstClassCallable) props_.emplace_back("[callable]");
  }
  void visit_static_call_expr(const StaticCallExpr * node)
  {
    if (node->isFirstClassCallable) props_.emplace_back("[callable]");
  }
  void visit_property_fetch_expr(const PropertyFetchExpr * node)
  {
    if (node->nullsafe) props_.emplace_back("[nullsafe]");
  }
  void visit_closure_expr(const ClosureExpr * node)
  {
    if (node->isStatic) props_.emplace_back("static");
    if (node->byRefReturn) props_.emplace_back("[by-ref]");
  }
  void visit_arrow_function_expr(const ArrowFunctionExpr * node)
  {
    if (node->isStatic) props_.emplace_back("static");
    if (node->byRefReturn) props_.emplace_back("[by-ref]");
  }
  void visit_include_expr(const IncludeExpr * node) { props_.emplace_back(to_string(node->includeKind)); }
  void visit_yield_expr(const YieldExpr * node)
  {
    if (node->isFrom) props_.emplace_back("from");
  }
  void visit_unknown_expr(const UnknownExpr * node) { unknown_props(node->reason, node->grammarKind); }

  // --- Types ---
  void visit_named_type(const NamedType * node)
  {
    props_.emplace_back("name", node->name);
    if (node->isBuiltin) props_.emplace_back("[builtin]");
  }
  void visit_unknown_type(const UnknownType * node) { unknown_props(node->reason, node->grammarKind); }

  // --- Supporting nodes ---
  void visit_argument(const Argument * node)
  {
    if (!node->name.empty()) props_.emplace_back("name", node->name);
    if (node->isSpread) props_.emplace_back("[spread]");
  }
  void visit_array_element(const ArrayElement * node)
  {
    if (node->byRef) props_.emplace_back("[by-ref]");
    if (node->isSpread) props_.emplace_back("[spread]");
  }
  void visit_match_arm(const MatchArm * node)
  {
    if (node->isDefault) props_.emplace_back("default");
  }
  void visit_switch_case(const SwitchCase * node)
  {
    if (!node->test) props_.emplace_back("default");
  }
  void visit_closure_use(const ClosureUse * node)
  {
    props_.emplace_back("name", node->name);
    if (node->byRef) props_.emplace_back("[by-ref]");
  }
  void visit_static_var(const StaticVar * node) { props_.emplace_back("name", node->name); }
  void visit_use_clause(const UseClause * node)
  {
    props_.emplace_back("name", node->name);
    if (!node->alias.empty()) props_.emplace_back("as", node->alias);
    if (node->useKind != UseKind::Normal) props_.emplace_back(to_string(node->useKind));
  }
  void visit_declare_directive(const DeclareDirective * node) { props_.emplace_back("name", node->name); }
  void visit_property_item(const PropertyItem * node) { props_.emplace_back("name", node->name); }
  void visit_const_item(const ConstItem * node) { props_.emplace_back("name", node->name); }
  void visit_attribute(const Attribute * node) { props_.emplace_back("name", node->name); }

  // --- Statements ---
  void visit_foreach_stmt(const ForeachStmt * node)
  {
    if (node->byRef) props_.emplace_back("[by-ref]");
  }
  void visit_namespace_stmt(const NamespaceStmt * node)
  {
    if (!node->name.empty()) props_.emplace_back("name", node->name);
  }
  void visit_use_stmt(const UseStmt * node)
  {
    if (node->useKind != UseKind::Normal) props_.emplace_back(to_string(node->useKind));
  }
  void visit_goto_stmt(const GotoStmt * node) { props_.emplace_back("label", node->label); }
  void visit_label_stmt(const LabelStmt * node) { props_.emplace_back("label", node->label); }
  void visit_inline_html_stmt(const InlineHtmlStmt * node)
  {
    props_.emplace_back("size", static_cast<int64_t>(node->text.size()));
  }
  void visit_unknown_stmt(const UnknownStmt * node) { unknown_props(node->reason, node->grammarKind); }

  // --- Declarations ---
  void visit_class_decl(const ClassDecl * node)
  {
    if (node->isAnonymous) {
      props_.emplace_back("[anonymous]");
    } else {
      props_.emplace_back("name", node->name);
    }
    if (node->isAbstract) props_.emplace_back("abstract");
    if (node->isFinal) props_.emplace_back("final");
    if (node->isReadonly) props_.emplace_back("readonly");
  }
  void visit_interface_decl(const InterfaceDecl * node) { props_.emplace_back("name", node->name); }
  void visit_trait_decl(const TraitDecl * node) { props_.emplace_back("name", node->name); }
  void visit_enum_decl(const EnumDecl * node) { props_.emplace_back("name", node->name); }
  void visit_enum_case_decl(const EnumCaseDecl * node) { props_.emplace_back("name", node->name); }
  void visit_function_decl(const FunctionDecl * node)
  {
    props_.emplace_back("name", node->name);
    if (node->byRefReturn) props_.emplace_back("[by-ref]");
  }
  void visit_method_decl(const MethodDecl * node)
  {
    props_.emplace_back("name", node->name);
    props_.emplace_back(to_string(node->visibility));
    if (node->isStatic) props_.emplace_back("static");
    if (node->isAbstract) props_.emplace_back("abstract");
    if (node->isFinal) props_.emplace_back("final");
    if (node->byRefReturn) props_.emplace_back("[by-ref]");
  }
  void visit_property_decl(const PropertyDecl * node)
  {
    props_.emplace_back("name", node->name());
    props_.emplace_back(to_string(node->visibility));
    if (node->setVisibility) {
      props_.emplace_back("set", to_string(*node->setVisibility));
    }
    if (node->isStatic) props_.emplace_back("static");
    if (node->isReadonly) props_.emplace_back("readonly");
    if (node->isPromoted) props_.emplace_back("[promoted]");
  }
  void visit_class_const_decl(const ClassConstDecl * node)
  {
    props_.emplace_back(to_string(node->visibility));
    if (node->isFinal) props_.emplace_back("final");
  }
  void visit_param_decl(const ParamDecl * node)
  {
    props_.emplace_back("name", node->name);
    if (node->promotedVisibility) {
      props_.emplace_back("promoted", to_string(*node->promotedVisibility));
    }
    if (node->isReadonly) props_.emplace_back("readonly");
    if (node->byRef) props_.emplace_back("[by-ref]");
    if (node->isVariadic) props_.emplace_back("[variadic]");
  }
  void visit_trait_use_decl(const TraitUseDecl * node)
  {
    if (node->hasAdaptations) props_.emplace_back("[adaptations]");
  }
  void visit_unknown_decl(const UnknownDecl * node) { unknown_props(node->reason, node->grammarKind); }

private:
  std::ostream & os_;
  bool showSpans_;
  std::string prefix_;
  bool isLast_ = true;
  std::vector<Prop> props_;

  void unknown_props(UnknownReason reason, std::string_view grammar_kind)
  {
    props_.emplace_back("reason", to_string(reason));
    if (!grammar_kind.empty()) props_.emplace_back("grammar", grammar_kind);
  }

  void print_node(const AstNode * node, bool is_root)
  {
    props_.clear();
    visit(node);

    if (!is_root) {
      os_ << prefix_ << (isLast_ ? "`-" : "|-");
    }
    os_ << to_string(node->get_kind());
    for (const auto & prop : props_) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    if (showSpans_) {
      const Span & s = node->get_span();
      os_ << " <" << s.start_line << ":" << s.start_column << "-" << s.end_line << ":"
          << s.end_column << ">";
    }
    os_ << "\n";

    const auto children = children_of(node);
    if (children.empty()) {
      return;
    }

    // Root's direct children start at column 0; indentation begins one level down.
    const std::string saved = prefix_;
    if (!is_root) {
      prefix_ += isLast_ ? "  " : "| ";
    }
    for (size_t i = 0; i < children.size(); ++i) {
      isLast_ = (i == children.size() - 1);
      print_node(children[i], false);
    }
    prefix_ = saved;
  }
};

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Dump an AST node to the given output stream.
 */
inline void dump(const AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

/**
 * Dump an AST node to a string.
 */
inline std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace celerrate
