// celerrate/ast/visitor.hpp - CRTP visitor for AST dispatch
#pragma once

#include <type_traits>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_enums.hpp"
#include "celerrate/basic/casting.hpp"

namespace celerrate
{

namespace detail
{

/// Propagates const from NodePtrT to a derived node pointer
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

/**
 * CRTP visitor with static dispatch on NodeKind.
 *
 * Unhandled node kinds fall through to the category hook (visit_expr,
 * visit_type_node, visit_stmt, visit_decl) and then to visit_node.
 *
 * @code
 *   class CountCalls : public ConstAstVisitor<CountCalls> {
 *   public:
 *     void visit_call_expr(const CallExpr *) { ++calls; }
 *     int calls = 0;
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define CELERRATE_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                           \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR CELERRATE_VISIT_CASE
#define AST_NODE_TYPE CELERRATE_VISIT_CASE
#define AST_NODE_STMT CELERRATE_VISIT_CASE
#define AST_NODE_DECL CELERRATE_VISIT_CASE
#define AST_NODE_SUPPORT CELERRATE_VISIT_CASE
#define AST_NODE_TOP CELERRATE_VISIT_CASE
#include "celerrate/ast/ast_nodes.def"
#undef CELERRATE_VISIT_CASE
    }

    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "celerrate/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

}  // namespace celerrate
