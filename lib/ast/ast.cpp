// celerrate/ast/ast.cpp - Out-of-line node helpers
#include "celerrate/ast/ast.hpp"

#include <cctype>

namespace celerrate
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "celerrate/ast/ast_nodes.def"
  }
  return "";
}

std::vector<const PropertyDecl *> ClassDecl::properties() const
{
  std::vector<const PropertyDecl *> result;
  for (const Decl * member : members) {
    if (const auto * prop = dyn_cast<PropertyDecl>(member)) {
      result.push_back(prop);
    }
  }
  for (const PropertyDecl * prop : promotedProperties) {
    result.push_back(prop);
  }
  return result;
}

bool MethodDecl::is_constructor() const noexcept
{
  constexpr std::string_view k_ctor = "__construct";
  if (name.size() != k_ctor.size()) {
    return false;
  }
  for (size_t i = 0; i < name.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(name[i])) != k_ctor[i]) {
      return false;
    }
  }
  return true;
}

std::string_view PropertyDecl::name() const noexcept
{
  return items.empty() ? std::string_view{} : items[0]->name;
}

const Expr * PropertyDecl::default_value() const noexcept
{
  return items.empty() ? nullptr : items[0]->defaultValue;
}

std::optional<UnknownReason> unknown_reason(const AstNode * node) noexcept
{
  if (node == nullptr) {
    return std::nullopt;
  }
  switch (node->get_kind()) {
    case NodeKind::UnknownExpr:
      return static_cast<const UnknownExpr *>(node)->reason;
    case NodeKind::UnknownType:
      return static_cast<const UnknownType *>(node)->reason;
    case NodeKind::UnknownStmt:
      return static_cast<const UnknownStmt *>(node)->reason;
    case NodeKind::UnknownDecl:
      return static_cast<const UnknownDecl *>(node)->reason;
    default:
      return std::nullopt;
  }
}

}  // namespace celerrate
