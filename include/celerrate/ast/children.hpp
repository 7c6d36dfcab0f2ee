// celerrate/ast/children.hpp - Ordered child lists
#pragma once

#include <vector>

#include "celerrate/ast/ast.hpp"

namespace celerrate
{

/**
 * Direct children of a node in source order, absent optional children
 * omitted.
 *
 * A promoted property is a child of its ParamDecl; the type it shares with
 * the parameter is reported only under the parameter. A ClassDecl's
 * promotedProperties are not repeated here.
 */
[[nodiscard]] std::vector<const AstNode *> children_of(const AstNode * node);

}  // namespace celerrate
