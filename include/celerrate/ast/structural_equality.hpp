// celerrate/ast/structural_equality.hpp - Span-insensitive tree comparison
#pragma once

#include "celerrate/ast/ast.hpp"

namespace celerrate
{

/**
 * Two subtrees are equal when their kinds, their own fields and their
 * children (see children_of) are recursively equal.
 *
 * Spans never take part, so trees that differ only in formatting compare
 * equal. The quoting style of string literals is ignored as well: `"abc"`
 * and `'abc'` denote the same value. Two null pointers are equal.
 */
[[nodiscard]] bool structurally_equal(const AstNode * lhs, const AstNode * rhs);

/// Compares only the node-local fields of two nodes of the same kind.
[[nodiscard]] bool fields_equal(const AstNode * lhs, const AstNode * rhs);

}  // namespace celerrate
