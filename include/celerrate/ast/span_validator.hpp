// celerrate/ast/span_validator.hpp - Span containment and ordering checks
#pragma once

#include <optional>
#include <string>

#include "celerrate/ast/ast.hpp"

namespace celerrate
{

struct SpanViolation
{
  const AstNode * parent = nullptr;
  const AstNode * node = nullptr;
  std::string message;
};

/**
 * Finds the first node whose span escapes its parent's span, or that starts
 * before the end of its previous sibling.
 *
 * Zero-width spans may touch a neighbour on either side.
 */
[[nodiscard]] std::optional<SpanViolation> find_span_violation(const AstNode * root);

/// Throws InvariantViolation carrying the offending node's range.
void validate_spans(const AstNode * root);

}  // namespace celerrate
