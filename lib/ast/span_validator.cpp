// celerrate/ast/span_validator.cpp
#include "celerrate/ast/span_validator.hpp"

#include <fmt/format.h>

#include "celerrate/ast/children.hpp"
#include "celerrate/ast/traversal.hpp"
#include "celerrate/basic/invariant_violation.hpp"

namespace celerrate
{

std::optional<SpanViolation> find_span_violation(const AstNode * root)
{
  for (const auto & entry : preorder(root)) {
    const Span & outer = entry.node->get_span();
    const AstNode * previous = nullptr;

    for (const AstNode * child : children_of(entry.node)) {
      const Span & inner = child->get_span();
      if (!outer.contains(inner)) {
        return SpanViolation{
          entry.node, child,
          fmt::format(
            "{} [{}, {}) is not inside its parent {} [{}, {})", to_string(child->get_kind()),
            inner.start_byte, inner.end_byte, to_string(entry.node->get_kind()), outer.start_byte,
            outer.end_byte)};
      }
      if (previous != nullptr && inner.start_byte < previous->get_span().end_byte) {
        return SpanViolation{
          entry.node, child,
          fmt::format(
            "{} at {} overlaps or precedes its sibling {} ending at {}",
            to_string(child->get_kind()), inner.start_byte, to_string(previous->get_kind()),
            previous->get_span().end_byte)};
      }
      previous = child;
    }
  }
  return std::nullopt;
}

void validate_spans(const AstNode * root)
{
  if (auto violation = find_span_violation(root)) {
    throw InvariantViolation(violation->message, violation->node->get_range());
  }
}

}  // namespace celerrate
