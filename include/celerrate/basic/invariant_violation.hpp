// celerrate/basic/invariant_violation.hpp - Fatal internal error
#pragma once

#include <stdexcept>
#include <string>

#include "celerrate/basic/source_manager.hpp"

namespace celerrate
{

/**
 * Thrown when the mapper or span tracker detects that one of its own
 * structural guarantees does not hold.
 *
 * Malformed input never raises this; it is reported through the
 * DiagnosticBag instead. An InvariantViolation means the tree-sitter
 * grammar and the mapper disagree, or a span computation went wrong.
 */
class InvariantViolation : public std::logic_error
{
public:
  explicit InvariantViolation(const std::string & what, SourceRange range = {})
  : std::logic_error(what), range_(range)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  SourceRange range_;
};

}  // namespace celerrate
