// celerrate/basic/span_tracker.cpp
#include "celerrate/basic/span_tracker.hpp"

#include <algorithm>
#include <string>

#include "celerrate/basic/invariant_violation.hpp"

namespace celerrate
{

Span SpanTracker::make_span(uint32_t start_byte, uint32_t end_byte) const
{
  const size_t size = sm_.size();
  if (start_byte > end_byte || end_byte > size) {
    throw InvariantViolation(
      "span [" + std::to_string(start_byte) + ", " + std::to_string(end_byte) +
        ") is outside the source buffer of " + std::to_string(size) + " bytes",
      SourceRange(start_byte, end_byte));
  }

  Span s;
  s.start_byte = start_byte;
  s.end_byte = end_byte;
  s.start_line = sm_.get_line(start_byte);
  s.start_column = column_of(start_byte);
  if (end_byte == start_byte) {
    s.end_line = s.start_line;
    s.end_column = s.start_column;
  } else {
    s.end_line = sm_.get_line(end_byte);
    s.end_column = column_of(end_byte);
  }
  return s;
}

Span SpanTracker::cover(const Span & first, const Span & last) const
{
  return make_span(
    std::min(first.start_byte, last.start_byte), std::max(first.end_byte, last.end_byte));
}

uint32_t SpanTracker::column_of(uint32_t offset) const noexcept
{
  const std::string_view src = sm_.get_source();
  uint32_t i = offset;
  while (i > 0 && src[i - 1] != '\n') {
    --i;
  }
  return offset - i + 1;
}

}  // namespace celerrate
