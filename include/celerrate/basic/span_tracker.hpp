// celerrate/basic/span_tracker.hpp - Byte ranges to human-readable spans
#pragma once

#include <cstdint>

#include "celerrate/basic/source_manager.hpp"

namespace celerrate
{

/**
 * Location of an AST node or diagnostic in the original source.
 *
 * Byte offsets are half-open and authoritative. Lines are 1-indexed,
 * columns are 1-indexed byte columns. For a zero-width span start equals
 * end in every coordinate.
 */
struct Span
{
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return start_line > 0; }
  [[nodiscard]] constexpr bool is_empty() const noexcept { return start_byte == end_byte; }
  [[nodiscard]] constexpr uint32_t size() const noexcept { return end_byte - start_byte; }

  [[nodiscard]] constexpr SourceRange to_source_range() const noexcept
  {
    return {start_byte, end_byte};
  }

  [[nodiscard]] constexpr bool contains(const Span & other) const noexcept
  {
    return start_byte <= other.start_byte && other.end_byte <= end_byte;
  }

  [[nodiscard]] constexpr bool operator==(const Span & other) const noexcept
  {
    return start_byte == other.start_byte && end_byte == other.end_byte;
  }
  [[nodiscard]] constexpr bool operator!=(const Span & other) const noexcept
  {
    return !(*this == other);
  }
};

/**
 * Computes spans against one source buffer.
 *
 * Stateless apart from the borrowed SourceManager. Lines come from the
 * manager's line table; the column is found by scanning back to the
 * previous '\n'. Neither step allocates.
 */
class SpanTracker
{
public:
  explicit SpanTracker(const SourceManager & sm) noexcept : sm_(sm) {}

  /// Throws InvariantViolation if start > end or end exceeds the buffer.
  [[nodiscard]] Span make_span(uint32_t start_byte, uint32_t end_byte) const;

  [[nodiscard]] Span make_span(SourceRange range) const
  {
    return make_span(range.get_begin().get_offset(), range.get_end().get_offset());
  }

  /// Zero-width span at a single offset
  [[nodiscard]] Span make_point(uint32_t offset) const { return make_span(offset, offset); }

  /// Smallest span covering both arguments
  [[nodiscard]] Span cover(const Span & first, const Span & last) const;

  [[nodiscard]] const SourceManager & source() const noexcept { return sm_; }

private:
  [[nodiscard]] uint32_t column_of(uint32_t offset) const noexcept;

  const SourceManager & sm_;
};

}  // namespace celerrate
