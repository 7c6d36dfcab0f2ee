// celerrate/syntax/incremental_session.hpp - Reparse and remap after text edits
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "celerrate/syntax/frontend.hpp"
#include "celerrate/syntax/mapping_options.hpp"
#include "celerrate/syntax/ts_ll.hpp"

namespace celerrate
{

/// Replace bytes [start_byte, old_end_byte) of the current source with new_text.
struct TextEdit
{
  uint32_t start_byte = 0;
  uint32_t old_end_byte = 0;
  std::string new_text;
};

/**
 * Keeps the last tree-sitter tree of one document so that an edit only
 * reparses what changed.
 *
 * Every call returns a fresh MappingResult with its own arena; results
 * returned earlier stay valid after later edits.
 */
class IncrementalSession
{
public:
  explicit IncrementalSession(MappingOptions options = {}) : options_(options) {}

  IncrementalSession(const IncrementalSession &) = delete;
  IncrementalSession & operator=(const IncrementalSession &) = delete;

  /// Full parse of a new document text; drops the previous tree.
  [[nodiscard]] std::unique_ptr<MappingResult> open(std::string source);

  /// Throws std::out_of_range when the edit range is not inside the current source.
  [[nodiscard]] std::unique_ptr<MappingResult> apply(const TextEdit & edit);

  [[nodiscard]] std::string_view source() const noexcept { return source_; }
  [[nodiscard]] const MappingOptions & options() const noexcept { return options_; }

private:
  ts_ll::Parser parser_;
  ts_ll::Tree tree_;
  std::string source_;
  MappingOptions options_;
};

}  // namespace celerrate
