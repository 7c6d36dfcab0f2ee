// celerrate/syntax/incremental_session.cpp
#include "celerrate/syntax/incremental_session.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace celerrate
{

namespace
{

// Tree-sitter points are 0-indexed rows and byte columns.
TSPoint point_at(std::string_view text, uint32_t offset)
{
  TSPoint p{0, 0};
  for (uint32_t i = 0; i < offset && i < text.size(); ++i) {
    if (text[i] == '\n') {
      ++p.row;
      p.column = 0;
    } else {
      ++p.column;
    }
  }
  return p;
}

}  // namespace

std::unique_ptr<MappingResult> IncrementalSession::open(std::string source)
{
  source_ = std::move(source);
  tree_ = parser_.parse_string(source_);
  return map_tree(source_, tree_, options_);
}

std::unique_ptr<MappingResult> IncrementalSession::apply(const TextEdit & edit)
{
  if (edit.start_byte > edit.old_end_byte || edit.old_end_byte > source_.size()) {
    throw std::out_of_range(fmt::format(
      "edit [{}, {}) is outside the {}-byte document", edit.start_byte, edit.old_end_byte,
      source_.size()));
  }

  std::string updated = source_;
  updated.replace(edit.start_byte, edit.old_end_byte - edit.start_byte, edit.new_text);

  const auto new_end_byte = static_cast<uint32_t>(edit.start_byte + edit.new_text.size());

  TSInputEdit input{};
  input.start_byte = edit.start_byte;
  input.old_end_byte = edit.old_end_byte;
  input.new_end_byte = new_end_byte;
  input.start_point = point_at(source_, edit.start_byte);
  input.old_end_point = point_at(source_, edit.old_end_byte);
  input.new_end_point = point_at(updated, new_end_byte);

  tree_.edit(input);
  ts_ll::Tree reparsed = parser_.parse_string(updated, tree_.is_null() ? nullptr : &tree_);

  tree_ = std::move(reparsed);
  source_ = std::move(updated);
  return map_tree(source_, tree_, options_);
}

}  // namespace celerrate
