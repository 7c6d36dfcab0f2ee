// celerrate/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "celerrate/syntax/ts_ll.hpp"

#include "celerrate/basic/invariant_violation.hpp"

namespace celerrate::ts_ll
{

std::vector<Node> Node::named_children() const
{
  std::vector<Node> out;
  const uint32_t n = named_child_count();
  out.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    const Node c = named_child(i);
    if (!c.is_extra()) {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<Node> Node::children_by_field(std::string_view field) const
{
  std::vector<Node> out;
  Cursor cursor(*this);
  if (!cursor.goto_first_child()) {
    return out;
  }
  do {
    if (cursor.current_field_name() == field) {
      out.push_back(cursor.current_node());
    }
  } while (cursor.goto_next_sibling());
  return out;
}

Node Node::first_child_of_kind(std::string_view kind) const
{
  const uint32_t n = named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const Node c = named_child(i);
    if (!c.is_extra() && c.kind() == kind) {
      return c;
    }
  }
  return Node();
}

bool Node::has_token(std::string_view token) const
{
  const uint32_t n = child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const Node c = child(i);
    if (!c.is_named() && !c.is_missing() && c.kind() == token) {
      return true;
    }
  }
  return false;
}

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw InvariantViolation("ts_parser_new() failed");
  }

  // Checked in every build type: a grammar built against an incompatible
  // tree-sitter ABI is rejected here.
  if (!ts_parser_set_language(parser_, tree_sitter_php())) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw InvariantViolation("tree-sitter-php grammar is incompatible with the tree-sitter runtime");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse_string(std::string_view source, const Tree * old_tree) const
{
  // Tree-sitter consumes bytes; the grammar expects UTF-8.
  TSTree * tree = ts_parser_parse_string(
    parser_, old_tree != nullptr ? old_tree->raw() : nullptr, source.data(),
    static_cast<uint32_t>(source.size()));
  if (tree == nullptr) {
    throw InvariantViolation("tree-sitter returned no tree");
  }
  return Tree(tree);
}

}  // namespace celerrate::ts_ll
