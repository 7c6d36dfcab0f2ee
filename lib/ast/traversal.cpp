// celerrate/ast/traversal.cpp
#include "celerrate/ast/traversal.hpp"

#include "celerrate/ast/children.hpp"

namespace celerrate
{

PreorderIterator::PreorderIterator(const AstNode * root)
{
  if (root != nullptr) {
    stack_.push_back({root, nullptr, 0});
  }
}

PreorderIterator & PreorderIterator::operator++()
{
  if (stack_.empty()) {
    return *this;
  }

  const TraversalEntry current = stack_.back();
  stack_.pop_back();

  if (!skipChildren_) {
    const auto children = children_of(current.node);
    // Reverse push so the first child ends up on top.
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack_.push_back({*it, current.node, current.depth + 1});
    }
  }
  skipChildren_ = false;
  return *this;
}

std::vector<const AstNode *> collect_preorder(const AstNode * root)
{
  std::vector<const AstNode *> out;
  for (const auto & entry : preorder(root)) {
    out.push_back(entry.node);
  }
  return out;
}

ParentMap::ParentMap(const AstNode * root)
{
  for (const auto & entry : preorder(root)) {
    parents_.emplace(entry.node, entry.parent);
  }
}

const AstNode * ParentMap::parent_of(const AstNode * node) const
{
  auto it = parents_.find(node);
  return it == parents_.end() ? nullptr : it->second;
}

std::vector<const AstNode *> ParentMap::ancestors_of(const AstNode * node) const
{
  std::vector<const AstNode *> out;
  for (const AstNode * p = parent_of(node); p != nullptr; p = parent_of(p)) {
    out.push_back(p);
  }
  return out;
}

}  // namespace celerrate
