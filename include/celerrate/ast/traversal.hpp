// celerrate/ast/traversal.hpp - Read-only pre-order traversal with parent links
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <unordered_map>
#include <vector>

#include "celerrate/ast/ast.hpp"

namespace celerrate
{

/// One visited node together with its parent (null for the root) and depth.
struct TraversalEntry
{
  const AstNode * node = nullptr;
  const AstNode * parent = nullptr;
  uint32_t depth = 0;
};

/**
 * Lazy depth-first pre-order iterator.
 *
 * Children are expanded only when the iterator advances past their parent,
 * so the walk can stop early without touching the rest of the tree. An
 * explicit stack keeps deep trees off the call stack.
 */
class PreorderIterator
{
public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = TraversalEntry;
  using difference_type = std::ptrdiff_t;
  using pointer = const TraversalEntry *;
  using reference = const TraversalEntry &;

  PreorderIterator() = default;
  explicit PreorderIterator(const AstNode * root);

  reference operator*() const { return stack_.back(); }
  pointer operator->() const { return &stack_.back(); }

  PreorderIterator & operator++();
  PreorderIterator operator++(int)
  {
    PreorderIterator tmp = *this;
    ++*this;
    return tmp;
  }

  /// Do not descend into the children of the current node on the next advance.
  void skip_children() noexcept { skipChildren_ = true; }

  friend bool operator==(const PreorderIterator & a, const PreorderIterator & b)
  {
    if (a.stack_.empty() || b.stack_.empty()) {
      return a.stack_.empty() == b.stack_.empty();
    }
    return a.stack_.back().node == b.stack_.back().node && a.stack_.size() == b.stack_.size();
  }
  friend bool operator!=(const PreorderIterator & a, const PreorderIterator & b)
  {
    return !(a == b);
  }

private:
  // Top of the stack is the current entry; pending siblings sit below it.
  std::vector<TraversalEntry> stack_;
  bool skipChildren_ = false;
};

/**
 * Restartable pre-order view over a subtree.
 *
 * @code
 *   for (const auto & entry : preorder(program)) {
 *     if (isa<ClassDecl>(entry.node)) { ... }
 *   }
 * @endcode
 */
class PreorderRange
{
public:
  explicit PreorderRange(const AstNode * root) noexcept : root_(root) {}

  [[nodiscard]] PreorderIterator begin() const { return PreorderIterator(root_); }
  [[nodiscard]] PreorderIterator end() const { return PreorderIterator(); }

private:
  const AstNode * root_;
};

[[nodiscard]] inline PreorderRange preorder(const AstNode * root) noexcept
{
  return PreorderRange(root);
}

/// Pre-order list of every node in the subtree, root first.
[[nodiscard]] std::vector<const AstNode *> collect_preorder(const AstNode * root);

/**
 * Parent links for upward walks, built once from a root.
 */
class ParentMap
{
public:
  explicit ParentMap(const AstNode * root);

  /// Null for the root and for nodes outside the tree.
  [[nodiscard]] const AstNode * parent_of(const AstNode * node) const;

  /// Parents from the immediate one up to the root.
  [[nodiscard]] std::vector<const AstNode *> ancestors_of(const AstNode * node) const;

  /// Nearest ancestor of type T, or null.
  template <typename T>
  [[nodiscard]] const T * enclosing(const AstNode * node) const
  {
    for (const AstNode * p = parent_of(node); p != nullptr; p = parent_of(p)) {
      if (const auto * match = dyn_cast<T>(p)) {
        return match;
      }
    }
    return nullptr;
  }

  [[nodiscard]] size_t size() const noexcept { return parents_.size(); }

private:
  std::unordered_map<const AstNode *, const AstNode *> parents_;
};

}  // namespace celerrate
