// celerrate/basic/casting.hpp - classof-based casting for AST nodes
//
//   if (isa<PropertyDecl>(member)) { ... }
//   if (isa<ClosureExpr, ArrowFunctionExpr>(e)) { ... }
//   auto * method = cast<MethodDecl>(member);   // asserts on mismatch
//   if (auto * call = dyn_cast<CallExpr>(e)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace celerrate
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when node is non-null and matches any of the listed types.
template <typename... Ts, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(sizeof...(Ts) > 0, "isa<> needs at least one target type");
  static_assert(
    (detail::HasClassof<Ts, From>::value && ...), "Target type must have a classof() method");
  return node != nullptr && (Ts::classof(node) || ...);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(static_cast<const From *>(node)) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * cast_or_null(From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast_or_null(const From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

}  // namespace celerrate
