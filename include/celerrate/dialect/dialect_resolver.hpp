// celerrate/dialect/dialect_resolver.hpp - Version gating and ambiguity rules
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "celerrate/dialect/php_version.hpp"

namespace celerrate
{

enum class Construct : uint8_t {
#define CONSTRUCT(Id, Name, Min, Removed, Desc) Id,
#include "celerrate/dialect/constructs.def"
};

/// Snake-case identifier, e.g. "readonly_property"
[[nodiscard]] std::string_view to_string(Construct c) noexcept;

/// Human-readable description used in diagnostics
[[nodiscard]] std::string_view describe(Construct c) noexcept;

[[nodiscard]] std::optional<Construct> find_construct(std::string_view name) noexcept;

/// How the mapper should shape an ambiguous construct.
enum class InterpretationChoice : uint8_t {
  AsWritten,        // no ambiguity rule applies
  Block,            // alternative or unbraced bodies become a BlockStmt
  FlatElseIf,       // `else if` joins the ElseIfClause chain
  NestedIf,         // `else if` stays an IfStmt inside the else block
  ArrayLiteral,     // array() and [] become ArrayLiteralExpr
  ListDestructure,  // list() and [] targets become ListExpr
  CanonicalCast,    // cast spellings collapse onto CastKind
  NullableType,     // T|null becomes NullableType
  UnionType,        // T|null stays a two-member UnionType
  LeftAssociative,  // a ? b : c ? d : e groups as (a ? b : c) ? d : e
  Reject,           // no valid interpretation in the active dialect
};

[[nodiscard]] std::string_view to_string(InterpretationChoice c) noexcept;

enum class ConstructStatus : uint8_t {
  Enabled,
  NotYetAvailable,
  Removed,
};

struct InterpretationCandidate
{
  InterpretationChoice choice;
  PhpVersion min_version;
  std::optional<PhpVersion> removed_in;
};

/**
 * Decides which constructs are legal for a PHP version and how ambiguous
 * constructs are interpreted.
 *
 * Backed by static immutable tables, so a single instance can be shared
 * across threads without synchronization.
 *
 * When several candidates of an ambiguous construct are valid at once,
 * the first one in its preference list wins. Lists are ordered oldest
 * spelling first.
 */
class DialectResolver
{
public:
  [[nodiscard]] static const DialectResolver & standard() noexcept;

  [[nodiscard]] bool is_construct_enabled(Construct c, PhpVersion v) const noexcept;
  [[nodiscard]] ConstructStatus status(Construct c, PhpVersion v) const noexcept;
  [[nodiscard]] InterpretationChoice resolve_ambiguity(Construct c, PhpVersion v) const noexcept;

  [[nodiscard]] PhpVersion min_version(Construct c) const noexcept;
  [[nodiscard]] std::optional<PhpVersion> removed_in(Construct c) const noexcept;

  /// Preference list for an ambiguous construct; empty for plain gates.
  [[nodiscard]] gsl::span<const InterpretationCandidate> candidates(Construct c) const noexcept;
};

}  // namespace celerrate
