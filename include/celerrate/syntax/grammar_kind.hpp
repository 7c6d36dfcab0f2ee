// celerrate/syntax/grammar_kind.hpp - Closed enumeration of concrete node kinds
#pragma once

#include <cstdint>
#include <string_view>

namespace celerrate
{

enum class GrammarKind : uint16_t {
  Unknown,
#define GRAMMAR_KIND(Enum, Name) Enum,
#include "celerrate/syntax/grammar_kinds.def"
};

/// Kind for a tree-sitter node type name; Unknown for anything unlisted.
[[nodiscard]] GrammarKind classify_grammar_kind(std::string_view node_type);

/// Canonical node type name; "" for Unknown.
[[nodiscard]] std::string_view to_string(GrammarKind kind) noexcept;

}  // namespace celerrate
