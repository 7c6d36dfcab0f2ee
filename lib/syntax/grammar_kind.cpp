// celerrate/syntax/grammar_kind.cpp
#include "celerrate/syntax/grammar_kind.hpp"

#include <unordered_map>

namespace celerrate
{

namespace
{

const std::unordered_map<std::string_view, GrammarKind> & kind_table()
{
  static const std::unordered_map<std::string_view, GrammarKind> table = {
#define GRAMMAR_KIND(Enum, Name) {Name, GrammarKind::Enum},
#define GRAMMAR_ALIAS(Enum, Name) {Name, GrammarKind::Enum},
#include "celerrate/syntax/grammar_kinds.def"
  };
  return table;
}

}  // namespace

GrammarKind classify_grammar_kind(std::string_view node_type)
{
  const auto & table = kind_table();
  auto it = table.find(node_type);
  return it == table.end() ? GrammarKind::Unknown : it->second;
}

std::string_view to_string(GrammarKind kind) noexcept
{
  switch (kind) {
    case GrammarKind::Unknown:
      return "";
#define GRAMMAR_KIND(Enum, Name) \
  case GrammarKind::Enum:        \
    return Name;
#include "celerrate/syntax/grammar_kinds.def"
  }
  return "";
}

}  // namespace celerrate
