// celerrate/syntax/MapType.cpp - CST -> AST for type declarations
#include <algorithm>
#include <cctype>
#include <string>

#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

namespace
{

std::string lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool is_builtin_type_name(std::string_view lowered)
{
  static constexpr std::string_view k_builtins[] = {
    "array", "callable", "iterable", "bool",  "float", "int",  "string", "void",
    "mixed", "static",   "object",   "false", "true",  "null", "never",
  };
  return std::find(std::begin(k_builtins), std::end(k_builtins), lowered) != std::end(k_builtins);
}

const NamedType * as_builtin(const TypeNode * type)
{
  const auto * named = dyn_cast<NamedType>(type);
  return named != nullptr && named->isBuiltin ? named : nullptr;
}

bool is_builtin_named(const TypeNode * type, std::string_view name)
{
  const NamedType * named = as_builtin(type);
  return named != nullptr && named->name == name;
}

}  // namespace

TypeNode * NodeMapper::map_type_kind(ts_ll::Node n, GrammarKind kind)
{
  if (n.is_missing()) {
    return make_unknown<UnknownType>(n, UnknownReason::MissingToken, "a type");
  }

  switch (kind) {
    case GrammarKind::NamedType:
    case GrammarKind::PrimitiveType:
    case GrammarKind::BottomType:
    case GrammarKind::Name:
    case GrammarKind::QualifiedName:
      return map_named_type(n);

    case GrammarKind::OptionalType: {
      const std::vector<ts_ll::Node> named = n.named_children();
      if (named.empty()) {
        return make_missing<UnknownType>(n, n.end_byte(), "inner type");
      }
      (void)check_construct(Construct::NullableTypes, n);
      return ast_.create<NullableType>(map_type(named.front()), span_of(n));
    }

    case GrammarKind::UnionType:
      return map_union_type(n);
    case GrammarKind::IntersectionType:
      return map_intersection_type(n);
    case GrammarKind::DnfType:
      return map_dnf_type(n);

    default:
      return make_unknown<UnknownType>(n, failure_reason(n), "a type");
  }
}

TypeNode * NodeMapper::map_named_type(ts_ll::Node n)
{
  const GrammarKind kind = classify_grammar_kind(n.kind());

  if (kind == GrammarKind::PrimitiveType || kind == GrammarKind::BottomType) {
    const std::string name = lower(text(n));
    return ast_.create<NamedType>(ast_.intern(name), true, span_of(n));
  }

  ts_ll::Node name_node = n;
  if (kind == GrammarKind::NamedType) {
    const std::vector<ts_ll::Node> named = n.named_children();
    if (!named.empty()) name_node = named.front();
  }

  NameKind name_kind = NameKind::Unqualified;
  const std::string_view name = qualified_text(name_node, name_kind);

  // Older grammar releases spell `mixed`, `object` and friends as named types.
  const std::string lowered = lower(name);
  if (name_kind == NameKind::Unqualified && is_builtin_type_name(lowered)) {
    return ast_.create<NamedType>(ast_.intern(lowered), true, span_of(n));
  }

  auto * type = ast_.create<NamedType>(name, false, span_of(n));
  type->nameKind = name_kind;
  return type;
}

TypeNode * NodeMapper::map_union_type(ts_ll::Node n)
{
  std::vector<TypeNode *> members;
  for (const ts_ll::Node & c : n.named_children()) {
    members.push_back(map_type(c));
  }

  if (members.empty()) {
    return make_missing<UnknownType>(n, n.start_byte(), "member types");
  }
  // Older grammars wrap every declared type in a union_type node.
  if (members.size() == 1) {
    return members.front();
  }

  (void)check_construct(Construct::UnionTypes, n);
  if (std::any_of(members.begin(), members.end(), [](const TypeNode * m) {
        return isa<IntersectionType>(m);
      })) {
    (void)check_construct(Construct::DnfTypes, n);
  }

  // `T|null` collapses onto `?T` when the dialect spells it that way.
  if (members.size() == 2) {
    const bool first_null = is_builtin_named(members[0], "null");
    const bool second_null = is_builtin_named(members[1], "null");
    if (
      first_null != second_null &&
      resolver_.resolve_ambiguity(Construct::NullableSpelling, options_.version) ==
        InterpretationChoice::NullableType) {
      TypeNode * inner = first_null ? members[1] : members[0];
      if (!isa<NullableType, IntersectionType, UnknownType>(inner)) {
        return ast_.create<NullableType>(inner, span_of(n));
      }
    }
  }

  auto * type = ast_.create<UnionType>(span_of(n));
  type->members = ast_.copy_to_arena(members);
  return type;
}

TypeNode * NodeMapper::map_intersection_type(ts_ll::Node n)
{
  std::vector<TypeNode *> members;
  for (const ts_ll::Node & c : n.named_children()) {
    members.push_back(map_type(c));
  }
  if (members.empty()) {
    return make_missing<UnknownType>(n, n.start_byte(), "member types");
  }
  if (members.size() == 1) {
    return members.front();
  }

  (void)check_construct(Construct::IntersectionTypes, n);
  auto * type = ast_.create<IntersectionType>(span_of(n));
  type->members = ast_.copy_to_arena(members);
  return type;
}

TypeNode * NodeMapper::map_dnf_type(ts_ll::Node n)
{
  (void)check_construct(Construct::DnfTypes, n);

  std::vector<TypeNode *> members;
  for (const ts_ll::Node & c : n.named_children()) {
    members.push_back(map_type(c));
  }
  if (members.empty()) {
    return make_missing<UnknownType>(n, n.start_byte(), "member types");
  }

  auto * type = ast_.create<UnionType>(span_of(n));
  type->members = ast_.copy_to_arena(members);
  return type;
}

void NodeMapper::check_type_gates(TypeNode * type, bool is_return_type)
{
  if (type == nullptr) return;

  // Standalone `null`, `false` and `true` only; inside a union they predate 8.2.
  if (
    is_builtin_named(type, "null") || is_builtin_named(type, "false") ||
    is_builtin_named(type, "true")) {
    (void)check_construct(Construct::StandaloneNullFalseTrueTypes, type->get_span());
  }

  std::vector<const TypeNode *> pending{type};
  while (!pending.empty()) {
    const TypeNode * t = pending.back();
    pending.pop_back();

    if (const auto * nullable = dyn_cast<NullableType>(t)) {
      pending.push_back(nullable->inner);
      continue;
    }
    if (const auto * u = dyn_cast<UnionType>(t)) {
      pending.insert(pending.end(), u->members.begin(), u->members.end());
      continue;
    }
    if (const auto * i = dyn_cast<IntersectionType>(t)) {
      pending.insert(pending.end(), i->members.begin(), i->members.end());
      continue;
    }

    const NamedType * builtin = as_builtin(t);
    if (builtin == nullptr) continue;

    const Span & at = builtin->get_span();
    if (builtin->name == "object") {
      (void)check_construct(Construct::ObjectType, at);
    } else if (builtin->name == "mixed") {
      (void)check_construct(Construct::MixedType, at);
    } else if (builtin->name == "never") {
      (void)check_construct(Construct::NeverType, at);
    } else if (builtin->name == "void" && is_return_type) {
      (void)check_construct(Construct::VoidReturnType, at);
    } else if (builtin->name == "static" && is_return_type) {
      (void)check_construct(Construct::StaticReturnType, at);
    }
  }
}

TypeNode * NodeMapper::map_return_type(ts_ll::Node type_node)
{
  if (type_node.is_null()) {
    return nullptr;
  }
  TypeNode * type = map_type(type_node);
  check_type_gates(type, true);
  return type;
}

ts_ll::Node NodeMapper::return_type_node(ts_ll::Node n, ts_ll::Node params)
{
  const ts_ll::Node by_field = n.child_by_field("return_type");
  if (!by_field.is_null() || params.is_null()) {
    return by_field;
  }
  for (const ts_ll::Node & c : n.named_children()) {
    if (c.start_byte() < params.end_byte()) continue;
    if (is_type_kind(classify_grammar_kind(c.kind()))) {
      return c;
    }
  }
  return ts_ll::Node();
}

}  // namespace celerrate
