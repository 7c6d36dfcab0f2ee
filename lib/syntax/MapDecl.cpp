// celerrate/syntax/MapDecl.cpp - CST -> AST for declarations
#include <algorithm>
#include <cctype>
#include <string>

#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

namespace
{

std::string_view strip_dollar(std::string_view s)
{
  if (!s.empty() && s.front() == '$') s.remove_prefix(1);
  return s;
}

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::optional<Visibility> parse_visibility(std::string_view s)
{
  if (iequals(s, "public")) return Visibility::Public;
  if (iequals(s, "protected")) return Visibility::Protected;
  if (iequals(s, "private")) return Visibility::Private;
  return std::nullopt;
}

}  // namespace

Decl * NodeMapper::map_decl_kind(ts_ll::Node n, GrammarKind kind)
{
  switch (kind) {
    case GrammarKind::FunctionDefinition:
      return map_function(n);
    case GrammarKind::ClassDeclaration:
      return map_class(n);
    case GrammarKind::InterfaceDeclaration:
      return map_interface(n);
    case GrammarKind::TraitDeclaration:
      return map_trait(n);
    case GrammarKind::EnumDeclaration:
      return map_enum(n);
    case GrammarKind::ConstDeclaration:
      return map_const_declaration(n, false);
    default:
      return make_unknown<UnknownDecl>(n, failure_reason(n), "a declaration");
  }
}

// ============================================================================
// Modifiers and attributes
// ============================================================================

NodeMapper::Modifiers NodeMapper::collect_modifiers(ts_ll::Node decl_node)
{
  Modifiers mods;
  for (const ts_ll::Node & c : decl_node.named_children()) {
    const GrammarKind kind = classify_grammar_kind(c.kind());
    if (!is_modifier_kind(kind)) continue;

    if (mods.first.is_null()) mods.first = c;

    switch (kind) {
      case GrammarKind::VisibilityModifier: {
        // `private(set)` carries the write visibility of an asymmetric property.
        std::string_view t = text(c);
        const size_t paren = t.find('(');
        if (paren != std::string_view::npos) {
          t = t.substr(0, paren);
          while (!t.empty() && std::isspace(static_cast<unsigned char>(t.back()))) t.remove_suffix(1);
          mods.setVisibility = parse_visibility(t);
          mods.setVisibilityNode = c;
        } else {
          mods.visibility = parse_visibility(t);
          mods.visibilityNode = c;
        }
        break;
      }
      case GrammarKind::StaticModifier:
        mods.isStatic = true;
        break;
      case GrammarKind::AbstractModifier:
        mods.isAbstract = true;
        break;
      case GrammarKind::FinalModifier:
        mods.isFinal = true;
        break;
      case GrammarKind::ReadonlyModifier:
        mods.isReadonly = true;
        mods.readonlyNode = c;
        break;
      case GrammarKind::VarModifier:
        mods.isVar = true;
        break;
      default:
        break;
    }
  }
  return mods;
}

void NodeMapper::apply_property_modifiers(const Modifiers & mods, PropertyDecl * prop)
{
  prop->visibility = mods.visibility.value_or(Visibility::Public);
  prop->hasExplicitVisibility = mods.visibility.has_value();
  prop->isStatic = mods.isStatic;

  if (mods.isReadonly) {
    prop->isReadonly = check_construct(Construct::ReadonlyProperty, mods.readonlyNode);
  }
  if (mods.setVisibility && check_construct(Construct::AsymmetricVisibility, mods.setVisibilityNode)) {
    prop->setVisibility = mods.setVisibility;
  }
}

std::vector<Attribute *> NodeMapper::map_attributes(ts_ll::Node decl_node)
{
  std::vector<Attribute *> out;
  const ts_ll::Node list = field_or_kind(decl_node, "attributes", GrammarKind::AttributeList);
  if (list.is_null()) {
    return out;
  }

  (void)check_construct(Construct::Attributes, list);

  for (const ts_ll::Node & group : list.named_children()) {
    if (classify_grammar_kind(group.kind()) != GrammarKind::AttributeGroup) continue;

    for (const ts_ll::Node & attr : group.named_children()) {
      if (classify_grammar_kind(attr.kind()) != GrammarKind::Attribute) continue;

      ts_ll::Node name;
      ts_ll::Node args = attr.child_by_field("parameters");
      for (const ts_ll::Node & c : attr.named_children()) {
        const GrammarKind k = classify_grammar_kind(c.kind());
        if (name.is_null() && (k == GrammarKind::Name || k == GrammarKind::QualifiedName)) {
          name = c;
        } else if (args.is_null() && k == GrammarKind::Arguments) {
          args = c;
        }
      }

      std::string_view name_text = name.is_null() ? std::string_view{} : text(name);
      if (!name_text.empty() && name_text.front() == '\\') name_text.remove_prefix(1);

      auto * attribute = ast_.create<Attribute>(ast_.intern(name_text), span_of(attr));
      if (!args.is_null()) {
        bool first_class_callable = false;
        attribute->args = ast_.copy_to_arena(map_arguments(args, first_class_callable));
      }
      out.push_back(attribute);
    }
  }
  return out;
}

std::vector<NameExpr *> NodeMapper::map_name_list(ts_ll::Node clause_node)
{
  std::vector<NameExpr *> out;
  if (clause_node.is_null()) return out;

  for (const ts_ll::Node & c : clause_node.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (
      k == GrammarKind::Name || k == GrammarKind::QualifiedName ||
      k == GrammarKind::NamespaceName || k == GrammarKind::NamedType) {
      out.push_back(map_name(c));
    }
  }
  return out;
}

Expr * NodeMapper::map_initializer(ts_ll::Node value_node)
{
  Expr * value = map_expr(value_node);
  if (isa<NewExpr>(value)) {
    (void)check_construct(Construct::NewInInitializer, value->get_span());
  }
  return value;
}

// ============================================================================
// Functions and parameters
// ============================================================================

FunctionDecl * NodeMapper::map_function(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * fn =
    ast_.create<FunctionDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  fn->attributes = ast_.copy_to_arena(map_attributes(n));
  fn->byRefReturn = has_reference_modifier(n);

  EnclosingScope scope(*this, EnclosingKind::Function);
  const ts_ll::Node params = field_or_kind(n, "parameters", GrammarKind::FormalParameters);
  fn->params = ast_.copy_to_arena(map_params(params));
  fn->returnType = map_return_type(return_type_node(n, params));
  fn->body = map_body(field_or_kind(n, "body", GrammarKind::CompoundStatement), n);
  return fn;
}

std::vector<ParamDecl *> NodeMapper::map_params(ts_ll::Node formal_parameters_node)
{
  std::vector<ParamDecl *> out;
  if (formal_parameters_node.is_null()) return out;

  for (const ts_ll::Node & c : formal_parameters_node.named_children()) {
    switch (classify_grammar_kind(c.kind())) {
      case GrammarKind::SimpleParameter:
      case GrammarKind::VariadicParameter:
      case GrammarKind::PropertyPromotionParameter:
        out.push_back(map_param(c));
        break;
      default:
        break;
    }
  }
  return out;
}

ParamDecl * NodeMapper::map_param(ts_ll::Node n)
{
  const GrammarKind kind = classify_grammar_kind(n.kind());

  ts_ll::Node name = field_or_kind(n, "name", GrammarKind::VariableName);
  bool by_ref = has_reference_modifier(n);
  if (!name.is_null() && classify_grammar_kind(name.kind()) == GrammarKind::ByRef) {
    by_ref = true;
    name = name.first_child_of_kind("variable_name");
  }

  auto * param = ast_.create<ParamDecl>(
    name.is_null() ? std::string_view{} : ast_.intern(strip_dollar(text(name))), span_of(n));
  param->attributes = ast_.copy_to_arena(map_attributes(n));
  param->byRef = by_ref;
  param->isVariadic = kind == GrammarKind::VariadicParameter || n.has_token("...");

  ts_ll::Node type = n.child_by_field("type");
  ts_ll::Node def = n.child_by_field("default_value");
  if (type.is_null() || def.is_null()) {
    for (const ts_ll::Node & c : n.named_children()) {
      if (type.is_null() && is_type_kind(classify_grammar_kind(c.kind()))) {
        type = c;
      } else if (def.is_null() && !name.is_null() && c.start_byte() >= name.end_byte()) {
        def = c;
      }
    }
  }

  if (!type.is_null()) {
    param->type = map_type(type);
    check_type_gates(param->type, false);
  }
  if (!def.is_null()) {
    param->defaultValue = map_initializer(def);
  }

  if (kind == GrammarKind::PropertyPromotionParameter) {
    param->promotedProperty = promote_param(n, param, collect_modifiers(n));
  }
  return param;
}

PropertyDecl * NodeMapper::promote_param(ts_ll::Node n, ParamDecl * param, const Modifiers & mods)
{
  const ts_ll::Node anchor = mods.first.is_null() ? n : mods.first;

  if (enclosing() != EnclosingKind::Constructor || promotedSink_ == nullptr) {
    report_invalid_modifier(
      anchor, "promoted properties are only allowed in a non-abstract class or trait constructor");
    return nullptr;
  }
  if (param->isVariadic) {
    report_invalid_modifier(anchor, "a variadic parameter cannot be promoted");
    return nullptr;
  }
  if (!check_construct(Construct::ConstructorPromotion, anchor)) {
    return nullptr;
  }

  param->promotedVisibility = mods.visibility.value_or(Visibility::Public);
  if (mods.isReadonly) {
    param->isReadonly = check_construct(Construct::ReadonlyProperty, mods.readonlyNode);
  }

  // Zero-width at the first modifier: the property has no source text of its own.
  const Span at = tracker_.make_point(anchor.start_byte());
  auto * prop = ast_.create<PropertyDecl>(at);
  prop->isPromoted = true;
  prop->promotedFrom = param;
  prop->visibility = *param->promotedVisibility;
  prop->hasExplicitVisibility = mods.visibility.has_value();
  prop->isReadonly = param->isReadonly;
  prop->type = param->type;
  if (mods.setVisibility && check_construct(Construct::AsymmetricVisibility, mods.setVisibilityNode)) {
    prop->setVisibility = mods.setVisibility;
  }

  std::vector<PropertyItem *> items{ast_.create<PropertyItem>(param->name, nullptr, at)};
  prop->items = ast_.copy_to_arena(items);

  promotedSink_->push_back(prop);
  return prop;
}

// ============================================================================
// Class-likes
// ============================================================================

void NodeMapper::map_class_header(ts_ll::Node n, ClassDecl * decl)
{
  for (const ts_ll::Node & c : n.named_children()) {
    switch (classify_grammar_kind(c.kind())) {
      case GrammarKind::BaseClause: {
        const std::vector<NameExpr *> bases = map_name_list(c);
        if (!bases.empty()) decl->extends = bases.front();
        break;
      }
      case GrammarKind::ClassInterfaceClause:
        decl->implements = ast_.copy_to_arena(map_name_list(c));
        break;
      default:
        break;
    }
  }
}

ClassDecl * NodeMapper::map_class(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * decl =
    ast_.create<ClassDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  const Modifiers mods = collect_modifiers(n);
  decl->isAbstract = mods.isAbstract;
  decl->isFinal = mods.isFinal;
  if (mods.isReadonly) {
    decl->isReadonly = check_construct(Construct::ReadonlyClass, mods.readonlyNode);
  }

  map_class_header(n, decl);

  EnclosingScope scope(*this, EnclosingKind::Class);
  PromotionScope promoted(*this);
  decl->members =
    ast_.copy_to_arena(map_members(field_or_kind(n, "body", GrammarKind::DeclarationList)));
  decl->promotedProperties = ast_.copy_to_arena(promoted.properties);
  return decl;
}

ClassDecl * NodeMapper::map_anonymous_class(ts_ll::Node n, ts_ll::Node args_node)
{
  // Older grammars inline the class into object_creation_expression; the
  // declaration then starts at the `class` keyword.
  uint32_t start = n.start_byte();
  if (classify_grammar_kind(n.kind()) == GrammarKind::ObjectCreationExpression) {
    const ts_ll::Node class_kw = find_token(n, "class");
    if (!class_kw.is_null()) start = class_kw.start_byte();
  }

  auto * decl = ast_.create<ClassDecl>(std::string_view{}, tracker_.make_span(start, n.end_byte()));
  decl->isAnonymous = true;
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  const Modifiers mods = collect_modifiers(n);
  decl->isFinal = mods.isFinal;
  if (mods.isReadonly) {
    decl->isReadonly = check_construct(Construct::ReadonlyClass, mods.readonlyNode);
  }

  if (!args_node.is_null()) {
    bool first_class_callable = false;
    decl->anonymousArgs = ast_.copy_to_arena(map_arguments(args_node, first_class_callable));
  }
  map_class_header(n, decl);

  EnclosingScope scope(*this, EnclosingKind::Class);
  PromotionScope promoted(*this);
  decl->members =
    ast_.copy_to_arena(map_members(field_or_kind(n, "body", GrammarKind::DeclarationList)));
  decl->promotedProperties = ast_.copy_to_arena(promoted.properties);
  return decl;
}

InterfaceDecl * NodeMapper::map_interface(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * decl =
    ast_.create<InterfaceDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));
  decl->extends = ast_.copy_to_arena(map_name_list(n.first_child_of_kind("base_clause")));

  EnclosingScope scope(*this, EnclosingKind::Interface);
  decl->members =
    ast_.copy_to_arena(map_members(field_or_kind(n, "body", GrammarKind::DeclarationList)));
  return decl;
}

TraitDecl * NodeMapper::map_trait(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * decl =
    ast_.create<TraitDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  EnclosingScope scope(*this, EnclosingKind::Trait);
  PromotionScope promoted(*this);
  decl->members =
    ast_.copy_to_arena(map_members(field_or_kind(n, "body", GrammarKind::DeclarationList)));
  decl->promotedProperties = ast_.copy_to_arena(promoted.properties);
  return decl;
}

EnumDecl * NodeMapper::map_enum(ts_ll::Node n)
{
  const ts_ll::Node keyword = find_token(n, "enum");
  (void)check_construct(Construct::Enums, keyword.is_null() ? n : keyword);

  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * decl =
    ast_.create<EnumDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  for (const ts_ll::Node & c : n.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (is_type_kind(k) && decl->backingType == nullptr) {
      decl->backingType = map_type(c);
    } else if (k == GrammarKind::ClassInterfaceClause) {
      decl->implements = ast_.copy_to_arena(map_name_list(c));
    }
  }

  EnclosingScope scope(*this, EnclosingKind::Enum);
  decl->members =
    ast_.copy_to_arena(map_members(field_or_kind(n, "body", GrammarKind::EnumDeclarationList)));
  return decl;
}

EnumCaseDecl * NodeMapper::map_enum_case(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * decl =
    ast_.create<EnumCaseDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  ts_ll::Node value = n.child_by_field("value");
  if (value.is_null() && !name.is_null()) {
    for (const ts_ll::Node & c : n.named_children()) {
      if (c.start_byte() >= name.end_byte()) {
        value = c;
        break;
      }
    }
  }
  if (!value.is_null()) {
    decl->value = map_expr(value);
  }
  return decl;
}

// ============================================================================
// Members
// ============================================================================

std::vector<Decl *> NodeMapper::map_members(ts_ll::Node body_node)
{
  std::vector<Decl *> out;
  if (body_node.is_null()) return out;

  for (const ts_ll::Node & c : body_node.named_children()) {
    out.push_back(map_member(c));
  }
  return out;
}

Decl * NodeMapper::map_member(ts_ll::Node n)
{
  DepthGuard guard(*this);
  if (guard.exceeded()) {
    return nesting_limit_decl(n);
  }

  switch (classify_grammar_kind(n.kind())) {
    case GrammarKind::PropertyDeclaration:
      return map_property(n);
    case GrammarKind::MethodDeclaration:
      return map_method(n);
    case GrammarKind::ConstDeclaration:
      return map_const_declaration(n, true);
    case GrammarKind::UseDeclaration:
      return map_trait_use(n);
    case GrammarKind::EnumCase:
      if (enclosing() == EnclosingKind::Enum) {
        return map_enum_case(n);
      }
      return make_unknown<UnknownDecl>(n, UnknownReason::UnexpectedKind, "a class member");
    default:
      return make_unknown<UnknownDecl>(n, failure_reason(n), "a class member");
  }
}

PropertyDecl * NodeMapper::map_property(ts_ll::Node n)
{
  auto * prop = ast_.create<PropertyDecl>(span_of(n));
  prop->attributes = ast_.copy_to_arena(map_attributes(n));
  apply_property_modifiers(collect_modifiers(n), prop);

  std::vector<PropertyItem *> items;
  for (const ts_ll::Node & c : n.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (is_type_kind(k) && prop->type == nullptr) {
      prop->type = map_type(c);
      (void)check_construct(Construct::TypedProperties, c);
      check_type_gates(prop->type, false);
      continue;
    }
    if (k != GrammarKind::PropertyElement) continue;

    const ts_ll::Node name = field_or_kind(c, "name", GrammarKind::VariableName);
    ts_ll::Node def = c.child_by_field("default_value");
    if (def.is_null()) {
      const ts_ll::Node init = c.first_child_of_kind("property_initializer");
      if (!init.is_null()) {
        const std::vector<ts_ll::Node> named = init.named_children();
        if (!named.empty()) def = named.front();
      }
    }
    items.push_back(ast_.create<PropertyItem>(
      name.is_null() ? std::string_view{} : ast_.intern(strip_dollar(text(name))),
      def.is_null() ? nullptr : map_initializer(def), span_of(c)));
  }
  prop->items = ast_.copy_to_arena(items);
  return prop;
}

MethodDecl * NodeMapper::map_method(ts_ll::Node n)
{
  const ts_ll::Node name = field_or_kind(n, "name", GrammarKind::Name);
  auto * method =
    ast_.create<MethodDecl>(name.is_null() ? std::string_view{} : intern(name), span_of(n));
  method->attributes = ast_.copy_to_arena(map_attributes(n));

  const Modifiers mods = collect_modifiers(n);
  method->visibility = mods.visibility.value_or(Visibility::Public);
  method->hasExplicitVisibility = mods.visibility.has_value();
  method->isStatic = mods.isStatic;
  method->isAbstract = mods.isAbstract;
  method->isFinal = mods.isFinal;
  method->byRefReturn = has_reference_modifier(n);
  if (mods.isReadonly) {
    report_invalid_modifier(mods.readonlyNode, "methods cannot be readonly");
  }

  const ts_ll::Node body = field_or_kind(n, "body", GrammarKind::CompoundStatement);
  const bool is_constructor = method->is_constructor() && !body.is_null() && !mods.isAbstract;

  EnclosingScope scope(*this, is_constructor ? EnclosingKind::Constructor : EnclosingKind::Method);
  const ts_ll::Node params = field_or_kind(n, "parameters", GrammarKind::FormalParameters);
  method->params = ast_.copy_to_arena(map_params(params));
  method->returnType = map_return_type(return_type_node(n, params));
  if (!body.is_null()) {
    method->body = map_compound(body);
  }
  return method;
}

ConstItem * NodeMapper::map_const_element(ts_ll::Node n)
{
  const std::vector<ts_ll::Node> named = n.named_children();
  ts_ll::Node name;
  ts_ll::Node value = n.child_by_field("value");
  for (const ts_ll::Node & c : named) {
    if (name.is_null() && classify_grammar_kind(c.kind()) == GrammarKind::Name) {
      name = c;
    } else if (value.is_null() && !name.is_null()) {
      value = c;
    }
  }

  // Reserved words such as `class` are valid constant names and may arrive as tokens.
  std::string_view name_text;
  if (!name.is_null()) {
    name_text = intern(name);
  } else if (n.child_count() > 0) {
    name_text = intern(n.child(0));
  }

  Expr * v = value.is_null() ? make_missing<UnknownExpr>(n, n.end_byte(), "value") : map_expr(value);
  return ast_.create<ConstItem>(name_text, v, span_of(n));
}

Decl * NodeMapper::map_const_declaration(ts_ll::Node n, bool in_class)
{
  std::vector<ConstItem *> items;
  TypeNode * type = nullptr;
  ts_ll::Node type_node;
  for (const ts_ll::Node & c : n.named_children()) {
    const GrammarKind k = classify_grammar_kind(c.kind());
    if (k == GrammarKind::ConstElement) {
      items.push_back(map_const_element(c));
    } else if (is_type_kind(k) && type == nullptr) {
      type_node = c;
      type = map_type(c);
    }
  }

  if (!in_class) {
    for (ConstItem * item : items) {
      if (isa<NewExpr>(item->value)) {
        (void)check_construct(Construct::NewInInitializer, item->value->get_span());
      }
    }
    auto * decl = ast_.create<ConstDecl>(span_of(n));
    decl->items = ast_.copy_to_arena(items);
    return decl;
  }

  auto * decl = ast_.create<ClassConstDecl>(span_of(n));
  decl->attributes = ast_.copy_to_arena(map_attributes(n));

  const Modifiers mods = collect_modifiers(n);
  decl->isFinal = mods.isFinal;
  if (mods.visibility && check_construct(Construct::ClassConstVisibility, mods.visibilityNode)) {
    decl->visibility = *mods.visibility;
    decl->hasExplicitVisibility = true;
  }
  if (type != nullptr) {
    (void)check_construct(Construct::TypedClassConstants, type_node);
    check_type_gates(type, false);
    decl->type = type;
  }
  decl->items = ast_.copy_to_arena(items);
  return decl;
}

TraitUseDecl * NodeMapper::map_trait_use(ts_ll::Node n)
{
  auto * decl = ast_.create<TraitUseDecl>(span_of(n));
  decl->traits = ast_.copy_to_arena(map_name_list(n));
  decl->hasAdaptations = !n.first_child_of_kind("use_list").is_null();
  return decl;
}

}  // namespace celerrate
