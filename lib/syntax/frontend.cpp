// celerrate/syntax/frontend.cpp - High-level mapping pipeline
#include "celerrate/syntax/frontend.hpp"

#include <fmt/format.h>

#include "celerrate/ast/span_validator.hpp"
#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/basic/span_tracker.hpp"
#include "celerrate/syntax/node_mapper.hpp"

namespace celerrate
{

namespace
{

// One Error per outermost ERROR node and per MISSING token. The walk does
// not descend into an ERROR node, so nested recovery is reported once.
void collect_syntax_diagnostics(
  const ts_ll::Node root, const SpanTracker & tracker, DiagnosticBag & diags)
{
  ts_ll::Cursor cursor(root);
  bool descend = true;
  while (true) {
    const ts_ll::Node n = cursor.current_node();
    if (descend) {
      if (n.is_error()) {
        diags
          .report_error(
            tracker.make_span(n.range()), "syntax error", "not valid PHP in this position")
          .with_code(diag_code::k_syntax_error);
      } else if (n.is_missing()) {
        diags
          .report_error(
            tracker.make_point(n.start_byte()), fmt::format("missing '{}'", n.kind()),
            "expected here")
          .with_code(diag_code::k_missing_token);
      } else if (n.has_error() && cursor.goto_first_child()) {
        continue;
      }
    }
    if (cursor.goto_next_sibling()) {
      descend = true;
      continue;
    }
    if (!cursor.goto_parent()) {
      return;
    }
    descend = false;
  }
}

}  // namespace

std::unique_ptr<MappingResult> map_tree(
  std::string source, const ts_ll::Tree & tree, const MappingOptions & options)
{
  auto result = std::make_unique<MappingResult>();
  result->source.set_source(std::move(source));
  result->version = options.version;

  const ts_ll::Node root = tree.root_node();
  const SpanTracker tracker(result->source);

  // Tree-sitter recovers from syntax errors and still returns a tree; every
  // recovery point must surface as a diagnostic.
  if (!root.is_null() && root.has_error()) {
    collect_syntax_diagnostics(root, tracker, result->diags);
  }

  NodeMapper mapper(result->ast, result->source, result->diags, options);
  result->program = mapper.map_program(root);

  validate_spans(result->program);
  return result;
}

std::unique_ptr<MappingResult> map_source(std::string source, const MappingOptions & options)
{
  const ts_ll::Parser parser;
  const ts_ll::Tree tree(parser.parse_string(source));
  return map_tree(std::move(source), tree, options);
}

std::unique_ptr<MappingResult> map_source(
  std::string source, std::string_view dialect_tag, GatePolicy policy)
{
  const DialectSelection selection = resolve_dialect_tag(dialect_tag);

  MappingOptions options;
  options.version = selection.version;
  options.policy = policy;

  auto result = map_source(std::move(source), options);
  if (selection.fell_back) {
    const SpanTracker tracker(result->source);
    result->diags
      .report_warning(
        tracker.make_point(0),
        fmt::format(
          "unknown PHP dialect '{}', mapping as PHP {}", selection.requested,
          to_string(selection.version)))
      .with_code(diag_code::k_dialect_fallback);
  }
  return result;
}

}  // namespace celerrate
