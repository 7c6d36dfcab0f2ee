// celerrate/test_support/parse_helpers.hpp - helpers for unit tests
//
// Runs the whole mapping pipeline on an in-memory snippet and keeps every
// owner alive for as long as the test holds the unit.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_dumper.hpp"
#include "celerrate/basic/casting.hpp"
#include "celerrate/basic/diagnostic.hpp"
#include "celerrate/dialect/php_version.hpp"
#include "celerrate/syntax/frontend.hpp"
#include "celerrate/syntax/mapping_options.hpp"

namespace celerrate::test_support
{

struct TestMapUnit
{
  std::unique_ptr<MappingResult> result;

  [[nodiscard]] const Program * program() const noexcept { return result->program; }
  [[nodiscard]] const DiagnosticBag & diags() const noexcept { return result->diags; }

  [[nodiscard]] const Stmt * stmt(size_t i) const
  {
    const auto & stmts = result->program->stmts;
    return i < stmts.size() ? stmts[i] : nullptr;
  }

  /// Declaration wrapped by the i-th top-level statement, cast to T.
  template <typename T>
  [[nodiscard]] const T * decl(size_t i) const
  {
    const auto * wrapper = dyn_cast<DeclStmt>(stmt(i));
    return wrapper != nullptr ? dyn_cast<T>(wrapper->decl) : nullptr;
  }

  /// Expression of the i-th top-level statement when it is an expression statement.
  template <typename T>
  [[nodiscard]] const T * expr(size_t i) const
  {
    const auto * wrapper = dyn_cast<ExprStmt>(stmt(i));
    return wrapper != nullptr ? dyn_cast<T>(wrapper->expr) : nullptr;
  }

  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const
  {
    return result->diags.with_code(code);
  }

  [[nodiscard]] std::string_view slice(const AstNode * node) const noexcept
  {
    return result->source.get_source_slice(node->get_range());
  }

  [[nodiscard]] std::string dump() const { return dump_to_string(result->program); }
};

[[nodiscard]] inline TestMapUnit parse_php(std::string src, const MappingOptions & options)
{
  TestMapUnit out;
  out.result = map_source(std::move(src), options);
  return out;
}

[[nodiscard]] inline TestMapUnit parse_php(
  std::string src, PhpVersion version = k_latest_php_version,
  GatePolicy policy = GatePolicy::Downgrade)
{
  MappingOptions options;
  options.version = version;
  options.policy = policy;
  return parse_php(std::move(src), options);
}

}  // namespace celerrate::test_support
