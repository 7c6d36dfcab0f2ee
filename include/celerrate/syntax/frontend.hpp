// celerrate/syntax/frontend.hpp - High-level mapping pipeline entry point
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/ast_context.hpp"
#include "celerrate/basic/diagnostic.hpp"
#include "celerrate/basic/source_manager.hpp"
#include "celerrate/dialect/php_version.hpp"
#include "celerrate/syntax/mapping_options.hpp"
#include "celerrate/syntax/ts_ll.hpp"

namespace celerrate
{

/**
 * Everything one mapping pass produces.
 *
 * AST nodes live in the arena of `ast`, so the result is handed out behind
 * a unique_ptr and never moved. Results of separate passes are independent.
 */
struct MappingResult
{
  SourceManager source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;
  PhpVersion version = k_latest_php_version;

  MappingResult() = default;
  MappingResult(const MappingResult &) = delete;
  MappingResult & operator=(const MappingResult &) = delete;

  [[nodiscard]] bool has_errors() const { return diags.has_errors(); }
};

// Mapping pipeline:
// source -> tree-sitter-php (CST) -> syntax pre-pass -> NodeMapper (AST) -> span validation
//
// Throws InvariantViolation when the finished tree breaks span containment.
[[nodiscard]] std::unique_ptr<MappingResult> map_source(
  std::string source, const MappingOptions & options = {});

/// Same pipeline with a dialect tag such as "7.4" or "php8.2". An unknown tag
/// maps with the latest dialect and adds a D1003 warning.
[[nodiscard]] std::unique_ptr<MappingResult> map_source(
  std::string source, std::string_view dialect_tag, GatePolicy policy = GatePolicy::Downgrade);

/// Maps an already parsed tree. `tree` must have been produced from `source`.
[[nodiscard]] std::unique_ptr<MappingResult> map_tree(
  std::string source, const ts_ll::Tree & tree, const MappingOptions & options);

}  // namespace celerrate
