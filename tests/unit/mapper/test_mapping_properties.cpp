// tests/unit/mapper/test_mapping_properties.cpp - properties every mapped tree satisfies
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "celerrate/ast/ast.hpp"
#include "celerrate/ast/children.hpp"
#include "celerrate/ast/span_validator.hpp"
#include "celerrate/ast/structural_equality.hpp"
#include "celerrate/ast/traversal.hpp"
#include "celerrate/test_support/parse_helpers.hpp"

using namespace celerrate;
using celerrate::test_support::parse_php;
using celerrate::test_support::TestMapUnit;

namespace
{

const std::vector<std::string> & corpus()
{
  static const std::vector<std::string> k_corpus = {
    // Well-formed
    "<?php\n"
    "declare(strict_types=1);\n"
    "namespace App\\Billing;\n"
    "use App\\Support\\{Money, Currency as Cur};\n"
    "#[Entity]\n"
    "final class Invoice implements \\JsonSerializable {\n"
    "    use HasTimestamps;\n"
    "    private const PREFIX = 'INV';\n"
    "    private array $lines = [];\n"
    "    public function __construct(private readonly string $number, protected ?Cur $cur = null) {}\n"
    "    public function add(Money ...$items): static {\n"
    "        foreach ($items as $i => $item) { $this->lines[] = $item; }\n"
    "        return $this;\n"
    "    }\n"
    "    public function total(): int|float {\n"
    "        return array_reduce($this->lines, fn($c, $l) => $c + $l->amount, 0);\n"
    "    }\n"
    "    public function jsonSerialize(): mixed {\n"
    "        return match (true) { empty($this->lines) => null, default => \"{$this->number}\" };\n"
    "    }\n"
    "}\n",

    "<html><body>\n"
    "<?php foreach ($rows as $row): ?>\n"
    "  <tr><td><?= htmlspecialchars($row['name']) ?></td></tr>\n"
    "<?php endforeach; ?>\n"
    "</body></html>\n",

    "<?php\n"
    "function walk(array &$tree, callable $visit, int $depth = 0): void {\n"
    "    static $calls = 0;\n"
    "    $calls++;\n"
    "    try {\n"
    "        switch (true) {\n"
    "            case $depth > 10: throw new \\OverflowException('deep');\n"
    "            default: break;\n"
    "        }\n"
    "        while (list($k, $v) = each($tree)) { $visit($k, $v); }\n"
    "    } catch (\\Throwable $e) {\n"
    "        error_log(<<<MSG\n"
    "            failed at $depth: {$e->getMessage()}\n"
    "            MSG);\n"
    "    } finally { unset($tree['_tmp']); }\n"
    "}\n",

    "<?php\n"
    "enum Level: int { case Low = 1; case High = 2;\n"
    "  public static function fromName(string $n): self { return constant(\"self::$n\"); } }\n"
    "$cb = Level::fromName(...);\n"
    "$x = $y?->z ?? throw new LogicException();\n"
    "$s = (string) (int) '12' . PHP_EOL;\n",

    // Broken
    "<?php\nclass Broken {\n  public function f( { return 1; }\n}\n",
    "<?php\n$a = [1, 2;\necho $a;\n",
    "<?php\nif ($x) {\n  foo(\n} else {\n  bar();\n}\n",
    "<?php\nfunction (\n",
    "<?php match($x) { => 1 };",
    "<?php $a = 'unterminated;\n",
  };
  return k_corpus;
}

const std::vector<PhpVersion> k_versions = {
  PhpVersion::Php70, PhpVersion::Php74, PhpVersion::Php80, PhpVersion::Php81, PhpVersion::Php84};

}  // namespace

TEST(MappingProperties, ChildSpansNestInsideParents)
{
  for (const std::string & src : corpus()) {
    SCOPED_TRACE(src);
    const TestMapUnit unit = parse_php(src);
    for (const auto & e : preorder(unit.program())) {
      EXPECT_TRUE(e.node->get_span().is_valid()) << to_string(e.node->get_kind());
      EXPECT_LE(e.node->get_span().end_byte, src.size());
      if (e.parent != nullptr) {
        EXPECT_TRUE(e.parent->get_span().contains(e.node->get_span()))
          << to_string(e.node->get_kind()) << " escapes " << to_string(e.parent->get_kind());
      }
    }
    EXPECT_FALSE(find_span_violation(unit.program()).has_value());
  }
}

TEST(MappingProperties, EveryInputYieldsAProgram)
{
  for (const std::string & src : corpus()) {
    for (const PhpVersion v : k_versions) {
      SCOPED_TRACE(src);
      TestMapUnit unit;
      ASSERT_NO_THROW(unit = parse_php(src, v));
      ASSERT_NE(unit.program(), nullptr);
      for (const AstNode * node : collect_preorder(unit.program())) {
        for (const AstNode * child : children_of(node)) {
          EXPECT_NE(child, nullptr) << to_string(node->get_kind());
        }
      }
    }
  }
}

TEST(MappingProperties, EveryPlaceholderIsExplained)
{
  for (const std::string & src : corpus()) {
    SCOPED_TRACE(src);
    const TestMapUnit unit = parse_php(src);
    size_t unknowns = 0;
    for (const auto & e : preorder(unit.program())) {
      if (!unknown_reason(e.node).has_value()) continue;
      ++unknowns;
      bool explained = false;
      for (const auto & d : unit.diags().all()) {
        explained = explained || e.node->get_span().contains(d.primary_span());
      }
      EXPECT_TRUE(explained) << to_string(e.node->get_kind()) << " at byte "
                             << e.node->get_span().start_byte;
    }
    if (unknowns > 0) {
      EXPECT_TRUE(unit.diags().has_errors() || unit.diags().has_warnings());
    }
  }
}

TEST(MappingProperties, MappingIsDeterministic)
{
  for (const std::string & src : corpus()) {
    SCOPED_TRACE(src);
    const TestMapUnit first = parse_php(src);
    const TestMapUnit second = parse_php(src);
    EXPECT_TRUE(structurally_equal(first.program(), second.program()));
    EXPECT_EQ(first.dump(), second.dump());

    const auto a = first.diags().sorted_by_position();
    const auto b = second.diags().sorted_by_position();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
      EXPECT_EQ(a[i].code, b[i].code);
      EXPECT_EQ(a[i].message, b[i].message);
      EXPECT_EQ(a[i].primary_span(), b[i].primary_span());
    }
  }
}

TEST(MappingProperties, WellFormedInputHasNoErrorsInAnyDialect)
{
  // The first four corpus entries parse cleanly; gates only ever warn.
  for (size_t i = 0; i < 4; ++i) {
    for (const PhpVersion v : k_versions) {
      SCOPED_TRACE(corpus()[i]);
      const TestMapUnit unit = parse_php(corpus()[i], v);
      EXPECT_FALSE(unit.diags().has_errors()) << to_string(v) << "\n" << unit.dump();
    }
  }
}

TEST(MappingProperties, DialectOnlyAffectsDiagnosticsForUngatedCode)
{
  const std::string src =
    "<?php\nfunction area($w, $h) { return $w * $h; }\n"
    "if (area(2, 3) > 5) { echo 'big'; } else { echo \"small\"; }\n";
  const TestMapUnit oldest = parse_php(src, k_oldest_php_version);
  const TestMapUnit latest = parse_php(src, k_latest_php_version);
  EXPECT_TRUE(oldest.diags().empty());
  EXPECT_TRUE(latest.diags().empty());
  EXPECT_TRUE(structurally_equal(oldest.program(), latest.program()));
}
