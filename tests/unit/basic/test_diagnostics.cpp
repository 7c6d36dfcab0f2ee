// tests/unit/basic/test_diagnostics.cpp - DiagnosticBag and DiagnosticPrinter
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "celerrate/basic/diagnostic.hpp"
#include "celerrate/basic/diagnostic_codes.hpp"
#include "celerrate/basic/diagnostic_printer.hpp"
#include "celerrate/basic/source_manager.hpp"
#include "celerrate/basic/span_tracker.hpp"

using namespace celerrate;

TEST(DiagnosticBag, BuilderRegistersOnDestruction)
{
  const SourceManager sm("<?php $a;");
  const SpanTracker tracker(sm);
  DiagnosticBag bag;

  bag.report_error(tracker.make_span(6, 8), "bad thing", "here")
    .with_code(diag_code::k_syntax_error)
    .with_help("try something else");

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E2001");
  EXPECT_EQ(d.message, "bad thing");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try something else");
  EXPECT_EQ(d.primary_span().start_byte, 6U);
}

TEST(DiagnosticBag, FiltersBySeverityAndCode)
{
  const SourceManager sm("<?php $a; $b;");
  const SpanTracker tracker(sm);
  DiagnosticBag bag;

  bag.report_warning(tracker.make_span(6, 8), "w").with_code(diag_code::k_construct_unavailable);
  bag.report_error(tracker.make_span(10, 12), "e").with_code(diag_code::k_unexpected_kind);
  bag.report_warning(tracker.make_span(10, 12), "w2").with_code(diag_code::k_construct_unavailable);

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 2U);
  EXPECT_EQ(bag.with_code("D1001").size(), 2U);
  EXPECT_TRUE(bag.with_code("E2005").empty());
}

TEST(DiagnosticBag, SortedByPositionIsStable)
{
  const SourceManager sm("<?php $a; $b;");
  const SpanTracker tracker(sm);
  DiagnosticBag bag;

  bag.report_error(tracker.make_span(10, 12), "second");
  bag.report_error(tracker.make_span(6, 8), "first");
  bag.report_warning(tracker.make_span(10, 12), "third");

  const auto sorted = bag.sorted_by_position();
  ASSERT_EQ(sorted.size(), 3U);
  EXPECT_EQ(sorted[0].message, "first");
  EXPECT_EQ(sorted[1].message, "second");
  EXPECT_EQ(sorted[2].message, "third");
}

TEST(DiagnosticPrinter, RendersHeaderLocationAndCaret)
{
  SourceManager sm("src/Point.php", "<?php\nclass P { public readonly int $x; }\n");
  const SpanTracker tracker(sm);
  DiagnosticBag bag;

  // "readonly" on line 2
  bag.report_warning(tracker.make_span(23, 31), "readonly properties require PHP 8.1", "ignored")
    .with_code(diag_code::k_construct_unavailable)
    .with_help("raise php.version in celerrate.yaml");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sm);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[D1001]: readonly properties require PHP 8.1"), std::string::npos)
    << text;
  EXPECT_NE(text.find(":2:18"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^^^^ ignored"), std::string::npos) << text;
  EXPECT_NE(text.find("= help: raise php.version in celerrate.yaml"), std::string::npos) << text;
}

TEST(DiagnosticPrinter, ZeroWidthSpanGetsOneCaret)
{
  const SourceManager sm("<?php\nfoo(\n");
  const SpanTracker tracker(sm);
  DiagnosticBag bag;
  bag.report_error(tracker.make_point(10), "missing ')'", "expected here")
    .with_code(diag_code::k_missing_token);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sm);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E2002]: missing ')'"), std::string::npos) << text;
  EXPECT_NE(text.find("<input>:2:5"), std::string::npos) << text;
  EXPECT_NE(text.find("^ expected here"), std::string::npos) << text;
  EXPECT_EQ(text.find("^^"), std::string::npos) << text;
}
