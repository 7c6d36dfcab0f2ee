// tests/unit/basic/test_span_tracker.cpp
#include <gtest/gtest.h>

#include "celerrate/basic/invariant_violation.hpp"
#include "celerrate/basic/source_manager.hpp"
#include "celerrate/basic/span_tracker.hpp"

using namespace celerrate;

TEST(SpanTracker, ComputesLinesAndColumns)
{
  const SourceManager sm("<?php\n  $x = 1;\n");
  const SpanTracker tracker(sm);

  const Span s = tracker.make_span(8, 10);  // "$x"
  EXPECT_EQ(s.start_byte, 8U);
  EXPECT_EQ(s.end_byte, 10U);
  EXPECT_EQ(s.start_line, 2U);
  EXPECT_EQ(s.start_column, 3U);
  EXPECT_EQ(s.end_line, 2U);
  EXPECT_EQ(s.end_column, 5U);
  EXPECT_TRUE(s.is_valid());
  EXPECT_FALSE(s.is_empty());
}

TEST(SpanTracker, SpanAcrossLines)
{
  const SourceManager sm("<?php\nif ($a) {\n}\n");
  const SpanTracker tracker(sm);

  const Span s = tracker.make_span(6, 17);
  EXPECT_EQ(s.start_line, 2U);
  EXPECT_EQ(s.end_line, 3U);
  EXPECT_EQ(s.end_column, 2U);
}

TEST(SpanTracker, ZeroWidthPointMatchesInEveryCoordinate)
{
  const SourceManager sm("<?php\nfoo();\n");
  const SpanTracker tracker(sm);

  const Span p = tracker.make_point(9);
  EXPECT_TRUE(p.is_empty());
  EXPECT_EQ(p.start_line, p.end_line);
  EXPECT_EQ(p.start_column, p.end_column);
  EXPECT_EQ(p.start_column, 4U);
}

TEST(SpanTracker, PointAtEndOfBufferIsAllowed)
{
  const SourceManager sm("<?php");
  const SpanTracker tracker(sm);
  EXPECT_NO_THROW((void)tracker.make_point(5));
}

TEST(SpanTracker, InvertedRangeThrows)
{
  const SourceManager sm("<?php echo 1;");
  const SpanTracker tracker(sm);
  EXPECT_THROW((void)tracker.make_span(6, 2), InvariantViolation);
}

TEST(SpanTracker, RangePastTheBufferThrowsWithItsRange)
{
  const SourceManager sm("<?php");
  const SpanTracker tracker(sm);
  try {
    (void)tracker.make_span(2, 40);
    FAIL() << "expected InvariantViolation";
  } catch (const InvariantViolation & e) {
    EXPECT_EQ(e.range().get_begin().get_offset(), 2U);
    EXPECT_EQ(e.range().get_end().get_offset(), 40U);
  }
}

TEST(SpanTracker, CoverJoinsTwoSpans)
{
  const SourceManager sm("<?php $a + $b;");
  const SpanTracker tracker(sm);
  const Span joined = tracker.cover(tracker.make_span(6, 8), tracker.make_span(11, 13));
  EXPECT_EQ(joined.start_byte, 6U);
  EXPECT_EQ(joined.end_byte, 13U);
}

TEST(Span, ContainsIsInclusiveOfBothEnds)
{
  const SourceManager sm("0123456789");
  const SpanTracker tracker(sm);
  const Span outer = tracker.make_span(2, 8);
  EXPECT_TRUE(outer.contains(tracker.make_span(2, 8)));
  EXPECT_TRUE(outer.contains(tracker.make_point(8)));
  EXPECT_FALSE(outer.contains(tracker.make_span(1, 4)));
  EXPECT_FALSE(outer.contains(tracker.make_span(7, 9)));
}
