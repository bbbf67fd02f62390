#include "blocksplit/test/OffsetRangeTrackerTester.hpp"

#include <cstdint>
#include <stdexcept>

namespace blocksplit
{
namespace test
{

OffsetRangeTrackerTester::OffsetRangeTrackerTester(): ::testing::Test()
{
}

OffsetRangeTrackerTester::~OffsetRangeTrackerTester()
{
}

void OffsetRangeTrackerTester::SetUp()
{
}

void OffsetRangeTrackerTester::TearDown()
{
}

TEST_F(OffsetRangeTrackerTester, test_invalid_range)
{
    EXPECT_THROW(OffsetRangeTracker(200, 100), std::invalid_argument);
    OffsetRangeTracker empty(100, 100);
    EXPECT_FALSE(empty.try_return_record_at(true, 100));
}

TEST_F(OffsetRangeTrackerTester, test_try_return_record_simple_sparse)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_TRUE(tracker.try_return_record_at(true, 110));
    EXPECT_TRUE(tracker.try_return_record_at(true, 140));
    EXPECT_TRUE(tracker.try_return_record_at(true, 183));
    EXPECT_FALSE(tracker.try_return_record_at(true, 210));
}

TEST_F(OffsetRangeTrackerTester, test_try_return_record_non_split_points)
{
    OffsetRangeTracker tracker(9, 18);
    EXPECT_TRUE(tracker.try_return_record_at(true, 10));
    EXPECT_TRUE(tracker.try_return_record_at(false, 10));
    EXPECT_TRUE(tracker.try_return_record_at(false, 10));
    EXPECT_TRUE(tracker.try_return_record_at(true, 17));
    // Records inside a block are returned regardless of the stop offset
    EXPECT_TRUE(tracker.try_return_record_at(false, 17));
    EXPECT_FALSE(tracker.try_return_record_at(true, 18));
}

TEST_F(OffsetRangeTrackerTester, test_first_record_must_be_split_point)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_THROW(tracker.try_return_record_at(false, 120), std::logic_error);
}

TEST_F(OffsetRangeTrackerTester, test_records_out_of_order)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_TRUE(tracker.try_return_record_at(true, 150));
    EXPECT_THROW(tracker.try_return_record_at(true, 140), std::logic_error);
}

TEST_F(OffsetRangeTrackerTester, test_split_before_reading)
{
    OffsetRangeTracker tracker(100, 200);
    auto residual = tracker.try_split_at_fraction(0.5);
    ASSERT_TRUE(residual.has_value());
    EXPECT_EQ(residual->start, 150u);
    EXPECT_EQ(residual->end, 200u);
    EXPECT_EQ(tracker.stop_offset(), 150u);
    EXPECT_EQ(tracker.original_stop_offset(), 200u);
    EXPECT_TRUE(tracker.try_return_record_at(true, 149));
    EXPECT_FALSE(tracker.try_return_record_at(true, 150));
}

TEST_F(OffsetRangeTrackerTester, test_split_fractions_use_original_range)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_TRUE(tracker.try_return_record_at(true, 110));
    auto first = tracker.try_split_at_fraction(0.8);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->start, 180u);
    EXPECT_EQ(first->end, 200u);
    // The fraction still refers to [100, 200), so 0.5 lands at 150
    auto second = tracker.try_split_at_fraction(0.5);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->start, 150u);
    EXPECT_EQ(second->end, 180u);
    // At or past the current stop offset
    EXPECT_FALSE(tracker.try_split_at_fraction(0.6).has_value());
    EXPECT_EQ(tracker.stop_offset(), 150u);
}

TEST_F(OffsetRangeTrackerTester, test_split_rejections)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_FALSE(tracker.try_split_at_fraction(0.0).has_value());
    EXPECT_FALSE(tracker.try_split_at_fraction(-0.5).has_value());
    EXPECT_FALSE(tracker.try_split_at_fraction(1.0).has_value());
    EXPECT_FALSE(tracker.try_split_at_fraction(1.5).has_value());
    // Rounds down onto the start offset
    EXPECT_FALSE(tracker.try_split_at_fraction(0.001).has_value());
    EXPECT_EQ(tracker.stop_offset(), 200u);

    EXPECT_TRUE(tracker.try_return_record_at(true, 140));
    EXPECT_FALSE(tracker.try_split_at_fraction(0.3).has_value());
    EXPECT_FALSE(tracker.try_split_at_fraction(0.4).has_value());
    EXPECT_TRUE(tracker.try_split_at_fraction(0.45).has_value());
}

TEST_F(OffsetRangeTrackerTester, test_no_split_after_done)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_TRUE(tracker.try_return_record_at(true, 110));
    EXPECT_FALSE(tracker.try_return_record_at(true, 250));
    EXPECT_FALSE(tracker.try_split_at_fraction(0.5).has_value());

    OffsetRangeTracker marked(100, 200);
    marked.mark_done();
    EXPECT_FALSE(marked.try_split_at_fraction(0.5).has_value());
    EXPECT_DOUBLE_EQ(marked.fraction_consumed(), 1.0);
}

TEST_F(OffsetRangeTrackerTester, test_fraction_consumed)
{
    OffsetRangeTracker tracker(100, 200);
    EXPECT_DOUBLE_EQ(tracker.fraction_consumed(), 0.0);
    EXPECT_FALSE(tracker.last_record_start().has_value());
    EXPECT_TRUE(tracker.try_return_record_at(true, 100));
    EXPECT_DOUBLE_EQ(tracker.fraction_consumed(), 0.0);
    EXPECT_TRUE(tracker.try_return_record_at(true, 150));
    EXPECT_DOUBLE_EQ(tracker.fraction_consumed(), 0.5);
    EXPECT_EQ(tracker.last_record_start(), std::optional<std::uint64_t>(150));
    // Measured against the shrunk range after a split
    ASSERT_TRUE(tracker.try_split_at_fraction(0.75).has_value());
    EXPECT_DOUBLE_EQ(tracker.fraction_consumed(), 50.0 / 75.0);
    EXPECT_FALSE(tracker.try_return_record_at(true, 180));
    EXPECT_DOUBLE_EQ(tracker.fraction_consumed(), 1.0);
}

TEST_F(OffsetRangeTrackerTester, test_unbounded_range)
{
    OffsetRangeTracker tracker(0, UINT64_MAX);
    EXPECT_TRUE(tracker.try_return_record_at(true, 1000));
    auto residual = tracker.try_split_at_fraction(0.5);
    ASSERT_TRUE(residual.has_value());
    EXPECT_GT(residual->start, 1000u);
    EXPECT_EQ(residual->end, UINT64_MAX);
}

} // namespace test
} // namespace blocksplit
