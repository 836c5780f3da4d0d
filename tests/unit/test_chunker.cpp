#include <gtest/gtest.h>

#include "vidlift/client/chunker.h"

using vidlift::client::ByteRange;
using vidlift::client::ChoosePartSize;
using vidlift::client::CountParts;
using vidlift::client::SplitIntoParts;

TEST(Chunker, SplitsIntoContiguousRangesWithRemainder) {
    auto ranges = SplitIntoParts(25, 10);
    ASSERT_TRUE(ranges.ok());
    ASSERT_EQ(ranges.value().size(), 3u);
    EXPECT_EQ(ranges.value()[0], (ByteRange{0, 10}));
    EXPECT_EQ(ranges.value()[1], (ByteRange{10, 10}));
    EXPECT_EQ(ranges.value()[2], (ByteRange{20, 5}));
}

TEST(Chunker, ExactMultipleHasNoShortTail) {
    auto ranges = SplitIntoParts(30, 10);
    ASSERT_TRUE(ranges.ok());
    ASSERT_EQ(ranges.value().size(), 3u);
    EXPECT_EQ(ranges.value().back(), (ByteRange{20, 10}));
}

TEST(Chunker, EmptyFileYieldsOneEmptyPart) {
    auto ranges = SplitIntoParts(0, 10);
    ASSERT_TRUE(ranges.ok());
    ASSERT_EQ(ranges.value().size(), 1u);
    EXPECT_EQ(ranges.value()[0].length, 0u);
    EXPECT_EQ(CountParts(0, 10), 1u);
}

TEST(Chunker, RangesCoverFileWithoutGaps) {
    const std::uint64_t total = 10 * 1024 * 1024 + 7;
    auto ranges = SplitIntoParts(total, 1024 * 1024);
    ASSERT_TRUE(ranges.ok());
    EXPECT_EQ(ranges.value().size(), CountParts(total, 1024 * 1024));
    std::uint64_t expected_offset = 0;
    for (const auto& range : ranges.value()) {
        EXPECT_EQ(range.offset, expected_offset);
        EXPECT_GT(range.length, 0u);
        expected_offset = range.end();
    }
    EXPECT_EQ(expected_offset, total);
}

TEST(Chunker, ZeroPartSizeIsRejected) {
    auto ranges = SplitIntoParts(100, 0);
    ASSERT_FALSE(ranges.ok());
    EXPECT_EQ(ranges.error().code, vidlift::core::ErrorCode::kInvalidArgument);
}

TEST(Chunker, ChoosePartSizeKeepsTargetWithinCeiling) {
    auto size = ChoosePartSize(100, 10, 10);
    ASSERT_TRUE(size.ok());
    EXPECT_EQ(size.value(), 10u);
}

TEST(Chunker, ChoosePartSizeGrowsToRespectCeiling) {
    auto size = ChoosePartSize(1001, 10, 10);
    ASSERT_TRUE(size.ok());
    EXPECT_EQ(size.value(), 101u);
    EXPECT_LE(CountParts(1001, size.value()), 10u);
}

TEST(Chunker, ChoosePartSizeRejectsBadInputs) {
    EXPECT_FALSE(ChoosePartSize(100, 0, 10).ok());
    EXPECT_FALSE(ChoosePartSize(100, 10, 0).ok());
}
