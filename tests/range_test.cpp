#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <vector>

#include "argot/errors.hpp"
#include "argot/range.hpp"

using argot::InitializationError;
using argot::Range;

TEST(RangeTest, ParsesLiteralForms) {
    EXPECT_EQ(Range::parse("1"), Range(1, 1));
    EXPECT_EQ(Range::parse("0..1"), Range(0, 1));
    EXPECT_EQ(Range::parse("2..4"), Range(2, 4));
    EXPECT_EQ(Range::parse("*"), Range(0, Range::kUnbounded));
    EXPECT_EQ(Range::parse("1..*"), Range::atLeast(1));
    EXPECT_EQ(Range::parse(" 3 "), Range::exactly(3));
}

TEST(RangeTest, RejectsMalformedText) {
    for (const char* bad : {"", "x", "1..", "..2", "-1", "1..x", "1...2", "**", "2..1"}) {
        EXPECT_THROW(Range::parse(bad), InitializationError) << bad;
    }
}

TEST(RangeTest, ContainsRespectsBounds) {
    const auto r = Range::parse("2..4");
    EXPECT_FALSE(r.contains(1));
    EXPECT_TRUE(r.contains(2));
    EXPECT_TRUE(r.contains(4));
    EXPECT_FALSE(r.contains(5));
    EXPECT_TRUE(Range::parse("1..*").contains(1000000));
    EXPECT_TRUE(Range::parse("1..*").isUnbounded());
}

TEST(RangeTest, WithMinRaisesMaxWhenNeeded) {
    EXPECT_EQ(Range(0, 1).withMin(1), Range(1, 1));
    EXPECT_EQ(Range(0, 0).withMin(1), Range(1, 1));
    EXPECT_EQ(Range::atLeast(0).withMin(2), Range::atLeast(2));
}

TEST(RangeTest, RendersCompactText) {
    EXPECT_EQ(Range::exactly(1).toString(), "1");
    EXPECT_EQ(Range(0, 1).toString(), "0..1");
    EXPECT_EQ(Range::atLeast(1).toString(), "1..*");

    std::ostringstream os;
    os << Range(2, 4);
    EXPECT_EQ(os.str(), "2..4");
}

TEST(RangeTest, OrdersByMinThenMax) {
    std::vector<Range> ranges{Range(2, 4), Range::atLeast(0), Range(0, 3), Range::exactly(1)};
    std::sort(ranges.begin(), ranges.end());
    EXPECT_EQ(ranges[0], Range(0, 3));
    EXPECT_EQ(ranges[1], Range::atLeast(0));
    EXPECT_EQ(ranges[2], Range::exactly(1));
    EXPECT_EQ(ranges[3], Range(2, 4));
}
