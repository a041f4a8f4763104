#include <gtest/gtest.h>
#include "utils/time_format.h"

using namespace logq::utils;

TEST(TimeFormatTest, ParsesUtc) {
    auto ns = parseRfc3339Nano("2019-04-04T11:03:20Z");
    ASSERT_TRUE(ns.has_value());
    EXPECT_EQ(*ns, 1554375800000000000LL);
}

TEST(TimeFormatTest, ParsesFractionAndOffset) {
    EXPECT_EQ(parseRfc3339Nano("2019-04-04T11:03:20.5Z"), 1554375800500000000LL);
    EXPECT_EQ(parseRfc3339Nano("2019-04-04T11:03:20.000000001Z"), 1554375800000000001LL);
    EXPECT_EQ(parseRfc3339Nano("2019-04-04T12:03:20+01:00"), 1554375800000000000LL);
    EXPECT_EQ(parseRfc3339Nano("2019-04-04T06:33:20-04:30"), 1554375800000000000LL);
}

TEST(TimeFormatTest, RejectsMalformed) {
    for (const char* bad : {
            "",
            "2019-04-04",
            "2019-04-04T11:03:20",
            "2019-04-04 11:03:20Z",
            "2019-13-04T11:03:20Z",
            "2019-02-29T11:03:20Z",
            "2019-04-04T24:00:00Z",
            "2019-04-04T11:03:20.Z",
            "2019-04-04T11:03:20.1234567890Z",
            "2019-04-04T11:03:20+0100",
            "2019-04-04T11:03:20Zjunk"}) {
        EXPECT_FALSE(parseRfc3339Nano(bad).has_value()) << bad;
    }
    EXPECT_TRUE(parseRfc3339Nano("2020-02-29T00:00:00Z").has_value());
}

TEST(TimeFormatTest, FormatsTrimmedFraction) {
    EXPECT_EQ(formatRfc3339Nano(1554375800000000000LL), "2019-04-04T11:03:20Z");
    EXPECT_EQ(formatRfc3339Nano(1554375800500000000LL), "2019-04-04T11:03:20.5Z");
    EXPECT_EQ(formatRfc3339Nano(1554375800000000001LL), "2019-04-04T11:03:20.000000001Z");
    EXPECT_EQ(formatRfc3339Nano(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatRfc3339Nano(-500000000LL), "1969-12-31T23:59:59.5Z");
}

TEST(TimeFormatTest, FormatParsesBack) {
    for (int64_t ns : {1554375800123456789LL, 1LL, 1700000000000000000LL}) {
        EXPECT_EQ(parseRfc3339Nano(formatRfc3339Nano(ns)), ns);
    }
}
