#include <gtest/gtest.h>
#include "../../src/export/time_parse.h"

using namespace Stabping;

TEST(TimeParseTest, FullDatetime) {
	EXPECT_EQ(ParseUtcDatetime("2024-01-15 12:30:45"), 1705321845);
	EXPECT_EQ(ParseUtcDatetime("1970-01-01 00:16:40"), 1000);
}

TEST(TimeParseTest, MinutePrecision) {
	EXPECT_EQ(ParseUtcDatetime("2024-01-15 12:30"), 1705321800);
}

TEST(TimeParseTest, DateOnlyIsMidnightUtc) {
	EXPECT_EQ(ParseUtcDatetime("2024-01-15"), 1705276800);
	EXPECT_EQ(ParseUtcDatetime("1970-01-01"), 0);
	EXPECT_EQ(ParseUtcDatetime("2024-02-29"), 1709164800);
}

TEST(TimeParseTest, RejectsMalformed) {
	EXPECT_FALSE(ParseUtcDatetime("").has_value());
	EXPECT_FALSE(ParseUtcDatetime("yesterday").has_value());
	EXPECT_FALSE(ParseUtcDatetime("2024-01-15T12:30:45").has_value());
	EXPECT_FALSE(ParseUtcDatetime("2024-01-15 12:30:45 extra").has_value());
	EXPECT_FALSE(ParseUtcDatetime("2024-13-01").has_value());
	EXPECT_FALSE(ParseUtcDatetime("2024-01-15 25:00").has_value());
	EXPECT_FALSE(ParseUtcDatetime(" 2024-01-15").has_value());
	EXPECT_FALSE(ParseUtcDatetime("24-01-15").has_value());
}

TEST(TimeParseTest, RejectsDayPastEndOfMonth) {
	EXPECT_FALSE(ParseUtcDatetime("2023-02-29").has_value());
	EXPECT_FALSE(ParseUtcDatetime("2024-04-31 10:00").has_value());
}
