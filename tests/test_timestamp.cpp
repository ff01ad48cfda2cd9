#include <gtest/gtest.h>

#include "timestamp.hpp"

TEST(Timestamp, ParsesOffsetAndKeepsLocalWallClock) {
    Timestamp ts;
    ASSERT_TRUE(parseTimestamp("2025-07-28T21:15:04.120+09:00", ts));
    EXPECT_TRUE(ts.hasOffset);
    EXPECT_EQ(ts.offsetMinutes, 540);
    EXPECT_EQ(localHour(ts), 21);
    EXPECT_EQ(localDate(ts), "2025-07-28");
    EXPECT_EQ(compactDate(ts), "20250728");
    EXPECT_EQ(formatTimestamp(ts), "2025-07-28T21:15:04.120+09:00");
}

TEST(Timestamp, OffsetShiftsTheInstant) {
    Timestamp tokyo, utc;
    ASSERT_TRUE(parseTimestamp("2025-07-28T09:00:00+09:00", tokyo));
    ASSERT_TRUE(parseTimestamp("2025-07-28T00:00:00Z", utc));
    EXPECT_EQ(tokyo, utc);
    EXPECT_EQ(localHour(tokyo), 9);
    EXPECT_EQ(localHour(utc), 0);
}

TEST(Timestamp, EpochOrigin) {
    EXPECT_EQ(makeTimestamp(1970, 1, 1, 0, 0, 0).epochMs, 0);
    EXPECT_EQ(makeTimestamp(1970, 1, 2, 0, 0, 0).epochMs, TimeConst::MS_PER_DAY);
}

TEST(Timestamp, NaiveTimestampWithSpaceSeparator) {
    Timestamp ts;
    ASSERT_TRUE(parseTimestamp("2025-07-28 06:30:00", ts));
    EXPECT_FALSE(ts.hasOffset);
    EXPECT_EQ(localHour(ts), 6);
    EXPECT_EQ(formatTimestamp(ts), "2025-07-28T06:30:00.000");
}

TEST(Timestamp, CompactOffsetAndLongFraction) {
    Timestamp ts;
    ASSERT_TRUE(parseTimestamp("2025-07-28T10:00:00.123456-0230", ts));
    EXPECT_EQ(ts.offsetMinutes, -150);
    EXPECT_EQ(localMsOfDay(ts), 10 * TimeConst::MS_PER_HOUR + 123);
}

TEST(Timestamp, RejectsMalformedText) {
    Timestamp ts;
    EXPECT_FALSE(parseTimestamp("", ts));
    EXPECT_FALSE(parseTimestamp("not a time", ts));
    EXPECT_FALSE(parseTimestamp("2025-02-30T00:00:00", ts));
    EXPECT_FALSE(parseTimestamp("2025-07-28T25:00:00", ts));
    EXPECT_FALSE(parseTimestamp("2025-07-28T10:00:00+0x", ts));
    EXPECT_FALSE(parseTimestamp("2025-07-28T10:00:00 trailing", ts));
}

TEST(Timestamp, LocalDateDiffersFromUtcDate) {
    Timestamp ts;
    ASSERT_TRUE(parseTimestamp("2025-07-28T23:30:00-02:00", ts));
    EXPECT_EQ(localDate(ts), "2025-07-28");
    EXPECT_EQ(localHour(ts), 23);

    Timestamp utc = ts;
    utc.offsetMinutes = 0;
    EXPECT_EQ(localDate(utc), "2025-07-29");
}

TEST(Timestamp, MinutesBetween) {
    Timestamp a = makeTimestamp(2025, 7, 28, 10, 0, 0);
    Timestamp b = makeTimestamp(2025, 7, 28, 10, 1, 30);
    EXPECT_DOUBLE_EQ(minutesBetween(a, b), 1.5);
    EXPECT_DOUBLE_EQ(minutesBetween(b, a), -1.5);
}
