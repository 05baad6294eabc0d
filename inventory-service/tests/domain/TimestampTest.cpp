/**
 * @file TimestampTest.cpp
 * @brief Unit-тесты для Timestamp
 */

#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"

using namespace inventory::domain;

TEST(TimestampTest, FromString_DateOnlyIsMidnightUtc) {
    auto ts = Timestamp::fromString("2025-01-02");
    EXPECT_EQ(ts.toString(), "2025-01-02T00:00:00.000Z");
}

TEST(TimestampTest, FromString_KeepsMilliseconds) {
    auto ts = Timestamp::fromString("2025-12-16T10:30:00.250Z");
    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00.250Z");
    EXPECT_EQ(ts.toUnixMillis() % 1000, 250);
}

TEST(TimestampTest, FromString_WithoutFraction) {
    auto ts = Timestamp::fromString("2025-12-16T10:30:00Z");
    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00.000Z");
}

TEST(TimestampTest, FromString_AppliesZoneOffset) {
    EXPECT_EQ(Timestamp::fromString("2025-01-01T10:00:00+03:00").toString(), "2025-01-01T07:00:00.000Z");
    EXPECT_EQ(Timestamp::fromString("2025-01-01T10:00:00.500-05:30").toString(), "2025-01-01T15:30:00.500Z");
    EXPECT_EQ(Timestamp::fromString("2025-01-01T01:00:00+02:00").toString(), "2024-12-31T23:00:00.000Z");
    EXPECT_NE(Timestamp::fromString("2025-01-01T10:00:00+03:00"), Timestamp::fromString("2025-01-01T10:00:00Z"));
}

TEST(TimestampTest, FromString_WithoutZoneIsUtc) {
    EXPECT_EQ(Timestamp::fromString("2025-01-01T10:00:00"), Timestamp::fromString("2025-01-01T10:00:00Z"));
}

TEST(TimestampTest, FromString_RejectsTrailingCharacters) {
    EXPECT_FALSE(Timestamp::tryParse("2025-01-01T10:00:00garbage").has_value());
    EXPECT_FALSE(Timestamp::tryParse("2025-01-01T10:00:00Zx").has_value());
    EXPECT_FALSE(Timestamp::tryParse("2025-01-01T10:00:00+0300").has_value());
    EXPECT_FALSE(Timestamp::tryParse("2025-01-01T10:00:00+25:00").has_value());
    EXPECT_FALSE(Timestamp::tryParse("2025-01-01T10:00:00.Z").has_value());
    EXPECT_THROW(Timestamp::fromString("2025-01-01X"), std::invalid_argument);
}

TEST(TimestampTest, InvalidString) {
    EXPECT_FALSE(Timestamp::tryParse("yesterday").has_value());
    EXPECT_THROW(Timestamp::fromString("not-a-date"), std::invalid_argument);
}

TEST(TimestampTest, ArithmeticAndOrdering) {
    auto base = Timestamp::fromUnixSeconds(1'700'000'000);

    EXPECT_EQ(base.addSeconds(60).toUnixSeconds(), 1'700'000'060);
    EXPECT_EQ(base.addHours(1).toUnixSeconds(), 1'700'003'600);
    EXPECT_EQ(base.addDays(1).toUnixSeconds(), 1'700'086'400);
    EXPECT_LT(base, base.addSeconds(1));
    EXPECT_EQ(Timestamp::fromUnixMillis(base.toUnixMillis()), base);
}
