/**
 * @file MoneyTest.cpp
 * @brief Unit-тесты для Money (фиксированная точка, 4 знака)
 */

#include <gtest/gtest.h>
#include "domain/Money.hpp"
#include <limits>

using namespace inventory::domain;

// ============================================================================
// PARSING
// ============================================================================

TEST(MoneyTest, FromString_ParsesWholeAndFraction) {
    EXPECT_EQ(Money::fromString("12.5").scaled(), 125000);
    EXPECT_EQ(Money::fromString("3").scaled(), 30000);
    EXPECT_EQ(Money::fromString("-0.0075").scaled(), -75);
    EXPECT_EQ(Money::fromString("+1.25").scaled(), 12500);
}

TEST(MoneyTest, FromString_RejectsGarbage) {
    EXPECT_THROW(Money::fromString(""), std::invalid_argument);
    EXPECT_THROW(Money::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Money::fromString("-"), std::invalid_argument);
}

TEST(MoneyTest, FromString_RejectsMoreThanFourDigits) {
    EXPECT_THROW(Money::fromString("0.00001"), std::invalid_argument);
}

TEST(MoneyTest, FromString_RejectsOutOfRangeAmount) {
    EXPECT_EQ(Money::fromString("922337203685477.5807").scaled(), std::numeric_limits<int64_t>::max());
    EXPECT_THROW(Money::fromString("922337203685477.5808"), ValidationError);
    EXPECT_THROW(Money::fromString("99999999999999999999999999"), ValidationError);
    EXPECT_THROW(Money::fromDouble(1e300), ValidationError);
}

TEST(MoneyTest, Arithmetic_ThrowsOnOverflow) {
    Money max = Money::fromScaled(std::numeric_limits<int64_t>::max());

    EXPECT_THROW(max + Money::fromScaled(1), ValidationError);
    EXPECT_THROW(-max - Money::fromScaled(2), ValidationError);
    EXPECT_THROW(Money::fromUnits(2) * std::numeric_limits<int64_t>::max(), ValidationError);
    EXPECT_THROW(Money::fromUnits(std::numeric_limits<int64_t>::max()), ValidationError);

    Money total = Money::fromUnits(1);
    EXPECT_THROW(total += max, ValidationError);
    EXPECT_EQ(total, Money::fromUnits(1));
}

TEST(MoneyTest, DividedBy_HugeDivisorDoesNotOverflow) {
    int64_t divisor = std::numeric_limits<int64_t>::max() - 1;
    EXPECT_EQ(Money::fromScaled(std::numeric_limits<int64_t>::max() / 2 - 1).dividedBy(divisor), Money::fromScaled(0));
    EXPECT_EQ(Money::fromScaled(std::numeric_limits<int64_t>::max() - 2).dividedBy(divisor), Money::fromScaled(1));
}

TEST(MoneyTest, FromDouble_RoundsToScale) {
    EXPECT_EQ(Money::fromDouble(2.5), Money::fromString("2.5"));
    EXPECT_EQ(Money::fromDouble(0.1 + 0.2), Money::fromString("0.3"));
}

// ============================================================================
// ARITHMETIC
// ============================================================================

TEST(MoneyTest, Arithmetic_IsExact) {
    Money a = Money::fromString("0.1");
    Money b = Money::fromString("0.2");

    EXPECT_EQ(a + b, Money::fromString("0.3"));
    EXPECT_EQ(b - a, a);
    EXPECT_EQ(a * 3, Money::fromString("0.3"));
    EXPECT_EQ(-a, Money::fromString("-0.1"));

    Money sum;
    sum += b;
    sum -= a;
    EXPECT_EQ(sum, a);
}

TEST(MoneyTest, DividedBy_RoundsHalfAwayFromZero) {
    EXPECT_EQ(Money::fromUnits(10).dividedBy(3), Money::fromString("3.3333"));
    EXPECT_EQ(Money::fromUnits(20).dividedBy(3), Money::fromString("6.6667"));
    EXPECT_EQ(Money::fromUnits(-20).dividedBy(3), Money::fromString("-6.6667"));
    EXPECT_THROW(Money::fromUnits(1).dividedBy(0), std::invalid_argument);
}

TEST(MoneyTest, RoundToCents) {
    EXPECT_EQ(Money::fromString("1.005").roundToCents(), Money::fromString("1.01"));
    EXPECT_EQ(Money::fromString("1.0049").roundToCents(), Money::fromString("1.00"));
    EXPECT_EQ(Money::fromString("-1.005").roundToCents(), Money::fromString("-1.01"));
}

// ============================================================================
// FORMATTING
// ============================================================================

TEST(MoneyTest, ToString_UsesRequestedDigits) {
    Money m = Money::fromString("1234.5678");

    EXPECT_EQ(m.toString(), "1234.5678");
    EXPECT_EQ(m.toString(2), "1234.57");
    EXPECT_EQ(m.toString(0), "1235");
    EXPECT_EQ(Money::fromString("-0.5").toString(2), "-0.50");
    EXPECT_THROW(m.toString(5), std::invalid_argument);
}

TEST(MoneyTest, SignPredicates) {
    EXPECT_TRUE(Money().isZero());
    EXPECT_TRUE(Money::fromUnits(-1).isNegative());
    EXPECT_TRUE(Money::fromUnits(1).isPositive());
    EXPECT_DOUBLE_EQ(Money::fromString("2.25").toDouble(), 2.25);
}
