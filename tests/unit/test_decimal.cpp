#include <gtest/gtest.h>
#include "common/decimal.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

using namespace pmm;

TEST(DecimalTest, ParseBasicForms) {
    EXPECT_EQ(dec("1.5"), Decimal(3) / Decimal(2));
    EXPECT_EQ(dec("-0.25").to_string(), "-0.25");
    EXPECT_EQ(dec("+3"), Decimal(3));
    EXPECT_EQ(dec(".5").to_string(), "0.5");
    EXPECT_EQ(dec("0.00001"), dec("1e-5"));
    EXPECT_EQ(dec("2.5E2"), Decimal(250));
    EXPECT_TRUE(dec("0").is_zero());
    EXPECT_EQ(Decimal::from_raw(1).to_string(), "0.000000000000000001");
}

TEST(DecimalTest, ParseRoundsBeyondEighteenthPlace) {
    EXPECT_EQ(dec("0.0000000000000000015"), Decimal::from_raw(2));   // half away from zero
    EXPECT_EQ(dec("0.0000000000000000014"), Decimal::from_raw(1));
    EXPECT_EQ(dec("-0.0000000000000000015"), Decimal::from_raw(-2));
    EXPECT_EQ(dec("0.0000000000000000005"), Decimal::from_raw(1));
    EXPECT_TRUE(dec("0.0000000000000000004").is_zero());
}

TEST(DecimalTest, ParseRejectsMalformed) {
    EXPECT_FALSE(Decimal::parse("").has_value());
    EXPECT_FALSE(Decimal::parse("abc").has_value());
    EXPECT_FALSE(Decimal::parse("1.2.3").has_value());
    EXPECT_FALSE(Decimal::parse("1e").has_value());
    EXPECT_FALSE(Decimal::parse("-").has_value());
    EXPECT_FALSE(Decimal::parse("1e21").has_value()); // out of range
    EXPECT_THROW(dec("nope"), std::invalid_argument);
}

TEST(DecimalTest, LargeValuesParse) {
    EXPECT_EQ(dec("1e20").to_string(), "100000000000000000000");
    EXPECT_EQ(dec("-12345678901234567890.123456789012345678").to_string(),
              "-12345678901234567890.123456789012345678");
}

TEST(DecimalTest, FromDouble) {
    EXPECT_EQ(*Decimal::from_double(0.002), dec("0.002"));
    EXPECT_EQ(*Decimal::from_double(3000.0), Decimal(3000));
    EXPECT_EQ(*Decimal::from_double(-1.25), dec("-1.25"));

    EXPECT_FALSE(Decimal::from_double(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(Decimal::from_double(std::numeric_limits<double>::infinity()).has_value());
    EXPECT_FALSE(Decimal::from_double(1e21).has_value());
}

TEST(DecimalTest, Arithmetic) {
    EXPECT_EQ(dec("0.002") * dec("0.012"), dec("0.000024"));
    EXPECT_EQ(dec("1.5") + dec("2.25"), dec("3.75"));
    EXPECT_EQ(dec("1.5") - dec("2.25"), dec("-0.75"));
    EXPECT_EQ(Decimal(1) / Decimal(4), dec("0.25"));
    EXPECT_EQ(dec("-3") / Decimal(2), dec("-1.5"));
    EXPECT_EQ(-dec("2"), dec("-2"));

    Decimal x = Decimal(10);
    x -= dec("0.5");
    x *= Decimal(2);
    EXPECT_EQ(x, Decimal(19));
}

TEST(DecimalTest, SmallPriceTimesSpreadKeepsEveryDigit) {
    Decimal ref = dec("0.00001234");
    EXPECT_EQ(ref * (Decimal(1) - dec("0.000024")), dec("0.00001233970384"));
    EXPECT_EQ(ref * (Decimal(1) + dec("0.000012")), dec("0.00001234014808"));
}

TEST(DecimalTest, LargeProductsDoNotWrap) {
    EXPECT_EQ(dec("200000") * dec("100000"), Decimal(20'000'000'000));
    EXPECT_EQ(dec("1e10") * dec("1e10"), dec("1e20"));
    EXPECT_EQ(dec("123456789.123456789") * dec("-987654321.5"),
              dec("-121932631296296294.6743636635"));
}

TEST(DecimalTest, OverflowThrows) {
    Decimal big = dec("1e20");
    EXPECT_THROW(big + big, std::overflow_error);
    EXPECT_THROW(-big - big, std::overflow_error);
    EXPECT_THROW(dec("1e15") * dec("1e6"), std::overflow_error);
    EXPECT_THROW(big / dec("0.1"), std::overflow_error);
    EXPECT_THROW(Decimal::div_down(big, dec("0.001")), std::overflow_error);

    Decimal sum = big;
    EXPECT_THROW(sum += big, std::overflow_error);
    EXPECT_EQ(sum, big);
}

TEST(DecimalTest, DivisionRoundsHalfAwayFromZero) {
    // 2/3 = 0.666666666666666666|67
    EXPECT_EQ(Decimal(2) / Decimal(3), dec("0.666666666666666667"));
    EXPECT_EQ(Decimal(-2) / Decimal(3), dec("-0.666666666666666667"));
    EXPECT_EQ(Decimal(2) / Decimal(-3), dec("-0.666666666666666667"));
    EXPECT_EQ(Decimal::div_down(Decimal(2), Decimal(3)), dec("0.666666666666666666"));
}

TEST(DecimalTest, DivisionByZeroThrows) {
    EXPECT_THROW(Decimal(1) / Decimal{}, std::domain_error);
    EXPECT_THROW(Decimal::div_down(Decimal(1), Decimal{}), std::domain_error);
}

TEST(DecimalTest, Comparisons) {
    EXPECT_LT(dec("0.00001"), dec("0.0001"));
    EXPECT_GT(dec("-0.5"), dec("-1"));
    EXPECT_LE(dec("1.0"), Decimal(1));
    EXPECT_NE(dec("1.000000000000000001"), Decimal(1));
    EXPECT_TRUE(dec("-0.1").is_negative());
    EXPECT_EQ(dec("-0.1").abs(), dec("0.1"));
}

TEST(DecimalTest, ToDouble) {
    EXPECT_DOUBLE_EQ(dec("3000.25").to_double(), 3000.25);
    EXPECT_DOUBLE_EQ(dec("-0.5").to_double(), -0.5);
    EXPECT_DOUBLE_EQ(dec("1e20").to_double(), 1e20);
}

TEST(DecimalTest, Formatting) {
    EXPECT_EQ(dec("0.000024").to_string(), "0.000024");
    EXPECT_EQ(Decimal(3000).to_string(), "3000");
    EXPECT_EQ(dec("-1.50").to_string(), "-1.5");
    EXPECT_EQ(Decimal(3000).to_string(2), "3000.00");
    EXPECT_EQ(dec("0.24").to_string(2), "0.24");
    EXPECT_EQ(dec("0.125").to_string(2), "0.13");
    EXPECT_EQ(dec("-0.125").to_string(2), "-0.13");
    EXPECT_EQ(dec("0.0100").to_string(4), "0.0100");
    EXPECT_EQ(dec("1.9999").to_string(0), "2");

    std::ostringstream os;
    os << dec("12.340");
    EXPECT_EQ(os.str(), "12.34");
}

TEST(DecimalTest, Rounded) {
    EXPECT_EQ(dec("3000.125").rounded(2), dec("3000.13"));
    EXPECT_EQ(dec("3000.124").rounded(2), dec("3000.12"));
    EXPECT_EQ(dec("1.23").rounded(18), dec("1.23"));
}
