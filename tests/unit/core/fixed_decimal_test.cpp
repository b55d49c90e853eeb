#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "tally_reports/core/fixed_decimal.h"

namespace tally_reports {

TEST(FixedDecimalTest, ParseScaledIsExactForTypicalAmounts) {
    std::int64_t value = 0;
    std::string error;
    ASSERT_TRUE(FixedDecimal::ParseScaled("1234.50", 2, FixedRoundingMode::kHalfUp, &value,
                                          &error));
    EXPECT_EQ(value, 123450);
    ASSERT_TRUE(FixedDecimal::ParseScaled("-0.1", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_EQ(value, -10);
    ASSERT_TRUE(FixedDecimal::ParseScaled("1,00,000", 2, FixedRoundingMode::kHalfUp, &value,
                                          &error));
    EXPECT_EQ(value, 10000000);
    ASSERT_TRUE(FixedDecimal::ParseScaled(" +7 ", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_EQ(value, 700);
    ASSERT_TRUE(FixedDecimal::ParseScaled(".5", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_EQ(value, 50);
}

TEST(FixedDecimalTest, ParseScaledSupportsHalfUpDownAndUp) {
    std::int64_t value = 0;
    std::string error;
    ASSERT_TRUE(FixedDecimal::ParseScaled("1.234", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_EQ(value, 123);
    ASSERT_TRUE(FixedDecimal::ParseScaled("1.235", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_EQ(value, 124);
    ASSERT_TRUE(FixedDecimal::ParseScaled("1.239", 2, FixedRoundingMode::kDown, &value, &error));
    EXPECT_EQ(value, 123);
    ASSERT_TRUE(FixedDecimal::ParseScaled("1.231", 2, FixedRoundingMode::kUp, &value, &error));
    EXPECT_EQ(value, 124);
    ASSERT_TRUE(FixedDecimal::ParseScaled("-1.235", 2, FixedRoundingMode::kHalfUp, &value,
                                          &error));
    EXPECT_EQ(value, -124);
}

TEST(FixedDecimalTest, ParseScaledRejectsGarbageAndOverflow) {
    std::int64_t value = 0;
    std::string error;
    EXPECT_FALSE(FixedDecimal::ParseScaled("", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_FALSE(FixedDecimal::ParseScaled("12a", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_NE(error.find("invalid decimal"), std::string::npos);
    EXPECT_FALSE(FixedDecimal::ParseScaled("-", 2, FixedRoundingMode::kHalfUp, &value, &error));
    EXPECT_FALSE(FixedDecimal::ParseScaled("1.2.3", 2, FixedRoundingMode::kHalfUp, &value,
                                           &error));
    EXPECT_FALSE(FixedDecimal::ParseScaled("99999999999999999999", 2, FixedRoundingMode::kHalfUp,
                                           &value, &error));
    EXPECT_NE(error.find("out of range"), std::string::npos);
}

TEST(FixedDecimalTest, RescaleKeepsSemanticValueWithConfiguredRounding) {
    const std::int64_t scaled_4 = 12345;  // 1.2345
    EXPECT_EQ(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kHalfUp), 123);
    EXPECT_EQ(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kUp), 124);
    EXPECT_EQ(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kDown), 123);
    EXPECT_EQ(FixedDecimal::Rescale(123, 2, 4, FixedRoundingMode::kHalfUp), 12300);
}

TEST(FixedDecimalTest, FormatScaledPadsFractionAndKeepsSign) {
    EXPECT_EQ(FixedDecimal::FormatScaled(123450, 2), "1234.50");
    EXPECT_EQ(FixedDecimal::FormatScaled(-1250, 2), "-12.50");
    EXPECT_EQ(FixedDecimal::FormatScaled(-5, 2), "-0.05");
    EXPECT_EQ(FixedDecimal::FormatScaled(0, 2), "0.00");
    EXPECT_EQ(FixedDecimal::FormatScaled(42, 0), "42");
}

}  // namespace tally_reports
