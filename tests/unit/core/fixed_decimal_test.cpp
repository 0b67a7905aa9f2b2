#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "tx_ledger/core/fixed_decimal.h"

namespace tx_ledger {

TEST(FixedDecimalTest, ParseScalesPlainDecimals) {
    std::int64_t value = 0;
    ASSERT_TRUE(FixedDecimal::Parse("1.05", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 10500);
    ASSERT_TRUE(FixedDecimal::Parse("7", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 70000);
    ASSERT_TRUE(FixedDecimal::Parse(".5", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 5000);
    ASSERT_TRUE(FixedDecimal::Parse("-12.3456", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, -123456);
    ASSERT_TRUE(FixedDecimal::Parse("+3.", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 30000);
}

TEST(FixedDecimalTest, ParseSupportsHalfUpDownAndUp) {
    std::int64_t value = 0;
    ASSERT_TRUE(FixedDecimal::Parse("1.234", 2, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 123);
    ASSERT_TRUE(FixedDecimal::Parse("1.235", 2, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 124);
    ASSERT_TRUE(FixedDecimal::Parse("1.239", 2, FixedRoundingMode::kDown, &value));
    EXPECT_EQ(value, 123);
    ASSERT_TRUE(FixedDecimal::Parse("1.231", 2, FixedRoundingMode::kUp, &value));
    EXPECT_EQ(value, 124);
    ASSERT_TRUE(FixedDecimal::Parse("-1.235", 2, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, -124);
    ASSERT_TRUE(FixedDecimal::Parse("-1.231", 2, FixedRoundingMode::kDown, &value));
    EXPECT_EQ(value, -124);
}

TEST(FixedDecimalTest, ParseRejectsMalformedAndOverflowingText) {
    std::int64_t value = 42;
    EXPECT_FALSE(FixedDecimal::Parse("", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(FixedDecimal::Parse(".", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(FixedDecimal::Parse("-", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(FixedDecimal::Parse("1.2.3", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(FixedDecimal::Parse("abc", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(FixedDecimal::Parse("1e5", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_FALSE(
        FixedDecimal::Parse("99999999999999999999", 4, FixedRoundingMode::kHalfUp, &value));
    EXPECT_EQ(value, 42);
}

TEST(FixedDecimalTest, TryParseSeparatesOutOfRangeFromMalformed) {
    std::int64_t value = 7;
    EXPECT_EQ(FixedDecimal::TryParse("1000000000000000", 4, FixedRoundingMode::kHalfUp, &value),
              FixedParseStatus::kOutOfRange);
    EXPECT_EQ(FixedDecimal::TryParse("-99999999999999999999.5", 4, FixedRoundingMode::kHalfUp,
                                     &value),
              FixedParseStatus::kOutOfRange);
    EXPECT_EQ(FixedDecimal::TryParse("99999999999999999999x", 4, FixedRoundingMode::kHalfUp,
                                     &value),
              FixedParseStatus::kMalformed);
    EXPECT_EQ(FixedDecimal::TryParse("", 4, FixedRoundingMode::kHalfUp, &value),
              FixedParseStatus::kMalformed);
    EXPECT_EQ(value, 7);

    EXPECT_EQ(FixedDecimal::TryParse("922337203685477.5807", 4, FixedRoundingMode::kHalfUp,
                                     &value),
              FixedParseStatus::kOk);
    EXPECT_EQ(value, std::numeric_limits<std::int64_t>::max());
}

TEST(FixedDecimalTest, CheckedArithmeticRejectsOverflow) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    std::int64_t out = 11;
    EXPECT_FALSE(FixedDecimal::CheckedAdd(kMax, 1, &out));
    EXPECT_FALSE(FixedDecimal::CheckedSub(kMin, 1, &out));
    EXPECT_FALSE(FixedDecimal::CheckedSub(0, kMin, &out));
    EXPECT_EQ(out, 11);

    ASSERT_TRUE(FixedDecimal::CheckedAdd(kMax - 1, 1, &out));
    EXPECT_EQ(out, kMax);
    ASSERT_TRUE(FixedDecimal::CheckedSub(-5, 10, &out));
    EXPECT_EQ(out, -15);
}

TEST(FixedDecimalTest, FormatAlwaysPrintsRequestedFractionDigits) {
    EXPECT_EQ(FixedDecimal::Format(10500, 4), "1.0500");
    EXPECT_EQ(FixedDecimal::Format(0, 4), "0.0000");
    EXPECT_EQ(FixedDecimal::Format(-5, 4), "-0.0005");
    EXPECT_EQ(FixedDecimal::Format(15000005, 4), "1500.0005");
    EXPECT_EQ(FixedDecimal::Format(12, 0), "12");
    EXPECT_EQ(FixedDecimal::Format(std::numeric_limits<std::int64_t>::min(), 4),
              "-922337203685477.5808");
}

TEST(FixedDecimalTest, RescaleKeepsSemanticValueWithConfiguredRounding) {
    const std::int64_t scaled_4 = 12345;  // 1.2345
    std::int64_t out = 0;
    ASSERT_TRUE(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kHalfUp, &out));
    EXPECT_EQ(out, 123);
    ASSERT_TRUE(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kUp, &out));
    EXPECT_EQ(out, 124);
    ASSERT_TRUE(FixedDecimal::Rescale(scaled_4, 4, 2, FixedRoundingMode::kDown, &out));
    EXPECT_EQ(out, 123);
    ASSERT_TRUE(FixedDecimal::Rescale(12, 2, 4, FixedRoundingMode::kHalfUp, &out));
    EXPECT_EQ(out, 1200);
    EXPECT_FALSE(FixedDecimal::Rescale(std::numeric_limits<std::int64_t>::max(), 0, 4,
                                       FixedRoundingMode::kHalfUp, &out));
}

TEST(FixedDecimalTest, ToLongDoubleRestoresScaledValue) {
    constexpr std::int64_t scaled = 987654;
    const auto restored = FixedDecimal::ToLongDouble(scaled, 3);
    EXPECT_NEAR(static_cast<double>(restored), 987.654, 1e-9);
}

}  // namespace tx_ledger
