#include <gtest/gtest.h>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <cstring>
#include <limits>

using namespace dexbook;

TEST(TypesTest, NowNsReturnsIncreasingValues) {
    Timestamp t1 = now_ns();
    Timestamp t2 = now_ns();
    EXPECT_GE(t2, t1);
}

TEST(TypesTest, OppositeSide) {
    static_assert(opposite_side(Side::Buy) == Side::Sell);
    static_assert(opposite_side(Side::Sell) == Side::Buy);
    EXPECT_STREQ(to_string(Side::Buy), "BUY");
    EXPECT_STREQ(to_string(Side::Sell), "SELL");
}

TEST(TypesTest, CrossingRule) {
    // Buy taker trades at or above the ask
    EXPECT_TRUE(crosses(Side::Buy, 100, 100));
    EXPECT_TRUE(crosses(Side::Buy, 101, 100));
    EXPECT_FALSE(crosses(Side::Buy, 99, 100));
    // Sell taker trades at or below the bid
    EXPECT_TRUE(crosses(Side::Sell, 100, 100));
    EXPECT_TRUE(crosses(Side::Sell, 99, 100));
    EXPECT_FALSE(crosses(Side::Sell, 101, 100));
}

TEST(TypesTest, CheckedArithmetic) {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(checked_mul(100, 10).value_or(0), 1000u);
    EXPECT_EQ(checked_mul(MAX, 1).value_or(0), MAX);
    EXPECT_FALSE(checked_mul(MAX, 2).has_value());
    EXPECT_FALSE(checked_mul(uint64_t{1} << 32, uint64_t{1} << 32).has_value());
    EXPECT_EQ(checked_mul(0, MAX).value_or(1), 0u);

    EXPECT_EQ(checked_add(MAX - 1, 1).value_or(0), MAX);
    EXPECT_FALSE(checked_add(MAX, 1).has_value());
}

TEST(TypesTest, PowerOfTwo) {
    EXPECT_FALSE(is_power_of_two(0));
    EXPECT_TRUE(is_power_of_two(1));
    EXPECT_TRUE(is_power_of_two(65536));
    EXPECT_FALSE(is_power_of_two(1000));
}

TEST(TypesTest, ErrorNames) {
    EXPECT_STREQ(to_string(DexError::None), "None");
    EXPECT_STREQ(to_string(DexError::MakerAccountMismatch), "MakerAccountMismatch");
    EXPECT_STREQ(to_string(DexError::BookFull), "BookFull");
    EXPECT_STREQ(to_string(TransferStatus::InsufficientFunds), "InsufficientFunds");

    for (size_t i = 0; i < DEX_ERROR_COUNT; ++i) {
        EXPECT_GT(std::strlen(to_string(static_cast<DexError>(i))), 0u);
    }
}

TEST(TypesTest, PinNegativeCoreIsNoop) {
    EXPECT_FALSE(pin_thread_to_core(-1));
}
