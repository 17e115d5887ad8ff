#include <gtest/gtest.h>
#include "../fixtures/engine_fixture.hpp"

using namespace dexbook;
using dexbook::testing::EngineFixture;

class CancelTest : public EngineFixture {};

TEST_F(CancelTest, CancelBidRefundsQuoteOnce) {
    auto placed = buy(alice_, 100, 10);
    ASSERT_TRUE(placed.ok());
    ASSERT_EQ(quote_of(alice_), QUOTE_FUNDS - 1000);

    EXPECT_EQ(engine_->cancel(*book_, placed.resting_order_id, alice_), DexError::None);
    EXPECT_EQ(book_->order_count(), 0u);
    EXPECT_FALSE(book_->best_bid().has_value());
    EXPECT_EQ(quote_of(alice_), QUOTE_FUNDS);
    EXPECT_EQ(ledger_.balance(params_.quote_custody), 0u);

    EXPECT_EQ(engine_->cancel(*book_, placed.resting_order_id, alice_), DexError::OrderNotFound);
    EXPECT_EQ(quote_of(alice_), QUOTE_FUNDS);
}

TEST_F(CancelTest, CancelAskRefundsRemainingBase) {
    auto placed = sell(bob_, 100, 20);
    ASSERT_TRUE(buy(alice_, 100, 5).ok());   // bob's ask now holds 15

    EXPECT_EQ(engine_->cancel(*book_, placed.resting_order_id, bob_), DexError::None);
    EXPECT_EQ(base_of(bob_), BASE_FUNDS - 5);
    EXPECT_EQ(quote_of(bob_), QUOTE_FUNDS + 500);
    expect_custody_matches_book();
}

TEST_F(CancelTest, UnknownIdIsNotFoundAndChangesNothing) {
    ASSERT_TRUE(buy(alice_, 100, 10).ok());
    uint64_t calls_before = proxy_.calls();

    EXPECT_EQ(engine_->cancel(*book_, 42, alice_), DexError::OrderNotFound);
    EXPECT_EQ(engine_->cancel(*book_, NO_ORDER, alice_), DexError::OrderNotFound);
    EXPECT_EQ(proxy_.calls(), calls_before);
    EXPECT_EQ(book_->order_count(), 1u);
}

TEST_F(CancelTest, FilledOrderCannotBeCancelled) {
    auto placed = sell(bob_, 100, 5);
    ASSERT_TRUE(buy(alice_, 100, 5).ok());
    EXPECT_EQ(engine_->cancel(*book_, placed.resting_order_id, bob_), DexError::OrderNotFound);
}

TEST_F(CancelTest, NonOwnerIsRejected) {
    auto placed = buy(alice_, 100, 10);
    uint64_t calls_before = proxy_.calls();

    EXPECT_EQ(engine_->cancel(*book_, placed.resting_order_id, bob_), DexError::OrderNotOwned);
    EXPECT_EQ(proxy_.calls(), calls_before);
    ASSERT_NE(book_->find(placed.resting_order_id), nullptr);
    EXPECT_EQ(quote_of(bob_), QUOTE_FUNDS);
}

TEST_F(CancelTest, IdsAreNotReusedAfterCancel) {
    auto first = buy(alice_, 100, 1);
    ASSERT_EQ(engine_->cancel(*book_, first.resting_order_id, alice_), DexError::None);
    auto second = buy(alice_, 100, 1);
    EXPECT_GT(second.resting_order_id, first.resting_order_id);
}

TEST_F(CancelTest, FailedRefundPutsOrderBack) {
    auto first = buy(alice_, 100, 10);   // id 1
    auto later = buy(bob_, 100, 10);     // id 2, same level
    proxy_.fail_transfer_at = proxy_.transfer_calls + 1;

    EXPECT_EQ(engine_->cancel(*book_, first.resting_order_id, alice_), DexError::TransferError);
    EXPECT_EQ(quote_of(alice_), QUOTE_FUNDS - 1000);

    // Restored with its id, still ahead of the later order
    auto bids = book_->orders(Side::Buy);
    ASSERT_EQ(bids.size(), 2u);
    EXPECT_EQ(bids[0].order_id, first.resting_order_id);
    EXPECT_EQ(bids[1].order_id, later.resting_order_id);
    expect_custody_matches_book();
}

TEST_F(CancelTest, CancelledOrderNoLongerMatches) {
    auto placed = sell(bob_, 100, 5);
    ASSERT_EQ(engine_->cancel(*book_, placed.resting_order_id, bob_), DexError::None);

    auto out = buy(alice_, 100, 5);
    ASSERT_TRUE(out.ok());
    EXPECT_TRUE(out.fills.empty());
    EXPECT_NE(out.resting_order_id, NO_ORDER);
}
