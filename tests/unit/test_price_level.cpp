#include <gtest/gtest.h>
#include "order_book/price_level.hpp"
#include <vector>

using namespace dexbook;

namespace {

BookEntry make_entry(OrderId id, Quantity qty) {
    return BookEntry{Order{1, 100, qty, id}, Side::Sell, nullptr, nullptr};
}

std::vector<OrderId> ids(const PriceLevel& level) {
    std::vector<OrderId> out;
    for (const BookEntry* e = level.front(); e; e = e->next) out.push_back(e->order.order_id);
    return out;
}

} // anonymous namespace

TEST(PriceLevelTest, AppendsInArrivalOrder) {
    PriceLevel level;
    BookEntry a = make_entry(1, 10), b = make_entry(2, 20), c = make_entry(3, 30);
    level.insert(&a);
    level.insert(&b);
    level.insert(&c);

    EXPECT_EQ(ids(level), (std::vector<OrderId>{1, 2, 3}));
    EXPECT_EQ(level.total_quantity, 60u);
    EXPECT_EQ(level.order_count, 3u);
    EXPECT_EQ(level.tail, &c);
}

TEST(PriceLevelTest, ReinsertedFrontKeepsPriority) {
    PriceLevel level;
    BookEntry a = make_entry(1, 10), b = make_entry(2, 20);
    level.insert(&a);
    level.insert(&b);

    level.remove(&a);
    a.order.quantity = 4;
    level.insert(&a);

    EXPECT_EQ(ids(level), (std::vector<OrderId>{1, 2}));
    EXPECT_EQ(level.total_quantity, 24u);
}

TEST(PriceLevelTest, InsertsIntoMiddleById) {
    PriceLevel level;
    BookEntry a = make_entry(1, 1), c = make_entry(5, 1), b = make_entry(3, 1);
    level.insert(&a);
    level.insert(&c);
    level.insert(&b);
    EXPECT_EQ(ids(level), (std::vector<OrderId>{1, 3, 5}));
    EXPECT_EQ(level.tail->prev, &b);
}

TEST(PriceLevelTest, RemoveMiddleAndLast) {
    PriceLevel level;
    BookEntry a = make_entry(1, 1), b = make_entry(2, 2), c = make_entry(3, 3);
    level.insert(&a);
    level.insert(&b);
    level.insert(&c);

    level.remove(&b);
    EXPECT_EQ(ids(level), (std::vector<OrderId>{1, 3}));
    level.remove(&c);
    level.remove(&a);
    EXPECT_TRUE(level.empty());
    EXPECT_EQ(level.total_quantity, 0u);
    EXPECT_EQ(level.order_count, 0u);
    EXPECT_EQ(level.tail, nullptr);
}
