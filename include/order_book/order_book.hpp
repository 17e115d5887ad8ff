#pragma once

#include "order_book/price_level.hpp"
#include "containers/object_pool.hpp"
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dexbook {

/// Identity of a book: the traded pair and the custody accounts that hold
/// every resting order's reserved funds.
struct BookParams {
    AssetId base_asset = 0;
    AssetId quote_asset = 0;
    AccountId base_custody = NO_ACCOUNT;
    AccountId quote_custody = NO_ACCOUNT;
    size_t max_orders_per_side = 1024;
};

/// Logical persisted layout. bids/asks are in priority order when produced
/// by snapshot(); restore() accepts them in any order.
struct BookSnapshot {
    BookParams params;
    std::vector<Order> bids;
    std::vector<Order> asks;
    OrderId order_id_counter = 0;
};

/// OrderBook: resting orders for one pair, price-time priority per side.
/// - Bids: descending price (std::greater)
/// - Asks: ascending price
/// - Within a level: ascending order_id
/// - O(1) id lookup via unordered_map
/// Pure container: no transfers, no ownership checks, no matching.
class OrderBook {
public:
    explicit OrderBook(const BookParams& params);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    std::optional<Price> best_bid() const noexcept;
    std::optional<Price> best_ask() const noexcept;
    std::optional<Price> best_price(Side side) const noexcept {
        return side == Side::Buy ? best_bid() : best_ask();
    }

    /// Insert keeping price-time order. Fails on zero price/quantity,
    /// duplicate id, or a full side.
    bool insert(Side side, const Order& order);

    /// Remove and return the highest-priority order on side.
    std::optional<Order> pop_best(Side side);

    std::optional<Order> remove_by_id(Side side, OrderId id);

    /// Increment and return the id counter.
    OrderId next_order_id() noexcept { return ++order_id_counter_; }
    OrderId last_order_id() const noexcept { return order_id_counter_; }

    const Order* find(OrderId id) const;
    std::optional<Side> side_of(OrderId id) const;

    /// Visit resting orders on side in matching order until fn returns false.
    void for_each(Side side, const std::function<bool(const Order&)>& fn) const;

    std::vector<Order> orders(Side side) const;

    struct DepthEntry {
        Price price;
        Quantity quantity;
        uint32_t order_count;
    };
    std::vector<DepthEntry> depth(Side side, size_t max_levels) const;

    BookSnapshot snapshot() const;

    /// Replace contents with snapshot, re-sorting by price-time priority.
    /// Rejects crossed books, zero price/quantity, duplicate ids, ids above
    /// the counter, or more orders than a side can hold. On failure the book
    /// is unchanged.
    bool restore(const BookSnapshot& snapshot);

    void clear();

    size_t order_count() const noexcept { return orders_.size(); }
    size_t order_count(Side side) const noexcept {
        return side == Side::Buy ? bid_count_ : ask_count_;
    }
    bool full(Side side) const noexcept { return order_count(side) >= params_.max_orders_per_side; }
    size_t bid_level_count() const noexcept { return bids_.size(); }
    size_t ask_level_count() const noexcept { return asks_.size(); }

    const BookParams& params() const noexcept { return params_; }
    AssetId base_asset() const noexcept { return params_.base_asset; }
    AssetId quote_asset() const noexcept { return params_.quote_asset; }
    AccountId base_custody() const noexcept { return params_.base_custody; }
    AccountId quote_custody() const noexcept { return params_.quote_custody; }

private:
    template<typename Levels>
    std::optional<Order> pop_front(Levels& levels);

    template<typename Levels>
    void unlink(Levels& levels, BookEntry* entry);

    BookParams params_;
    ObjectPool<BookEntry> pool_;

    std::map<Price, PriceLevel, std::greater<Price>> bids_; // Descending
    std::map<Price, PriceLevel> asks_;                       // Ascending

    std::unordered_map<OrderId, BookEntry*> orders_;
    size_t bid_count_ = 0;
    size_t ask_count_ = 0;

    OrderId order_id_counter_ = 0;
};

} // namespace dexbook
