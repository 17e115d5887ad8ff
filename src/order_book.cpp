#include "order_book/order_book.hpp"
#include <algorithm>
#include <unordered_set>

namespace dexbook {

OrderBook::OrderBook(const BookParams& params)
    : params_(params)
    , pool_(params.max_orders_per_side * 2)
{
    orders_.reserve(params.max_orders_per_side * 2);
}

std::optional<Price> OrderBook::best_bid() const noexcept {
    if (bids_.empty()) return std::nullopt;
    return bids_.begin()->first;
}

std::optional<Price> OrderBook::best_ask() const noexcept {
    if (asks_.empty()) return std::nullopt;
    return asks_.begin()->first;
}

bool OrderBook::insert(Side side, const Order& order) {
    if (order.price == 0 || order.quantity == 0) [[unlikely]] return false;
    if (order.order_id == NO_ORDER) [[unlikely]] return false;
    if (full(side)) return false;
    if (orders_.count(order.order_id)) return false;

    BookEntry* entry = pool_.acquire(BookEntry{order, side, nullptr, nullptr});
    if (!entry) [[unlikely]] return false;

    if (side == Side::Buy) {
        PriceLevel& level = bids_[order.price];
        level.price = order.price;
        level.insert(entry);
        ++bid_count_;
    } else {
        PriceLevel& level = asks_[order.price];
        level.price = order.price;
        level.insert(entry);
        ++ask_count_;
    }
    orders_.emplace(order.order_id, entry);
    return true;
}

template<typename Levels>
std::optional<Order> OrderBook::pop_front(Levels& levels) {
    if (levels.empty()) return std::nullopt;
    BookEntry* entry = levels.begin()->second.front();
    Order order = entry->order;
    unlink(levels, entry);
    return order;
}

template<typename Levels>
void OrderBook::unlink(Levels& levels, BookEntry* entry) {
    auto it = levels.find(entry->order.price);
    if (it != levels.end()) {
        it->second.remove(entry);
        if (it->second.empty()) {
            levels.erase(it);
        }
    }
    if (entry->side == Side::Buy) {
        --bid_count_;
    } else {
        --ask_count_;
    }
    orders_.erase(entry->order.order_id);
    pool_.release(entry);
}

std::optional<Order> OrderBook::pop_best(Side side) {
    return side == Side::Buy ? pop_front(bids_) : pop_front(asks_);
}

std::optional<Order> OrderBook::remove_by_id(Side side, OrderId id) {
    auto it = orders_.find(id);
    if (it == orders_.end() || it->second->side != side) return std::nullopt;

    BookEntry* entry = it->second;
    Order order = entry->order;
    if (side == Side::Buy) {
        unlink(bids_, entry);
    } else {
        unlink(asks_, entry);
    }
    return order;
}

const Order* OrderBook::find(OrderId id) const {
    auto it = orders_.find(id);
    return it == orders_.end() ? nullptr : &it->second->order;
}

std::optional<Side> OrderBook::side_of(OrderId id) const {
    auto it = orders_.find(id);
    if (it == orders_.end()) return std::nullopt;
    return it->second->side;
}

void OrderBook::for_each(Side side, const std::function<bool(const Order&)>& fn) const {
    auto walk = [&](const auto& levels) {
        for (const auto& [price, level] : levels) {
            for (const BookEntry* e = level.front(); e; e = e->next) {
                if (!fn(e->order)) return;
            }
        }
    };

    if (side == Side::Buy) {
        walk(bids_);
    } else {
        walk(asks_);
    }
}

std::vector<Order> OrderBook::orders(Side side) const {
    std::vector<Order> out;
    out.reserve(order_count(side));
    for_each(side, [&](const Order& o) {
        out.push_back(o);
        return true;
    });
    return out;
}

std::vector<OrderBook::DepthEntry> OrderBook::depth(Side side, size_t max_levels) const {
    std::vector<DepthEntry> out;
    auto collect = [&](const auto& levels) {
        for (auto it = levels.begin(); it != levels.end() && out.size() < max_levels; ++it) {
            out.push_back({it->first, it->second.total_quantity, it->second.order_count});
        }
    };

    if (side == Side::Buy) {
        collect(bids_);
    } else {
        collect(asks_);
    }
    return out;
}

BookSnapshot OrderBook::snapshot() const {
    BookSnapshot snap;
    snap.params = params_;
    snap.bids = orders(Side::Buy);
    snap.asks = orders(Side::Sell);
    snap.order_id_counter = order_id_counter_;
    return snap;
}

bool OrderBook::restore(const BookSnapshot& snapshot) {
    if (snapshot.params.base_asset != params_.base_asset ||
        snapshot.params.quote_asset != params_.quote_asset) {
        return false;
    }
    if (snapshot.bids.size() > params_.max_orders_per_side ||
        snapshot.asks.size() > params_.max_orders_per_side) {
        return false;
    }

    std::unordered_set<OrderId> seen;
    auto valid = [&](const std::vector<Order>& side_orders) {
        for (const Order& o : side_orders) {
            if (o.price == 0 || o.quantity == 0) return false;
            if (o.order_id == NO_ORDER || o.order_id > snapshot.order_id_counter) return false;
            if (!seen.insert(o.order_id).second) return false;
        }
        return true;
    };
    if (!valid(snapshot.bids) || !valid(snapshot.asks)) return false;

    // Non-crossing: highest bid must sit strictly below lowest ask
    if (!snapshot.bids.empty() && !snapshot.asks.empty()) {
        auto by_price = [](const Order& a, const Order& b) { return a.price < b.price; };
        Price top_bid = std::max_element(snapshot.bids.begin(), snapshot.bids.end(), by_price)->price;
        Price low_ask = std::min_element(snapshot.asks.begin(), snapshot.asks.end(), by_price)->price;
        if (top_bid >= low_ask) return false;
    }

    clear();
    // PriceLevel::insert orders by id, so input order does not matter
    for (const Order& o : snapshot.bids) insert(Side::Buy, o);
    for (const Order& o : snapshot.asks) insert(Side::Sell, o);
    order_id_counter_ = snapshot.order_id_counter;
    return true;
}

void OrderBook::clear() {
    for (auto& [id, entry] : orders_) {
        pool_.release(entry);
    }
    orders_.clear();
    bids_.clear();
    asks_.clear();
    bid_count_ = 0;
    ask_count_ = 0;
}

} // namespace dexbook
