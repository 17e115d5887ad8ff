#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"
#include "engine/event_sink.hpp"
#include "order_book/order_book.hpp"
#include "settlement/custody_ledger.hpp"
#include <vector>

namespace dexbook {

/// One maker order consumed (fully or partly) by a taker.
struct Fill {
    OrderId maker_order_id;
    PartyId maker;
    Price price;
    Quantity quantity;
};

/// Result of MatchingEngine::place. On error, fills lists what had already
/// settled before the failure (empty unless the ledger failed mid-commit).
struct PlaceOutcome {
    DexError error = DexError::None;
    OrderId resting_order_id = NO_ORDER;
    Quantity filled_quantity = 0;
    Quantity resting_quantity = 0;
    Quantity refunded_quote = 0;    // Price improvement returned to a buy taker
    std::vector<Fill> fills;

    bool ok() const noexcept { return error == DexError::None; }
};

/// MatchingEngine: places and cancels limit orders against an OrderBook.
/// Holds no book state of its own; the ledger, resolver and sink are
/// borrowed and must outlive the engine.
///
/// place() validates first, then commits:
///   1. for a buy, price * quantity must fit in u64
///   2. a read-only walk of the opposing side resolves every maker that will
///      trade and checks its account and quote total
///   3. a remainder needs room on the taker's side
/// Only then are the taker's funds reserved into custody, makers popped
/// best-first and each fill settled in one atomic ledger call (including
/// a buy taker's price improvement), and the remainder rested.
///
/// Not thread-safe. One thread at a time per book (see OrderGateway).
class MatchingEngine {
public:
    MatchingEngine(CustodyLedger& ledger, const SettlementResolver& resolver, EventSink& sink);

    PlaceOutcome place(OrderBook& book, Side side, Price price, Quantity quantity,
                       const SettlementAccount& taker);

    DexError cancel(OrderBook& book, OrderId order_id, const SettlementAccount& requester);

    uint64_t orders_placed() const noexcept { return orders_placed_; }
    uint64_t orders_cancelled() const noexcept { return orders_cancelled_; }
    uint64_t fills() const noexcept { return fills_; }
    uint64_t rejects() const noexcept { return rejects_; }

private:
    struct PlannedFill {
        OrderId maker_order_id;
        SettlementAccount maker;
        Price price;
        Quantity quantity;
        Quantity quote_total;
        Quantity improvement;       // Buy only: (limit - maker price) * quantity
    };

    DexError plan(const OrderBook& book, Side side, Price price, Quantity quantity,
                  std::vector<PlannedFill>& planned, Quantity& remainder) const;

    DexError settle_fill(const OrderBook& book, Side side, const PlannedFill& fill,
                         const SettlementAccount& taker);

    void refund_unused(const OrderBook& book, Side side, Quantity amount,
                       const SettlementAccount& taker);

    /// Put a popped or removed order back; logs if the book refuses it.
    void restore_maker(OrderBook& book, Side side, const Order& order);

    DexError reject(DexError error);

    CustodyLedger& ledger_;
    const SettlementResolver& resolver_;
    EventSink& sink_;

    uint64_t orders_placed_ = 0;
    uint64_t orders_cancelled_ = 0;
    uint64_t fills_ = 0;
    uint64_t rejects_ = 0;
};

} // namespace dexbook
