#include "engine/matching_engine.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <array>
#include <span>

namespace dexbook {

MatchingEngine::MatchingEngine(CustodyLedger& ledger, const SettlementResolver& resolver, EventSink& sink)
    : ledger_(ledger), resolver_(resolver), sink_(sink)
{}

DexError MatchingEngine::reject(DexError error) {
    ++rejects_;
    return error;
}

PlaceOutcome MatchingEngine::place(OrderBook& book, Side side, Price price, Quantity quantity,
                                   const SettlementAccount& taker) {
    PlaceOutcome outcome;

    if (price == 0 || quantity == 0) [[unlikely]] {
        outcome.error = reject(DexError::InvalidOrder);
        LOG_WARNF("place rejected: %s %lu@%lu from party %lu: %s", to_string(side),
                  static_cast<unsigned long>(quantity), static_cast<unsigned long>(price),
                  static_cast<unsigned long>(taker.owner), to_string(outcome.error));
        return outcome;
    }

    // Only a buy reserves quote; a sell reserves base and its fills are
    // checked one by one in plan().
    Quantity notional = 0;
    if (side == Side::Buy) {
        auto total = checked_mul(price, quantity);
        if (!total) [[unlikely]] {
            outcome.error = reject(DexError::CalculationError);
            LOG_WARNF("place rejected: BUY %lu@%lu overflows notional",
                      static_cast<unsigned long>(quantity), static_cast<unsigned long>(price));
            return outcome;
        }
        notional = *total;
    }

    std::vector<PlannedFill> planned;
    Quantity remainder = quantity;
    DexError planned_error = plan(book, side, price, quantity, planned, remainder);
    if (planned_error != DexError::None) {
        outcome.error = reject(planned_error);
        LOG_WARNF("place rejected: %s %lu@%lu from party %lu: %s", to_string(side),
                  static_cast<unsigned long>(quantity), static_cast<unsigned long>(price),
                  static_cast<unsigned long>(taker.owner), to_string(outcome.error));
        return outcome;
    }

    if (remainder > 0 && book.full(side)) {
        outcome.error = reject(DexError::BookFull);
        LOG_WARNF("place rejected: %s side holds %zu orders", to_string(side), book.order_count(side));
        return outcome;
    }

    // 1. Reserve the taker's funds for the full requested size
    const Quantity reserved = (side == Side::Buy) ? notional : quantity;
    TransferStatus status = (side == Side::Buy)
        ? ledger_.transfer(book.quote_asset(), taker.quote_account, book.quote_custody(), reserved)
        : ledger_.transfer(book.base_asset(), taker.base_account, book.base_custody(), reserved);
    if (status != TransferStatus::Ok) {
        outcome.error = reject(DexError::TransferError);
        LOG_WARNF("reservation of %lu for party %lu failed: %s",
                  static_cast<unsigned long>(reserved), static_cast<unsigned long>(taker.owner),
                  to_string(status));
        return outcome;
    }

    // 2. Cross best-first against the makers found by plan()
    const Side opposing = opposite_side(side);
    Quantity remaining = quantity;
    Quantity quote_paid = 0;   // Quote released from custody for a buy: maker totals plus improvement
    outcome.fills.reserve(planned.size());

    for (const PlannedFill& fill : planned) {
        std::optional<Order> maker = book.pop_best(opposing);

        DexError settle_error = settle_fill(book, side, fill, taker);
        if (settle_error != DexError::None) [[unlikely]] {
            restore_maker(book, opposing, *maker);
            Quantity unused = (side == Side::Buy) ? reserved - quote_paid : remaining;
            refund_unused(book, side, unused, taker);
            outcome.error = reject(settle_error);
            outcome.filled_quantity = quantity - remaining;
            return outcome;
        }

        TradeEvent event{};
        event.taker = taker.owner;
        event.maker = maker->owner;
        event.maker_order_id = maker->order_id;
        event.taker_side = side;
        event.base_asset = book.base_asset();
        event.quote_asset = book.quote_asset();
        event.quantity = fill.quantity;
        event.price = fill.price;
        event.timestamp = now_ns();
        sink_.publish(event);

        LOG_DEBUGF("fill: maker order %lu party %lu -> taker party %lu, %lu@%lu",
                   static_cast<unsigned long>(maker->order_id), static_cast<unsigned long>(maker->owner),
                   static_cast<unsigned long>(taker.owner), static_cast<unsigned long>(fill.quantity),
                   static_cast<unsigned long>(fill.price));

        outcome.fills.push_back({maker->order_id, maker->owner, fill.price, fill.quantity});
        ++fills_;

        remaining -= fill.quantity;
        quote_paid += fill.quote_total + fill.improvement;
        outcome.refunded_quote += fill.improvement;
        maker->quantity -= fill.quantity;
        if (maker->quantity > 0) {
            // Same id, so it goes back to the front of its level
            restore_maker(book, opposing, *maker);
        }
    }

    outcome.filled_quantity = quantity - remaining;

    // 3. Rest whatever is left
    if (remaining > 0) {
        Order resting{taker.owner, price, remaining, book.next_order_id()};
        if (!book.insert(side, resting)) [[unlikely]] {
            Quantity unused = (side == Side::Buy) ? reserved - quote_paid : remaining;
            refund_unused(book, side, unused, taker);
            outcome.error = reject(DexError::BookFull);
            return outcome;
        }
        outcome.resting_order_id = resting.order_id;
        outcome.resting_quantity = remaining;
    }

    ++orders_placed_;
    return outcome;
}

DexError MatchingEngine::plan(const OrderBook& book, Side side, Price price, Quantity quantity,
                              std::vector<PlannedFill>& planned, Quantity& remainder) const {
    DexError error = DexError::None;
    remainder = quantity;

    book.for_each(opposite_side(side), [&](const Order& maker) {
        if (remainder == 0) return false;
        if (!crosses(side, price, maker.price)) return false;

        auto account = resolver_.resolve_settlement_account(maker.owner);
        if (!account || account->owner != maker.owner) {
            error = DexError::MakerAccountMismatch;
            return false;
        }

        Quantity qty = std::min(remainder, maker.quantity);
        auto quote_total = checked_mul(maker.price, qty);
        if (!quote_total) {
            error = DexError::CalculationError;
            return false;
        }

        // A buy crossing below its limit gets the difference back in the same settlement
        Quantity improvement = (side == Side::Buy) ? (price - maker.price) * qty : 0;

        planned.push_back({maker.order_id, *account, maker.price, qty, *quote_total, improvement});
        remainder -= qty;
        return true;
    });

    return error;
}

DexError MatchingEngine::settle_fill(const OrderBook& book, Side side, const PlannedFill& fill,
                                     const SettlementAccount& taker) {
    // Both legs draw on custody: the base was reserved by the seller, the
    // quote by the buyer.
    const SettlementAccount& buyer = (side == Side::Buy) ? taker : fill.maker;
    const SettlementAccount& seller = (side == Side::Buy) ? fill.maker : taker;

    std::array<Transfer, 3> legs{{
        {book.base_asset(), book.base_custody(), buyer.base_account, fill.quantity},
        {book.quote_asset(), book.quote_custody(), seller.quote_account, fill.quote_total},
        {book.quote_asset(), book.quote_custody(), taker.quote_account, fill.improvement},
    }};
    const size_t leg_count = fill.improvement > 0 ? 3 : 2;

    TransferStatus status = ledger_.settle(std::span<const Transfer>(legs.data(), leg_count));
    if (status != TransferStatus::Ok) {
        LOG_ERRORF("settlement of maker order %lu (%lu@%lu) failed: %s",
                   static_cast<unsigned long>(fill.maker_order_id), static_cast<unsigned long>(fill.quantity),
                   static_cast<unsigned long>(fill.price), to_string(status));
        return DexError::TransferError;
    }
    return DexError::None;
}

void MatchingEngine::refund_unused(const OrderBook& book, Side side, Quantity amount,
                                   const SettlementAccount& taker) {
    if (amount == 0) return;
    TransferStatus status = (side == Side::Buy)
        ? ledger_.transfer(book.quote_asset(), book.quote_custody(), taker.quote_account, amount)
        : ledger_.transfer(book.base_asset(), book.base_custody(), taker.base_account, amount);
    if (status != TransferStatus::Ok) {
        LOG_ERRORF("refund of %lu unused reservation to party %lu failed: %s",
                   static_cast<unsigned long>(amount), static_cast<unsigned long>(taker.owner),
                   to_string(status));
    }
}

void MatchingEngine::restore_maker(OrderBook& book, Side side, const Order& order) {
    // The slot was freed by the pop/remove just before, so this only fails if
    // the book itself is corrupt.
    if (!book.insert(side, order)) [[unlikely]] {
        LOG_ERRORF("re-insert of order %lu (party %lu, %lu@%lu) failed, order dropped",
                   static_cast<unsigned long>(order.order_id), static_cast<unsigned long>(order.owner),
                   static_cast<unsigned long>(order.quantity), static_cast<unsigned long>(order.price));
    }
}

DexError MatchingEngine::cancel(OrderBook& book, OrderId order_id, const SettlementAccount& requester) {
    std::optional<Side> side = book.side_of(order_id);
    if (!side) {
        LOG_WARNF("cancel of order %lu rejected: OrderNotFound", static_cast<unsigned long>(order_id));
        return reject(DexError::OrderNotFound);
    }

    const Order* resting = book.find(order_id);
    if (resting->owner != requester.owner) {
        LOG_WARNF("cancel of order %lu by party %lu rejected: OrderNotOwned",
                  static_cast<unsigned long>(order_id), static_cast<unsigned long>(requester.owner));
        return reject(DexError::OrderNotOwned);
    }

    Quantity refund = resting->quantity;
    if (*side == Side::Buy) {
        auto quote = checked_mul(resting->price, resting->quantity);
        if (!quote) return reject(DexError::CalculationError);
        refund = *quote;
    }

    // Out of the book before the refund so it cannot match again
    std::optional<Order> removed = book.remove_by_id(*side, order_id);

    TransferStatus status = (*side == Side::Buy)
        ? ledger_.transfer(book.quote_asset(), book.quote_custody(), requester.quote_account, refund)
        : ledger_.transfer(book.base_asset(), book.base_custody(), requester.base_account, refund);
    if (status != TransferStatus::Ok) {
        restore_maker(book, *side, *removed);
        LOG_ERRORF("refund for cancelled order %lu failed: %s",
                   static_cast<unsigned long>(order_id), to_string(status));
        return reject(DexError::TransferError);
    }

    ++orders_cancelled_;
    LOG_DEBUGF("cancelled order %lu, refunded %lu", static_cast<unsigned long>(order_id),
               static_cast<unsigned long>(refund));
    return DexError::None;
}

} // namespace dexbook
