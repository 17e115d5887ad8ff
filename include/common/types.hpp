#pragma once

#include <cstdint>
#include <ctime>
#include <type_traits>

namespace dexbook {

// Core type aliases
using Price = uint64_t;         // Quote-asset units per base-asset unit
using Quantity = uint64_t;      // Base-asset units
using OrderId = uint64_t;
using PartyId = uint64_t;       // Opaque owner identity
using AssetId = uint32_t;
using AccountId = uint64_t;     // Ledger account holding one asset for one owner
using Timestamp = uint64_t;     // Nanoseconds, monotonic clock

constexpr OrderId NO_ORDER = 0;     // Ids start at 1
constexpr AccountId NO_ACCOUNT = 0;

enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

/// A resting limit order. quantity is the unfilled remainder.
struct Order {
    PartyId owner;
    Price price;
    Quantity quantity;
    OrderId order_id;
};
static_assert(std::is_trivially_copyable_v<Order>);

/// Published once per fill. Price is always the maker's price.
struct TradeEvent {
    PartyId taker;
    PartyId maker;
    OrderId maker_order_id;
    Side taker_side;
    AssetId base_asset;
    AssetId quote_asset;
    Quantity quantity;
    Price price;
    Timestamp timestamp;
};

inline Timestamp now_ns() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<Timestamp>(ts.tv_sec) * 1'000'000'000ULL + static_cast<Timestamp>(ts.tv_nsec);
}

constexpr Side opposite_side(Side s) noexcept {
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

constexpr const char* to_string(Side s) noexcept {
    return s == Side::Buy ? "BUY" : "SELL";
}

/// True when a taker at taker_price can trade against a resting order at maker_price.
constexpr bool crosses(Side taker_side, Price taker_price, Price maker_price) noexcept {
    return taker_side == Side::Buy ? taker_price >= maker_price : taker_price <= maker_price;
}

} // namespace dexbook
