#pragma once

#include <cstddef>
#include <cstdint>

namespace dexbook {

/// Result of a place/cancel call. None means success; every other value
/// aborts the whole call.
enum class DexError : uint8_t {
    None = 0,
    CalculationError = 1,       // price * quantity overflow
    OrderNotFound = 2,
    OrderNotOwned = 3,
    MakerAccountMismatch = 4,
    TransferError = 5,
    InvalidOrder = 6,           // zero price or zero quantity
    BookFull = 7
};

constexpr size_t DEX_ERROR_COUNT = 8;

/// Result of a ledger movement. Anything but Ok had no effect.
enum class TransferStatus : uint8_t {
    Ok = 0,
    UnknownAccount = 1,
    AssetMismatch = 2,
    InsufficientFunds = 3,
    Overflow = 4,
    Rejected = 5
};

constexpr const char* to_string(DexError e) noexcept {
    switch (e) {
        case DexError::None:                 return "None";
        case DexError::CalculationError:     return "CalculationError";
        case DexError::OrderNotFound:        return "OrderNotFound";
        case DexError::OrderNotOwned:        return "OrderNotOwned";
        case DexError::MakerAccountMismatch: return "MakerAccountMismatch";
        case DexError::TransferError:        return "TransferError";
        case DexError::InvalidOrder:         return "InvalidOrder";
        case DexError::BookFull:             return "BookFull";
    }
    return "Unknown";
}

constexpr const char* to_string(TransferStatus s) noexcept {
    switch (s) {
        case TransferStatus::Ok:                return "Ok";
        case TransferStatus::UnknownAccount:    return "UnknownAccount";
        case TransferStatus::AssetMismatch:     return "AssetMismatch";
        case TransferStatus::InsufficientFunds: return "InsufficientFunds";
        case TransferStatus::Overflow:          return "Overflow";
        case TransferStatus::Rejected:          return "Rejected";
    }
    return "Unknown";
}

} // namespace dexbook
