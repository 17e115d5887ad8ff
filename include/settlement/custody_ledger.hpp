#pragma once

#include "common/types.hpp"
#include "common/errors.hpp"
#include <optional>
#include <span>

namespace dexbook {

/// One movement of `amount` units of `asset` between two ledger accounts.
struct Transfer {
    AssetId asset;
    AccountId from;
    AccountId to;
    Quantity amount;
};

/// Where a party holds each side of the pair.
struct SettlementAccount {
    PartyId owner = 0;
    AccountId base_account = NO_ACCOUNT;
    AccountId quote_account = NO_ACCOUNT;
};

/// Moves funds between holding accounts and the book's custody accounts.
/// Every call is all-or-nothing: a non-Ok status means no balance changed.
class CustodyLedger {
public:
    virtual ~CustodyLedger() = default;

    virtual TransferStatus transfer(AssetId asset, AccountId from, AccountId to, Quantity amount) = 0;

    /// Apply every leg or none of them.
    virtual TransferStatus settle(std::span<const Transfer> legs) = 0;
};

/// Looks up the accounts a maker settles into, keyed by the order's owner.
class SettlementResolver {
public:
    virtual ~SettlementResolver() = default;

    virtual std::optional<SettlementAccount> resolve_settlement_account(PartyId owner) const = 0;
};

} // namespace dexbook
