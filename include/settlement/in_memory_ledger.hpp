#pragma once

#include "settlement/custody_ledger.hpp"
#include <unordered_map>
#include <vector>

namespace dexbook {

/// In-process ledger: each account holds a single asset for a single owner.
/// Also serves as the settlement resolver for registered parties.
/// Not thread-safe; callers serialize access the same way they serialize the book.
class InMemoryLedger : public CustodyLedger, public SettlementResolver {
public:
    struct AccountInfo {
        PartyId owner;
        AssetId asset;
        Quantity balance;
    };

    InMemoryLedger() = default;

    /// Create an empty account and return its id (ids start at 1).
    AccountId open_account(PartyId owner, AssetId asset);

    /// Open a base and a quote account for owner and register them for settlement.
    SettlementAccount open_party(PartyId owner, AssetId base_asset, AssetId quote_asset);

    void register_settlement(const SettlementAccount& account);

    /// Mint funds into an account. Fails on unknown account or overflow.
    TransferStatus deposit(AccountId account, Quantity amount);

    TransferStatus transfer(AssetId asset, AccountId from, AccountId to, Quantity amount) override;
    TransferStatus settle(std::span<const Transfer> legs) override;

    std::optional<SettlementAccount> resolve_settlement_account(PartyId owner) const override;

    Quantity balance(AccountId account) const;
    std::optional<AccountInfo> account(AccountId account) const;

    /// Sum of all balances of asset across every account.
    Quantity total_supply(AssetId asset) const;

    uint64_t transfers_applied() const noexcept { return transfers_applied_; }
    uint64_t transfers_rejected() const noexcept { return transfers_rejected_; }

private:
    TransferStatus check(const Transfer& leg) const;

    std::vector<AccountInfo> accounts_;     // index = id - 1
    std::unordered_map<PartyId, SettlementAccount> settlement_;
    uint64_t transfers_applied_ = 0;
    uint64_t transfers_rejected_ = 0;
};

} // namespace dexbook
