#include "settlement/in_memory_ledger.hpp"
#include "common/utils.hpp"

namespace dexbook {

AccountId InMemoryLedger::open_account(PartyId owner, AssetId asset) {
    accounts_.push_back({owner, asset, 0});
    return static_cast<AccountId>(accounts_.size());
}

SettlementAccount InMemoryLedger::open_party(PartyId owner, AssetId base_asset, AssetId quote_asset) {
    SettlementAccount acct;
    acct.owner = owner;
    acct.base_account = open_account(owner, base_asset);
    acct.quote_account = open_account(owner, quote_asset);
    register_settlement(acct);
    return acct;
}

void InMemoryLedger::register_settlement(const SettlementAccount& account) {
    settlement_[account.owner] = account;
}

TransferStatus InMemoryLedger::deposit(AccountId account, Quantity amount) {
    if (account == NO_ACCOUNT || account > accounts_.size()) return TransferStatus::UnknownAccount;
    AccountInfo& info = accounts_[account - 1];
    auto sum = checked_add(info.balance, amount);
    if (!sum) return TransferStatus::Overflow;
    info.balance = *sum;
    return TransferStatus::Ok;
}

TransferStatus InMemoryLedger::check(const Transfer& leg) const {
    if (leg.from == NO_ACCOUNT || leg.from > accounts_.size() ||
        leg.to == NO_ACCOUNT || leg.to > accounts_.size()) {
        return TransferStatus::UnknownAccount;
    }
    const AccountInfo& from = accounts_[leg.from - 1];
    const AccountInfo& to = accounts_[leg.to - 1];
    if (from.asset != leg.asset || to.asset != leg.asset) return TransferStatus::AssetMismatch;
    if (from.balance < leg.amount) return TransferStatus::InsufficientFunds;
    if (leg.from != leg.to && !checked_add(to.balance, leg.amount)) return TransferStatus::Overflow;
    return TransferStatus::Ok;
}

TransferStatus InMemoryLedger::transfer(AssetId asset, AccountId from, AccountId to, Quantity amount) {
    Transfer leg{asset, from, to, amount};
    TransferStatus status = check(leg);
    if (status != TransferStatus::Ok) {
        ++transfers_rejected_;
        return status;
    }
    accounts_[from - 1].balance -= amount;
    accounts_[to - 1].balance += amount;
    ++transfers_applied_;
    return TransferStatus::Ok;
}

TransferStatus InMemoryLedger::settle(std::span<const Transfer> legs) {
    // Validate against a scratch copy of the touched balances so that legs
    // drawing on the same account are checked cumulatively.
    std::unordered_map<AccountId, Quantity> scratch;
    auto balance_of = [&](AccountId id) -> Quantity& {
        auto it = scratch.find(id);
        if (it == scratch.end()) {
            it = scratch.emplace(id, accounts_[id - 1].balance).first;
        }
        return it->second;
    };

    for (const Transfer& leg : legs) {
        TransferStatus status = check(leg);
        if (status == TransferStatus::UnknownAccount || status == TransferStatus::AssetMismatch) {
            ++transfers_rejected_;
            return status;
        }
        Quantity& from = balance_of(leg.from);
        if (from < leg.amount) {
            ++transfers_rejected_;
            return TransferStatus::InsufficientFunds;
        }
        from -= leg.amount;
        Quantity& to = balance_of(leg.to);
        auto sum = checked_add(to, leg.amount);
        if (!sum) {
            ++transfers_rejected_;
            return TransferStatus::Overflow;
        }
        to = *sum;
    }

    for (const auto& [id, bal] : scratch) {
        accounts_[id - 1].balance = bal;
    }
    transfers_applied_ += legs.size();
    return TransferStatus::Ok;
}

std::optional<SettlementAccount> InMemoryLedger::resolve_settlement_account(PartyId owner) const {
    auto it = settlement_.find(owner);
    if (it == settlement_.end()) return std::nullopt;
    return it->second;
}

Quantity InMemoryLedger::balance(AccountId account) const {
    if (account == NO_ACCOUNT || account > accounts_.size()) return 0;
    return accounts_[account - 1].balance;
}

std::optional<InMemoryLedger::AccountInfo> InMemoryLedger::account(AccountId account) const {
    if (account == NO_ACCOUNT || account > accounts_.size()) return std::nullopt;
    return accounts_[account - 1];
}

Quantity InMemoryLedger::total_supply(AssetId asset) const {
    Quantity total = 0;
    for (const AccountInfo& info : accounts_) {
        if (info.asset == asset) total += info.balance;
    }
    return total;
}

} // namespace dexbook
