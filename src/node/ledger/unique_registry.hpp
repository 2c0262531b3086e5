#pragma once
#include "general/result.hpp"
#include "ledger/asset.hpp"
#include "ledger/balance_ledger.hpp"
#include "ledger/event_sink.hpp"
#include "ledger/id_allocator.hpp"
#include "ledger/sellable.hpp"
#include "store/tables.hpp"

namespace unique {

// Registry of creator minted, semi-fungible assets. The creator receives
// the whole supply on mint. Burning and transferring require a positive
// balance and are clamped to it.
//
// Balances are keyed by the asset id the command names, every asset has
// its own balance line per account.
class Registry : public ledger::Sellable {
public:
    Registry(store::KVStore& kv, ledger::EventSink& sink);

    // commands
    [[nodiscard]] Result<AssetId> mint(const AccountId& caller, Bytes metadata, Funds_uint128 supply);
    [[nodiscard]] Result<void> burn(const AccountId& caller, AssetId, Funds_uint128 amount);
    [[nodiscard]] Result<void> transfer(const AccountId& caller, AssetId, Funds_uint128 amount, const AccountId& to);

    // queries
    [[nodiscard]] std::optional<UniqueAssetDetails> asset(AssetId id) const { return assets.get(id); }
    [[nodiscard]] Funds_uint128 balance(AssetId id, const AccountId& a) const { return balances.balance(id, a); }
    [[nodiscard]] AssetId nonce() const { return allocator.peek(); }

    // ledger::Sellable
    [[nodiscard]] Funds_uint128 amount_owned(AssetId id, const AccountId& a) const override { return balance(id, a); }
    Funds_uint128 transfer(AssetId, const AccountId& from, const AccountId& to, Funds_uint128 amount) override;

private:
    [[nodiscard]] Result<Funds_uint128> held_balance(AssetId, const AccountId&) const;
    [[nodiscard]] Result<Funds_uint128> transfer_clamped(const AccountId& from, AssetId, Funds_uint128 amount, const AccountId& to);

    store::KVStore& kv;
    ledger::EventSink& sink;
    ledger::CheckedIdAllocator allocator;
    ledger::BalanceLedger balances;
    store::StorageMap<AssetId, UniqueAssetDetails> assets;
};
}
