#pragma once
#include "general/result.hpp"
#include "ledger/asset.hpp"
#include "ledger/balance_ledger.hpp"
#include "ledger/event_sink.hpp"
#include "ledger/id_allocator.hpp"
#include "store/tables.hpp"

namespace fungible {

// Registry of owned, arbitrary supply assets.
//
// Every command runs in its own store transaction: when a precondition
// fails or an exception propagates, none of its writes persist and no
// event is emitted. Quantities are clamped instead of rejected: burning
// or transferring more than held moves the held amount, minting beyond
// the representable supply mints up to it.
class Registry {
public:
    Registry(store::KVStore& kv, ledger::EventSink& sink);

    // commands
    AssetId create(const AccountId& caller);
    [[nodiscard]] Result<void> set_metadata(const AccountId& caller, AssetId, Bytes name, Bytes symbol);
    [[nodiscard]] Result<void> mint(const AccountId& caller, AssetId, Funds_uint128 amount, const AccountId& to);
    [[nodiscard]] Result<void> burn(const AccountId& caller, AssetId, Funds_uint128 amount);
    [[nodiscard]] Result<void> transfer(const AccountId& caller, AssetId, Funds_uint128 amount, const AccountId& to);

    // queries
    [[nodiscard]] std::optional<AssetDetails> asset(AssetId id) const { return assets.get(id); }
    [[nodiscard]] std::optional<AssetMetadata> metadata(AssetId id) const { return metadataMap.get(id); }
    [[nodiscard]] Funds_uint128 balance(AssetId id, const AccountId& a) const { return balances.balance(id, a); }
    [[nodiscard]] AssetId nonce() const { return allocator.peek(); }

private:
    store::KVStore& kv;
    ledger::EventSink& sink;
    ledger::SaturatingIdAllocator allocator;
    ledger::BalanceLedger balances;
    store::StorageMap<AssetId, AssetDetails> assets;
    store::StorageMap<AssetId, AssetMetadata> metadataMap;
};
}
