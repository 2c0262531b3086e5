#pragma once
#include "general/funds.hpp"
#include "ledger/account_id.hpp"
#include "ledger/asset_id.hpp"
#include "store/tables.hpp"

namespace ledger {

// Sparse (asset, account) -> balance mapping. Absent entries read as zero,
// entries are created on first write and never removed.
class BalanceLedger {
public:
    BalanceLedger(store::KVStore& kv, std::string prefix)
        : balances(kv, std::move(prefix))
    {
    }
    [[nodiscard]] Funds_uint128 balance(AssetId assetId, const AccountId& accountId) const
    {
        return balances.get(assetId, accountId).value_or(Funds_uint128::zero());
    }
    void set(AssetId assetId, const AccountId& accountId, Funds_uint128 amount)
    {
        balances.insert(assetId, accountId, amount);
    }

    // The following return the delta actually applied which is smaller
    // than the requested amount when the balance saturates.
    Funds_uint128 saturating_add(AssetId, const AccountId&, Funds_uint128 amount);
    Funds_uint128 saturating_sub(AssetId, const AccountId&, Funds_uint128 amount);

    // moves min(amount, balance of from), returns the moved delta
    Funds_uint128 move(AssetId, const AccountId& from, const AccountId& to, Funds_uint128 amount);

private:
    store::StorageDoubleMap<AssetId, AccountId, Funds_uint128> balances;
};
}
