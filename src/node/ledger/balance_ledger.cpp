#include "balance_ledger.hpp"

namespace ledger {
Funds_uint128 BalanceLedger::saturating_add(AssetId assetId, const AccountId& accountId, Funds_uint128 amount)
{
    Funds_uint128 delta { 0 };
    balances.mutate(assetId, accountId, [&](std::optional<Funds_uint128>& b) {
        auto original { b.value_or(Funds_uint128::zero()) };
        b = Funds_uint128::saturating_sum(original, amount);
        delta = Funds_uint128::diff_assert(*b, original);
    });
    return delta;
}

Funds_uint128 BalanceLedger::saturating_sub(AssetId assetId, const AccountId& accountId, Funds_uint128 amount)
{
    Funds_uint128 delta { 0 };
    balances.mutate(assetId, accountId, [&](std::optional<Funds_uint128>& b) {
        auto original { b.value_or(Funds_uint128::zero()) };
        b = Funds_uint128::saturating_diff(original, amount);
        delta = Funds_uint128::diff_assert(original, *b);
    });
    return delta;
}

Funds_uint128 BalanceLedger::move(AssetId assetId, const AccountId& from, const AccountId& to, Funds_uint128 amount)
{
    auto delta { saturating_sub(assetId, from, amount) };
    saturating_add(assetId, to, delta);
    return delta;
}
}
