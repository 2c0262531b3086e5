#include "unique_registry.hpp"
#include "general/logging.hpp"

namespace unique {
Registry::Registry(store::KVStore& kv, ledger::EventSink& sink)
    : kv(kv)
    , sink(sink)
    , allocator(kv, "unique.Nonce")
    , balances(kv, "unique.Account")
    , assets(kv, "unique.UniqueAsset")
{
}

Result<AssetId> Registry::mint(const AccountId& caller, Bytes metadata, Funds_uint128 supply)
{
    if (supply.is_zero())
        return Error(ENOSUPPLY);

    auto tx { kv.transaction() };
    auto id { allocator.next_id() };
    if (!id)
        return id;
    assets.insert(*id, { caller, std::move(metadata), supply });
    balances.set(*id, caller, supply);
    tx.commit();

    log_commands("{} minted unique asset {} with supply {}", caller.to_string(), id->to_string(), supply.to_string());
    sink.on_event(event::Created { caller, *id });
    return id;
}

Result<void> Registry::burn(const AccountId& caller, AssetId id, Funds_uint128 amount)
{
    auto tx { kv.transaction() };
    auto held { held_balance(id, caller) };
    if (!held)
        return held.error();

    auto burned { Funds_uint128::min(amount, *held) };
    balances.set(id, caller, Funds_uint128::diff_assert(*held, burned));
    Funds_uint128 totalSupply { 0 };
    auto res { assets.try_mutate(id, [&](std::optional<UniqueAssetDetails>& details) -> Result<void> {
        if (!details)
            return Error(EUNKNOWN);
        details->supply = Funds_uint128::saturating_diff(details->supply, burned);
        totalSupply = details->supply;
        return {};
    }) };
    if (!res)
        return res;
    tx.commit();

    log_commands("{} burned {} of unique asset {}", caller.to_string(), burned.to_string(), id.to_string());
    sink.on_event(event::Burned { id, caller, totalSupply });
    return {};
}

Result<void> Registry::transfer(const AccountId& caller, AssetId id, Funds_uint128 amount, const AccountId& to)
{
    if (auto moved { transfer_clamped(caller, id, amount, to) }; !moved)
        return moved.error();
    return {};
}

Funds_uint128 Registry::transfer(AssetId id, const AccountId& from, const AccountId& to, Funds_uint128 amount)
{
    if (amount.is_zero())
        return Funds_uint128::zero();
    auto moved { transfer_clamped(from, id, amount, to) };
    if (!moved) {
        spdlog::debug("Nothing of unique asset {} moved from {}: {}", id.to_string(), from.to_string(), moved.error().format());
        return Funds_uint128::zero();
    }
    return *moved;
}

Result<Funds_uint128> Registry::held_balance(AssetId id, const AccountId& account) const
{
    if (!assets.contains(id))
        return Error(EUNKNOWN);
    auto b { balances.balance(id, account) };
    if (b.is_zero())
        return Error(ENOTOWNED);
    return b;
}

Result<Funds_uint128> Registry::transfer_clamped(const AccountId& from, AssetId id, Funds_uint128 amount, const AccountId& to)
{
    auto tx { kv.transaction() };
    auto held { held_balance(id, from) };
    if (!held)
        return held;
    auto moved { balances.move(id, from, to, amount) };
    tx.commit();

    log_commands("{} transferred {} of unique asset {} to {}", from.to_string(), moved.to_string(), id.to_string(), to.to_string());
    sink.on_event(event::Transferred { id, from, to, moved });
    return moved;
}
}
