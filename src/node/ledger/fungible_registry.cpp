#include "fungible_registry.hpp"
#include "general/logging.hpp"
#include "ledger/ownership.hpp"

namespace fungible {
Registry::Registry(store::KVStore& kv, ledger::EventSink& sink)
    : kv(kv)
    , sink(sink)
    , allocator(kv, "fungible.Nonce")
    , balances(kv, "fungible.Account")
    , assets(kv, "fungible.Asset")
    , metadataMap(kv, "fungible.Metadata")
{
}

AssetId Registry::create(const AccountId& caller)
{
    auto tx { kv.transaction() };
    auto id { allocator.next_id() };
    assets.insert(id, AssetDetails::created_by(caller));
    tx.commit();

    log_commands("{} created asset {}", caller.to_string(), id.to_string());
    sink.on_event(event::Created { caller, id });
    return id;
}

Result<void> Registry::set_metadata(const AccountId& caller, AssetId id, Bytes name, Bytes symbol)
{
    auto tx { kv.transaction() };
    if (auto r { ledger::ensure_is_owner(assets.get(id), caller) }; !r)
        return r;
    metadataMap.insert(id, { name, symbol });
    tx.commit();

    log_commands("{} set metadata of asset {}", caller.to_string(), id.to_string());
    sink.on_event(event::MetadataSet { id, std::move(name), std::move(symbol) });
    return {};
}

Result<void> Registry::mint(const AccountId& caller, AssetId id, Funds_uint128 amount, const AccountId& to)
{
    auto tx { kv.transaction() };
    if (auto r { ledger::ensure_is_owner(assets.get(id), caller) }; !r)
        return r;

    Funds_uint128 totalSupply { 0 };
    Funds_uint128 minted { 0 };
    auto res { assets.try_mutate(id, [&](std::optional<AssetDetails>& details) -> Result<void> {
        if (!details)
            return Error(EUNKNOWN);
        auto original { details->supply };
        details->supply = Funds_uint128::saturating_sum(original, amount);
        totalSupply = details->supply;
        // less than requested if the supply saturated
        minted = Funds_uint128::diff_assert(details->supply, original);
        return {};
    }) };
    if (!res)
        return res;
    balances.saturating_add(id, to, minted);
    tx.commit();

    log_commands("{} minted {} of asset {} to {}", caller.to_string(), minted.to_string(), id.to_string(), to.to_string());
    sink.on_event(event::Minted { id, to, totalSupply });
    return {};
}

Result<void> Registry::burn(const AccountId& caller, AssetId id, Funds_uint128 amount)
{
    auto tx { kv.transaction() };
    Funds_uint128 totalSupply { 0 };
    Funds_uint128 burned { 0 };
    auto res { assets.try_mutate(id, [&](std::optional<AssetDetails>& details) -> Result<void> {
        if (!details)
            return Error(EUNKNOWN);
        burned = balances.saturating_sub(id, caller, amount);
        if (details->supply < burned) {
            // only reachable when supply and balances already disagree
            spdlog::warn("Supply {} of asset {} is below burned amount {}, clamping supply at zero",
                details->supply.to_string(), id.to_string(), burned.to_string());
        }
        details->supply = Funds_uint128::saturating_diff(details->supply, burned);
        totalSupply = details->supply;
        return {};
    }) };
    if (!res)
        return res;
    tx.commit();

    log_commands("{} burned {} of asset {}", caller.to_string(), burned.to_string(), id.to_string());
    sink.on_event(event::Burned { id, caller, totalSupply });
    return {};
}

Result<void> Registry::transfer(const AccountId& caller, AssetId id, Funds_uint128 amount, const AccountId& to)
{
    auto tx { kv.transaction() };
    if (!assets.contains(id))
        return Error(EUNKNOWN);
    auto moved { balances.move(id, caller, to, amount) };
    tx.commit();

    log_commands("{} transferred {} of asset {} to {}", caller.to_string(), moved.to_string(), id.to_string(), to.to_string());
    sink.on_event(event::Transferred { id, caller, to, moved });
    return {};
}
}
