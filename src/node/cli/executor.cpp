#include "executor.hpp"
#include "api/json.hpp"

namespace cli {
namespace {
// maps Result<void> to an empty success
Result<nlohmann::json> done(const Result<void>& r)
{
    if (!r)
        return r.error();
    return nlohmann::json(nullptr);
}
}

Executor::Executor(store::KVStore& kv, std::optional<AccountId> defaultCaller)
    : defaultCaller(std::move(defaultCaller))
    , fungibleRegistry(kv, sink)
    , uniqueRegistry(kv, sink)
{
}

Result<AccountId> Executor::caller(const Invocation& inv) const
{
    if (inv.caller)
        return *inv.caller;
    if (defaultCaller)
        return *defaultCaller;
    return Error(ENOCALLER);
}

nlohmann::json Executor::run(const std::vector<std::string>& tokens)
{
    auto inv { parse_invocation(tokens) };
    if (!inv)
        return jsonmsg::status(inv.error());
    return run(*inv);
}

nlohmann::json Executor::run(const Invocation& inv)
{
    auto res { std::visit([&](auto& cmd) { return handle(inv, cmd); }, inv.command) };
    auto events { sink.take() };
    return jsonmsg::serialize(res, std::move(events));
}

auto Executor::handle(const Invocation& inv, const command::Create&) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return jsonmsg::to_json(fungibleRegistry.create(*c));
}

auto Executor::handle(const Invocation& inv, const command::SetMetadata& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(fungibleRegistry.set_metadata(*c, cmd.assetId, cmd.name, cmd.symbol));
}

auto Executor::handle(const Invocation& inv, const command::Mint& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(fungibleRegistry.mint(*c, cmd.assetId, cmd.amount, cmd.to));
}

auto Executor::handle(const Invocation& inv, const command::Burn& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(fungibleRegistry.burn(*c, cmd.assetId, cmd.amount));
}

auto Executor::handle(const Invocation& inv, const command::Transfer& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(fungibleRegistry.transfer(*c, cmd.assetId, cmd.amount, cmd.to));
}

auto Executor::handle(const Invocation&, const command::Asset& cmd) -> Result<json>
{
    auto a { fungibleRegistry.asset(cmd.assetId) };
    if (!a)
        return Error(EUNKNOWN);
    return jsonmsg::to_json(*a);
}

auto Executor::handle(const Invocation&, const command::Metadata& cmd) -> Result<json>
{
    if (!fungibleRegistry.asset(cmd.assetId))
        return Error(EUNKNOWN);
    return jsonmsg::to_json(fungibleRegistry.metadata(cmd.assetId));
}

auto Executor::handle(const Invocation&, const command::Balance& cmd) -> Result<json>
{
    return jsonmsg::to_json(fungibleRegistry.balance(cmd.assetId, cmd.account));
}

auto Executor::handle(const Invocation&, const command::Nonce&) -> Result<json>
{
    return jsonmsg::to_json(fungibleRegistry.nonce());
}

auto Executor::handle(const Invocation& inv, const command::UniqueMint& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    auto id { uniqueRegistry.mint(*c, cmd.metadata, cmd.supply) };
    if (!id)
        return id.error();
    return jsonmsg::to_json(*id);
}

auto Executor::handle(const Invocation& inv, const command::UniqueBurn& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(uniqueRegistry.burn(*c, cmd.assetId, cmd.amount));
}

auto Executor::handle(const Invocation& inv, const command::UniqueTransfer& cmd) -> Result<json>
{
    auto c { caller(inv) };
    if (!c)
        return c.error();
    return done(uniqueRegistry.transfer(*c, cmd.assetId, cmd.amount, cmd.to));
}

auto Executor::handle(const Invocation&, const command::UniqueAsset& cmd) -> Result<json>
{
    auto a { uniqueRegistry.asset(cmd.assetId) };
    if (!a)
        return Error(EUNKNOWN);
    return jsonmsg::to_json(*a);
}

auto Executor::handle(const Invocation&, const command::UniqueBalance& cmd) -> Result<json>
{
    return jsonmsg::to_json(uniqueRegistry.balance(cmd.assetId, cmd.account));
}

auto Executor::handle(const Invocation&, const command::UniqueNonce&) -> Result<json>
{
    return jsonmsg::to_json(uniqueRegistry.nonce());
}
}
