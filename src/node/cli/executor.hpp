#pragma once
#include "api/event_sink.hpp"
#include "cli/command.hpp"
#include "ledger/fungible_registry.hpp"
#include "ledger/unique_registry.hpp"
#include "nlohmann/json.hpp"

namespace cli {

// Plays the authenticating dispatcher: supplies the caller identity,
// runs parsed commands against both registries sharing one store and
// renders the outcome as JSON.
class Executor {
public:
    Executor(store::KVStore& kv, std::optional<AccountId> defaultCaller);

    // {"code":0,"data":...,"events":[...]} on success,
    // {"code":<n>,"error":...,"name":...} on failure
    nlohmann::json run(const Invocation&);
    nlohmann::json run(const std::vector<std::string>& tokens);

private:
    using json = nlohmann::json;
    [[nodiscard]] Result<AccountId> caller(const Invocation&) const;

    Result<json> handle(const Invocation&, const command::Create&);
    Result<json> handle(const Invocation&, const command::SetMetadata&);
    Result<json> handle(const Invocation&, const command::Mint&);
    Result<json> handle(const Invocation&, const command::Burn&);
    Result<json> handle(const Invocation&, const command::Transfer&);
    Result<json> handle(const Invocation&, const command::Asset&);
    Result<json> handle(const Invocation&, const command::Metadata&);
    Result<json> handle(const Invocation&, const command::Balance&);
    Result<json> handle(const Invocation&, const command::Nonce&);
    Result<json> handle(const Invocation&, const command::UniqueMint&);
    Result<json> handle(const Invocation&, const command::UniqueBurn&);
    Result<json> handle(const Invocation&, const command::UniqueTransfer&);
    Result<json> handle(const Invocation&, const command::UniqueAsset&);
    Result<json> handle(const Invocation&, const command::UniqueBalance&);
    Result<json> handle(const Invocation&, const command::UniqueNonce&);

    std::optional<AccountId> defaultCaller;
    api::JsonEventSink sink;
    fungible::Registry fungibleRegistry;
    unique::Registry uniqueRegistry;
};
}
