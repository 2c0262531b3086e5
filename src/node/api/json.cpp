#include "json.hpp"
#include "general/hex.hpp"

using namespace nlohmann;

namespace jsonmsg {
namespace {
template <typename E>
json event_json(const E&, const char* registry)
{
    return json {
        { "event", E::event_name },
        { "registry", registry }
    };
}

json to_json_visit(const fungible::event::Created& e)
{
    auto j { event_json(e, "fungible") };
    j["owner"] = e.owner.to_string();
    j["assetId"] = e.asset_id.to_string();
    return j;
}
json to_json_visit(const fungible::event::MetadataSet& e)
{
    auto j { event_json(e, "fungible") };
    j["assetId"] = e.asset_id.to_string();
    j["name"] = serialize_hex(e.name);
    j["symbol"] = serialize_hex(e.symbol);
    return j;
}
json to_json_visit(const fungible::event::Minted& e)
{
    auto j { event_json(e, "fungible") };
    j["assetId"] = e.asset_id.to_string();
    j["owner"] = e.owner.to_string();
    j["totalSupply"] = e.total_supply.to_string();
    return j;
}
json to_json_visit(const fungible::event::Burned& e)
{
    auto j { event_json(e, "fungible") };
    j["assetId"] = e.asset_id.to_string();
    j["owner"] = e.owner.to_string();
    j["totalSupply"] = e.total_supply.to_string();
    return j;
}
json to_json_visit(const fungible::event::Transferred& e)
{
    auto j { event_json(e, "fungible") };
    j["assetId"] = e.asset_id.to_string();
    j["from"] = e.from.to_string();
    j["to"] = e.to.to_string();
    j["amount"] = e.amount.to_string();
    return j;
}

json to_json_visit(const unique::event::Created& e)
{
    auto j { event_json(e, "unique") };
    j["creator"] = e.creator.to_string();
    j["assetId"] = e.asset_id.to_string();
    return j;
}
json to_json_visit(const unique::event::Burned& e)
{
    auto j { event_json(e, "unique") };
    j["assetId"] = e.asset_id.to_string();
    j["owner"] = e.owner.to_string();
    j["totalSupply"] = e.total_supply.to_string();
    return j;
}
json to_json_visit(const unique::event::Transferred& e)
{
    auto j { event_json(e, "unique") };
    j["assetId"] = e.asset_id.to_string();
    j["from"] = e.from.to_string();
    j["to"] = e.to.to_string();
    j["amount"] = e.amount.to_string();
    return j;
}
}

json to_json(const fungible::Event& e)
{
    return std::visit([](auto& ev) { return to_json_visit(ev); }, e);
}

json to_json(const unique::Event& e)
{
    return std::visit([](auto& ev) { return to_json_visit(ev); }, e);
}

json to_json(const AssetId& id)
{
    return id.to_string();
}

json to_json(const Funds_uint128& f)
{
    return f.to_string();
}

json to_json(const AssetDetails& d)
{
    return json {
        { "owner", d.owner.to_string() },
        { "supply", d.supply.to_string() }
    };
}

json to_json(const AssetMetadata& m)
{
    return json {
        { "name", serialize_hex(m.name) },
        { "symbol", serialize_hex(m.symbol) }
    };
}

json to_json(const UniqueAssetDetails& d)
{
    return json {
        { "creator", d.creator.to_string() },
        { "metadata", serialize_hex(d.metadata) },
        { "supply", d.supply.to_string() }
    };
}
}
