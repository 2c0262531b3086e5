#pragma once
#include "general/errors.hpp"
#include "general/result.hpp"
#include "ledger/asset.hpp"
#include "ledger/events.hpp"
#include "nlohmann/json.hpp"
#include <type_traits>

namespace jsonmsg {
using namespace nlohmann;

json to_json(const fungible::Event&);
json to_json(const unique::Event&);
json to_json(const AssetId&);
json to_json(const Funds_uint128&);
json to_json(const AssetDetails&);
json to_json(const AssetMetadata&);
json to_json(const UniqueAssetDetails&);
inline json to_json(const json& j) { return j; }

template <typename T>
inline json to_json(const std::optional<T>& o)
{
    if (!o)
        return nullptr;
    return to_json(*o);
}

inline json status(Error e)
{
    json j;
    j["code"] = e.code;
    if (e.is_error()) {
        j["error"] = e.strerror();
        j["name"] = e.err_name();
    } else {
        j["error"] = nullptr;
    }
    return j;
}

inline json success_json(json data, json events)
{
    json j {
        { "code", 0 },
        { "data", std::move(data) }
    };
    if (!events.empty())
        j["events"] = std::move(events);
    return j;
}

template <typename T>
inline json serialize(const Result<T>& r, json events)
{
    if (!r.has_value())
        return status(r.error());
    if constexpr (std::is_void_v<T>)
        return success_json(nullptr, std::move(events));
    else
        return success_json(to_json(*r), std::move(events));
}
}
