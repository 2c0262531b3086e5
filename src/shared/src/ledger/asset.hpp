#pragma once
#include "general/funds.hpp"
#include "ledger/account_id.hpp"
#include "ledger/asset_id.hpp"
#include <cstdint>
#include <vector>

class Reader;

using Bytes = std::vector<uint8_t>;

// fungible asset record
struct AssetDetails {
    AccountId owner;
    Funds_uint128 supply;

    static AssetDetails created_by(AccountId owner)
    {
        return { std::move(owner), Funds_uint128::zero() };
    }
    AssetDetails(AccountId owner, Funds_uint128 supply)
        : owner(std::move(owner))
        , supply(supply)
    {
    }
    AssetDetails(Reader& r);
    bool operator==(const AssetDetails&) const = default;
    void serialize(Serializer auto&& s) const
    {
        s << owner << supply;
    }
};

// opaque name and symbol, no schema is enforced
struct AssetMetadata {
    Bytes name;
    Bytes symbol;

    AssetMetadata(Bytes name, Bytes symbol)
        : name(std::move(name))
        , symbol(std::move(symbol))
    {
    }
    AssetMetadata(Reader& r);
    bool operator==(const AssetMetadata&) const = default;
    void serialize(Serializer auto&& s) const
    {
        s << name << symbol;
    }
};

struct UniqueAssetDetails {
    AccountId creator;
    Bytes metadata;
    Funds_uint128 supply;

    UniqueAssetDetails(AccountId creator, Bytes metadata, Funds_uint128 supply)
        : creator(std::move(creator))
        , metadata(std::move(metadata))
        , supply(supply)
    {
    }
    UniqueAssetDetails(Reader& r);
    bool operator==(const UniqueAssetDetails&) const = default;
    void serialize(Serializer auto&& s) const
    {
        s << creator << metadata << supply;
    }
};
