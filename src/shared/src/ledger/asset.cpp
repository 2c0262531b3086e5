#include "asset.hpp"
#include "general/reader.hpp"

AssetId::AssetId(Reader& r)
    : val(r.uint128())
{
}

AccountId::AccountId(Reader& r)
    : id([&r]() {
        auto v { r.vector() };
        return std::string(v.begin(), v.end());
    }())
{
}

AssetDetails::AssetDetails(Reader& r)
    : owner(r)
    , supply(r)
{
}

AssetMetadata::AssetMetadata(Reader& r)
    : name(r.vector())
    , symbol(r.vector())
{
}

UniqueAssetDetails::UniqueAssetDetails(Reader& r)
    : creator(r)
    , metadata(r.vector())
    , supply(r)
{
}
