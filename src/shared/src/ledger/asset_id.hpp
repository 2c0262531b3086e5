#pragma once
#include "general/serializer.hxx"
#include "general/uint128.hpp"
#include <string>

class Reader;

struct AssetId {
public:
    constexpr explicit AssetId(uint128_t val)
        : val(val) { };
    AssetId(Reader& r);
    static constexpr size_t byte_size() { return sizeof(val); }
    static constexpr AssetId max() { return AssetId { uint128_max }; }

    bool operator==(const AssetId&) const = default;
    auto operator<=>(const AssetId&) const = default;

    constexpr uint128_t value() const
    {
        return val;
    }
    std::string to_string() const { return ::to_string(val); }
    [[nodiscard]] static std::optional<AssetId> parse(std::string_view s)
    {
        if (auto v { parse_uint128(s) })
            return AssetId { *v };
        return {};
    }
    void serialize(Serializer auto& s) const
    {
        s << value();
    }

private:
    uint128_t val;
};
