#include "funds.hpp"
#include "general/reader.hpp"

Funds_uint128::Funds_uint128(Reader& r)
    : val(r.uint128())
{
}

std::optional<Funds_uint128> Funds_uint128::parse(std::string_view s)
{
    if (auto v { parse_uint128(s) })
        return Funds_uint128(*v);
    return {};
}

std::string Funds_uint128::to_string() const
{
    return ::to_string(val);
}
