#pragma once
#include "general/errors.hpp"
#include "general/serializer.hxx"
#include "general/uint128.hpp"
#include <cassert>
#include <optional>
#include <string>

class Reader;

// Token quantity used for balances and total supply.
// Growth and shrinkage of ledger quantities never traps: callers pick
// between checked (optional returning), throwing and saturating variants.
class Funds_uint128 {
public:
    constexpr Funds_uint128(uint128_t v)
        : val(v)
    {
    }
    Funds_uint128(Reader& r);
    static constexpr Funds_uint128 zero() { return { 0 }; }
    static constexpr Funds_uint128 max() { return { uint128_max }; }
    static constexpr size_t byte_size() { return sizeof(uint128_t); }

    constexpr uint128_t value() const { return val; }
    bool is_zero() const { return val == 0; }
    auto operator<=>(const Funds_uint128&) const = default;

    static std::optional<Funds_uint128> sum(Funds_uint128 a, Funds_uint128 b)
    {
        auto s { a.val + b.val };
        if (s < a.val)
            return {};
        return Funds_uint128(s);
    }
    static std::optional<Funds_uint128> diff(Funds_uint128 a, Funds_uint128 b)
    {
        if (a.val < b.val)
            return {};
        return Funds_uint128(a.val - b.val);
    }
    static Funds_uint128 diff_assert(Funds_uint128 a, Funds_uint128 b)
    {
        auto d { diff(a, b) };
        assert(d.has_value());
        return *d;
    }

    // clamp at the representable bounds instead of wrapping
    static constexpr Funds_uint128 saturating_sum(Funds_uint128 a, Funds_uint128 b)
    {
        auto s { a.val + b.val };
        if (s < a.val)
            return max();
        return s;
    }
    static constexpr Funds_uint128 saturating_diff(Funds_uint128 a, Funds_uint128 b)
    {
        if (a.val < b.val)
            return zero();
        return a.val - b.val;
    }
    static constexpr Funds_uint128 min(Funds_uint128 a, Funds_uint128 b)
    {
        return a < b ? a : b;
    }

    [[nodiscard]] static std::optional<Funds_uint128> parse(std::string_view);
    std::string to_string() const;

    void serialize(Serializer auto&& s) const
    {
        s << val;
    }

private:
    uint128_t val;
};
