#include "uint128.hpp"
#include <algorithm>

std::string to_string(uint128_t v)
{
    if (v == 0)
        return "0";
    std::string out;
    while (v != 0) {
        out.push_back(char('0' + int(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<uint128_t> parse_uint128(std::string_view s)
{
    if (s.empty())
        return {};
    uint128_t v { 0 };
    for (char c : s) {
        if (c < '0' || c > '9')
            return {};
        uint8_t digit(c - '0');
        if (v > (uint128_max - digit) / 10)
            return {}; // overflow
        v = v * 10 + digit;
    }
    return v;
}
