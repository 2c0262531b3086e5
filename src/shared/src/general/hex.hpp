#pragma once
#include "errors.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

void serialize_hex(const uint8_t* data, size_t size, char* out);
std::string serialize_hex(const uint8_t* data, size_t size);

[[nodiscard]] inline std::string serialize_hex(std::span<const uint8_t> s)
{
    return serialize_hex(s.data(), s.size());
}

bool parse_hex(std::string_view in, uint8_t* out, size_t out_size);

inline bool parse_hex(std::string_view in, std::vector<uint8_t>& out)
{
    if (in.size() % 2 != 0)
        return false;
    out.resize(in.size() / 2);
    return parse_hex(in, out.data(), in.size() / 2);
}
