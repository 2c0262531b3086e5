#pragma once
#include "general/byte_order.hpp"
#include <optional>
#include <string>
#include <string_view>

constexpr uint128_t uint128_max { ~uint128_t(0) };

// decimal representation, 64 bit integers cannot hold all values
std::string to_string(uint128_t);
[[nodiscard]] std::optional<uint128_t> parse_uint128(std::string_view);
