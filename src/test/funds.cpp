#include "general/funds.hpp"
#include "general/hex.hpp"
#include "general/reader.hpp"
#include "general/writer.hpp"
#include <cassert>
#include <iostream>
using namespace std;

const std::string u128maxString { "340282366920938463463374607431768211455" };

void test_to_string()
{
    assert(Funds_uint128::zero().to_string() == "0");
    assert(Funds_uint128(1234567890).to_string() == "1234567890");
    assert(Funds_uint128::max().to_string() == u128maxString);
    uint128_t above64 { uint128_t(1) << 64 };
    assert(Funds_uint128(above64).to_string() == "18446744073709551616");
}

void test_parse()
{
    assert(Funds_uint128::parse("0") == Funds_uint128::zero());
    assert(Funds_uint128::parse("100")->value() == 100);
    assert(Funds_uint128::parse(u128maxString) == Funds_uint128::max());
    // one above the maximum
    assert(!Funds_uint128::parse("340282366920938463463374607431768211456"));
    assert(!Funds_uint128::parse(""));
    assert(!Funds_uint128::parse("-1"));
    assert(!Funds_uint128::parse("1.5"));
    assert(!Funds_uint128::parse("12a"));
}

void test_checked()
{
    auto m { Funds_uint128::max() };
    assert(Funds_uint128::sum(40, 60) == Funds_uint128(100));
    assert(!Funds_uint128::sum(m, 1));
    assert(Funds_uint128::diff(100, 40) == Funds_uint128(60));
    assert(!Funds_uint128::diff(40, 100));
}

void test_saturating()
{
    auto m { Funds_uint128::max() };
    assert(Funds_uint128::saturating_sum(m, 1) == m);
    assert(Funds_uint128::saturating_sum(m, m) == m);
    assert(Funds_uint128::saturating_sum(1, 2) == Funds_uint128(3));
    assert(Funds_uint128::saturating_diff(10, 30) == Funds_uint128::zero());
    assert(Funds_uint128::saturating_diff(30, 10) == Funds_uint128(20));
    assert(Funds_uint128::min(30, 10) == Funds_uint128(10));
}

void test_serialization()
{
    Funds_uint128 f { (uint128_t(0x0102030405060708) << 64) | 0x090a0b0c0d0e0f10 };
    auto bytes { serialize(f) };
    assert(bytes.size() == Funds_uint128::byte_size());
    // big endian
    assert(serialize_hex(bytes) == "0102030405060708090a0b0c0d0e0f10");
    assert(parse_exact<Funds_uint128>(bytes) == f);

    // trailing bytes are rejected
    bytes.push_back(0);
    try {
        auto g { parse_exact<Funds_uint128>(bytes) };
        assert(false);
    } catch (Error e) {
        assert(e.code == EEXCESSBYTES);
    }

    // truncated input is rejected
    bytes.resize(10);
    try {
        auto g { parse_exact<Funds_uint128>(bytes) };
        assert(false);
    } catch (Error e) {
        assert(e.code == ECORRUPTED);
    }
}

void test_hex()
{
    std::vector<uint8_t> out;
    assert(parse_hex("00ff10", out));
    assert(out == std::vector<uint8_t>({ 0x00, 0xff, 0x10 }));
    assert(!parse_hex("abc", out));
    assert(!parse_hex("zz", out));
}

int main()
{
    test_to_string();
    test_parse();
    test_checked();
    test_saturating();
    test_serialization();
    test_hex();
    cout << "funds tests passed" << endl;
    return 0;
}
