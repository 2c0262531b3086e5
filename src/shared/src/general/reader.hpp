#pragma once

#include "general/byte_order.hpp"
#include "general/errors.hpp"
#include <cstring>
#include <span>
#include <vector>

// byte sequence stream-like reader with self-advancing cursor
class Reader {
    inline void read(void* out, size_t bytes)
    {
        if (bytes > remaining())
            throw Error(ECORRUPTED);
        memcpy(out, pos, bytes);
        pos += bytes;
    }
    template <typename T>
    T read()
    {
        T t;
        read(&t, sizeof(T));
        return t;
    }

public:
    Reader(std::span<const uint8_t> s)
        : pos(s.data())
        , end(s.data() + s.size())
    {
    }
    uint128_t uint128()
    {
        static_assert(sizeof(uint128_t) == 16);
        return ntoh128(read<uint128_t>());
    }
    uint32_t uint32()
    {
        static_assert(sizeof(uint32_t) == 4);
        return ntoh32(read<uint32_t>());
    }
    uint8_t uint8()
    {
        return read<uint8_t>();
    }

    // reads a 32 bit length prefixed byte sequence
    std::vector<uint8_t> vector()
    {
        size_t n { uint32() };
        if (n > remaining())
            throw Error(ECORRUPTED);
        std::vector<uint8_t> out(pos, pos + n);
        pos += n;
        return out;
    }
    size_t remaining() const { return end - pos; }
    bool eof() const { return pos == end; }

    // throws if trailing bytes were not consumed
    void assert_eof() const
    {
        if (!eof())
            throw Error(EEXCESSBYTES);
    }

private:
    const uint8_t* pos;
    const uint8_t* const end;
};

// parses a complete buffer into T, trailing bytes are an error
template <typename T>
[[nodiscard]] T parse_exact(std::span<const uint8_t> s)
{
    Reader r(s);
    T t(r);
    r.assert_eof();
    return t;
}
