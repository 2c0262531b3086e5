#pragma once

#include "general/serializer.hxx"
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

class Writer {
public:
    Writer(uint8_t* pos, size_t n)
        : pos(pos)
        , end(pos + n)
    {
    }
    Writer(std::span<uint8_t> s)
        : Writer(s.data(), s.size())
    {
    }
    ~Writer() { assert(pos <= end); }

    void write(const std::span<const uint8_t>& s)
    {
        assert(remaining() >= s.size());
        if (s.empty())
            return;
        memcpy(pos, s.data(), s.size());
        pos += s.size();
    }

    uint8_t* cursor() { return pos; }
    size_t remaining()
    {
        assert(end >= pos);
        return end - pos;
    }

private:
    uint8_t* pos;
    uint8_t* const end;
};

// serializes all arguments into one exactly sized buffer
template <typename... Ts>
[[nodiscard]] std::vector<uint8_t> serialize(const Ts&... ts)
{
    std::vector<uint8_t> out((count_bytes(ts) + ... + 0));
    Writer w(out);
    (w << ... << ts);
    return out;
}
