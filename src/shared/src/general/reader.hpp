#pragma once

#include "general/big_endian.hpp"
#include "general/errors.hpp"
#include <array>
#include <cstring>
#include <span>
#include <string_view>

// byte sequence stream-like reader with self-advancing cursor,
// throws Error(EMSGINTEGRITY) when reading past the end
class Reader {
    inline void read(void* out, size_t bytes)
    {
        auto newpos { pos + bytes };
        if (bytes > remaining())
            throw Error(EMSGINTEGRITY);
        memcpy(out, pos, bytes);
        pos = newpos;
    }

public:
    Reader(std::span<const uint8_t> s)
        : begin(s.data())
        , pos(begin)
        , end(s.data() + s.size())
    {
    }
    template <size_t N>
    operator std::array<uint8_t, N>()
    {
        return arr<N>();
    }
    template <size_t N>
    std::array<uint8_t, N> arr()
    {
        std::array<uint8_t, N> a;
        read(a.data(), N);
        return a;
    }
    uint64_t uint64()
    {
        uint8_t buf[8];
        read(buf, 8);
        return load_be64(buf);
    }
    uint32_t uint32()
    {
        uint8_t buf[4];
        read(buf, 4);
        return load_be32(buf);
    }
    uint8_t uint8()
    {
        uint8_t b;
        read(&b, 1);
        return b;
    }
    operator uint64_t()
    {
        return uint64();
    }
    operator uint32_t()
    {
        return uint32();
    }
    operator uint8_t()
    {
        return uint8();
    }
    std::span<const uint8_t> take_span(size_t len)
    {
        auto p = pos;
        skip(len);
        return { p, len };
    }
    std::string_view string_view()
    {
        auto s { take_span(uint32()) };
        return { reinterpret_cast<const char*>(s.data()), s.size() };
    }
    std::span<const uint8_t> rest()
    {
        return take_span(remaining());
    };

    void skip(size_t nbytes)
    {
        if (nbytes > remaining())
            throw Error(EMSGINTEGRITY);
        pos += nbytes;
    };
    bool eof() const { return pos == end; }
    size_t offset() const { return pos - begin; }
    size_t remaining() const { return end - pos; }

private:
    const uint8_t* begin;
    const uint8_t* pos;
    const uint8_t* end;
};
