#pragma once
#include <cstddef>
#include <cstdint>

// big-endian load/store helpers, ABI words and wire formats are big-endian
inline void store_be32(uint8_t* out, uint32_t v)
{
    out[0] = uint8_t(v >> 24);
    out[1] = uint8_t(v >> 16);
    out[2] = uint8_t(v >> 8);
    out[3] = uint8_t(v);
}

inline uint32_t load_be32(const uint8_t* in)
{
    return (uint32_t(in[0]) << 24) | (uint32_t(in[1]) << 16) | (uint32_t(in[2]) << 8) | uint32_t(in[3]);
}

inline void store_be64(uint8_t* out, uint64_t v)
{
    store_be32(out, uint32_t(v >> 32));
    store_be32(out + 4, uint32_t(v));
}

inline uint64_t load_be64(const uint8_t* in)
{
    return (uint64_t(load_be32(in)) << 32) | load_be32(in + 4);
}
