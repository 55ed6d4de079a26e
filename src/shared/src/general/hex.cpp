#include "hex.hpp"

void serialize_hex(const uint8_t* data, size_t size, char* out)
{
    constexpr const char* h = "0123456789abcdef";
    for (size_t i = 0; i < size; ++i) {
        out[2 * i] = h[data[i] >> 4];
        out[2 * i + 1] = h[data[i] & 15];
    }
}

std::string serialize_hex(const uint8_t* data, size_t size)
{
    std::string out;
    out.resize(2 * size);
    serialize_hex(data, size, out.data());
    return out;
}

namespace {
inline uint8_t hexdigit(char c, bool& valid)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    valid = false;
    return 0;
}

std::string_view strip_prefix(std::string_view in)
{
    if (in.size() >= 2 && in[0] == '0' && (in[1] == 'x' || in[1] == 'X'))
        in.remove_prefix(2);
    return in;
}
}

bool parse_hex(std::string_view in, uint8_t* out, size_t out_size)
{
    in = strip_prefix(in);
    if (in.size() != out_size * 2)
        return false;
    bool valid = true;
    for (size_t i = 0; i < out_size && valid; ++i) {
        out[i] = (hexdigit(in[2 * i], valid) << 4)
            + (hexdigit(in[2 * i + 1], valid));
    }
    return valid;
}

std::vector<uint8_t> hex_to_vec(std::string_view in)
{
    in = strip_prefix(in);
    if (in.size() % 2 != 0)
        throw Error(EINV_HEX);
    std::vector<uint8_t> out(in.size() / 2);
    if (!parse_hex(in, out.data(), out.size()))
        throw Error(EINV_HEX);
    return out;
}
