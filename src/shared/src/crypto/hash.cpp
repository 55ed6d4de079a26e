#include "hash.hpp"
#include "general/hex.hpp"

std::string Hash::hex_string() const
{
    return serialize_hex0x(*this);
}

std::optional<Hash> Hash::parse_string(std::string_view hex)
{
    auto h { uninitialized() };
    if (parse_hex(hex, h))
        return h;
    return {};
}
