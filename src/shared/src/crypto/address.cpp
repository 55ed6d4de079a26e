#include "address.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"

std::optional<Address> Address::parse(std::string_view s)
{
    Address a;
    if (parse_hex(s, a))
        return a;
    return {};
}

Address::Address(std::string_view s)
{
    if (!parse_hex(s, *this))
        throw Error(EBADADDRESS);
}

std::string Address::to_string() const
{
    return serialize_hex0x(*this);
}
