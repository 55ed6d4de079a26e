#include "encrypted_value.hpp"
#include <algorithm>

namespace codec {

Handle Handle::make(const Hash& digest, TypeTag t, uint8_t securityZone)
{
    std::array<uint8_t, 32> a;
    std::copy(digest.begin(), digest.begin() + 30, a.begin());
    a[30] = tag_to_wire(t);
    a[31] = securityZone;
    return Handle { a };
}

std::optional<Handle> Handle::parse_string(std::string_view s)
{
    std::array<uint8_t, 32> a;
    if (!parse_hex(s, a))
        return {};
    return Handle { a };
}

}
