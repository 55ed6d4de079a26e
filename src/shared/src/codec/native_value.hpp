#pragma once
#include "crypto/address.hpp"
#include "general/big_uint.hpp"
#include "tools/variant.hpp"
#include <string>

namespace codec {

// Cleartext interpretation of a ciphertext. Every integer width
// decodes to BigUint, addresses to the canonical 20 byte form.
struct NativeValue : public vbt::variant<bool, BigUint, Address> {
    using vbt::variant<bool, BigUint, Address>::variant;

    bool operator==(const NativeValue& other) const
    {
        return static_cast<const std::variant<bool, BigUint, Address>&>(*this)
            == static_cast<const std::variant<bool, BigUint, Address>&>(other);
    }

    // "true"/"false", decimal, or 0x-prefixed lowercase hex
    std::string to_string() const
    {
        return visit_overload(
            [](bool b) -> std::string { return b ? "true" : "false"; },
            [](const BigUint& u) -> std::string { return u.to_string(); },
            [](const Address& a) -> std::string { return a.to_string(); });
    }
};

}
