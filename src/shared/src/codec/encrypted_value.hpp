#pragma once
#include "crypto/hash.hpp"
#include "general/hex.hpp"
#include "type_tag.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace codec {

// Opaque 32 byte ciphertext reference. Layout:
//   [0..29]  digest bytes
//   [30]     wire type tag of the encrypted value
//   [31]     security zone
class Handle : public std::array<uint8_t, 32> {
public:
    Handle(std::array<uint8_t, 32> arr)
        : array(arr)
    {
    }
    static Handle make(const Hash& digest, TypeTag, uint8_t securityZone);
    static std::optional<Handle> parse_string(std::string_view);
    uint8_t type_byte() const { return (*this)[30]; }
    uint8_t security_zone() const { return (*this)[31]; }
    std::string hex_string() const { return serialize_hex0x(*this); }
    void serialize(auto& s) const
    {
        s.write(std::span<const uint8_t>(data(), size()));
    }
};

struct EncryptedValue {
    Handle handle;
    TypeTag tag;
    uint8_t securityZone { 0 };
    std::vector<uint8_t> proof;
};

}
