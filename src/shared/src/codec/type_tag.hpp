#pragma once
#include "general/result.hpp"
#include <cstdint>
#include <string_view>

namespace codec {

// Discriminant of the native type hidden behind a ciphertext handle.
// Wire values follow the coprocessor's type numbering, value 1 is unused.
enum class TypeTag : uint8_t {
    Bool = 0,
    Uint8 = 2,
    Uint16 = 3,
    Uint32 = 4,
    Uint64 = 5,
    Uint128 = 6,
    Address = 7,
    Uint256 = 8, // deprecated, always rejected
};

[[nodiscard]] Result<TypeTag> tag_from_wire(uint8_t);
constexpr uint8_t tag_to_wire(TypeTag t) { return uint8_t(t); }
std::string_view tag_name(TypeTag);

// number of value bits a word of this tag may carry, Error for Uint256
[[nodiscard]] Result<size_t> tag_bits(TypeTag);

}
