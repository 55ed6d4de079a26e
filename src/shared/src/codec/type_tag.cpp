#include "type_tag.hpp"

namespace codec {

Result<TypeTag> tag_from_wire(uint8_t b)
{
    switch (b) {
    case tag_to_wire(TypeTag::Bool):
        return TypeTag::Bool;
    case tag_to_wire(TypeTag::Uint8):
        return TypeTag::Uint8;
    case tag_to_wire(TypeTag::Uint16):
        return TypeTag::Uint16;
    case tag_to_wire(TypeTag::Uint32):
        return TypeTag::Uint32;
    case tag_to_wire(TypeTag::Uint64):
        return TypeTag::Uint64;
    case tag_to_wire(TypeTag::Uint128):
        return TypeTag::Uint128;
    case tag_to_wire(TypeTag::Address):
        return TypeTag::Address;
    case tag_to_wire(TypeTag::Uint256):
        return Error(EDEPRECATEDTAG);
    }
    return Error(EUNSUPPORTEDTAG);
}

std::string_view tag_name(TypeTag t)
{
    switch (t) {
    case TypeTag::Bool:
        return "Bool";
    case TypeTag::Uint8:
        return "Uint8";
    case TypeTag::Uint16:
        return "Uint16";
    case TypeTag::Uint32:
        return "Uint32";
    case TypeTag::Uint64:
        return "Uint64";
    case TypeTag::Uint128:
        return "Uint128";
    case TypeTag::Address:
        return "Address";
    case TypeTag::Uint256:
        return "Uint256";
    }
    return "Unknown";
}

Result<size_t> tag_bits(TypeTag t)
{
    switch (t) {
    case TypeTag::Bool:
        return size_t(1);
    case TypeTag::Uint8:
        return size_t(8);
    case TypeTag::Uint16:
        return size_t(16);
    case TypeTag::Uint32:
        return size_t(32);
    case TypeTag::Uint64:
        return size_t(64);
    case TypeTag::Uint128:
        return size_t(128);
    case TypeTag::Address:
        return size_t(160);
    case TypeTag::Uint256:
        return Error(EDEPRECATEDTAG);
    }
    return Error(EUNSUPPORTEDTAG);
}

}
