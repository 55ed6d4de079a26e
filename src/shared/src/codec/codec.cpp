#include "codec.hpp"
#include <algorithm>

namespace codec {
namespace {
    bool holds_for(const NativeValue& v, TypeTag t)
    {
        switch (t) {
        case TypeTag::Bool:
            return v.holds<bool>();
        case TypeTag::Uint8:
        case TypeTag::Uint16:
        case TypeTag::Uint32:
        case TypeTag::Uint64:
        case TypeTag::Uint128:
            return v.holds<BigUint>();
        case TypeTag::Address:
            return v.holds<Address>();
        case TypeTag::Uint256:
            return false;
        }
        return false;
    }
}

Result<CalldataFragment> encode(const NativeValue& v, TypeTag t)
{
    auto bits { tag_bits(t) };
    if (!bits)
        return bits.error();
    if (!holds_for(v, t))
        return Error(ETYPEMISMATCH);
    return v.visit_overload(
        [](bool b) -> Result<CalldataFragment> {
            CalldataFragment w {};
            w[31] = b ? 1 : 0;
            return w;
        },
        [&](const BigUint& u) -> Result<CalldataFragment> {
            if (!u.fits_bits(*bits))
                return Error(ETYPEMISMATCH);
            return u.to_be_bytes();
        },
        [](const Address& a) -> Result<CalldataFragment> {
            CalldataFragment w {};
            std::copy(a.begin(), a.end(), w.begin() + 12);
            return w;
        });
}

Result<NativeValue> decode_word(const CalldataFragment& w, TypeTag t)
{
    auto bits { tag_bits(t) };
    if (!bits)
        return bits.error();
    BigUint u { BigUint::from_be_bytes(w) };
    if (!u.fits_bits(*bits))
        return Error(ETYPEMISMATCH);
    switch (t) {
    case TypeTag::Bool:
        return NativeValue { !u.is_zero() };
    case TypeTag::Uint8:
    case TypeTag::Uint16:
    case TypeTag::Uint32:
    case TypeTag::Uint64:
    case TypeTag::Uint128:
        return NativeValue { u };
    case TypeTag::Address: {
        std::array<uint8_t, 20> a;
        std::copy(w.begin() + 12, w.end(), a.begin());
        return NativeValue { Address(a) };
    }
    case TypeTag::Uint256:
        return Error(EDEPRECATEDTAG);
    }
    return Error(EUNSUPPORTEDTAG);
}

Result<std::vector<uint8_t>> build_calldata(const Selector& selector,
    std::span<const TypedArg> args, std::span<const TypeTag> expectedSchema)
{
    if (args.size() != expectedSchema.size())
        return Error(ESCHEMALEN);
    std::vector<uint8_t> out(selector.begin(), selector.end());
    out.reserve(4 + 32 * args.size());
    for (size_t i = 0; i < args.size(); ++i) {
        auto& a { args[i] };
        if (a.tag != expectedSchema[i])
            return Error(ETYPEMISMATCH);
        auto w { encode(a.value, a.tag) };
        if (!w)
            return w.error();
        out.insert(out.end(), w->begin(), w->end());
    }
    return out;
}

Result<NativeValue> Codec::decode(const EncryptedValue& ev, TypeTag expected)
{
    if (auto bits { tag_bits(expected) }; !bits)
        return bits.error();
    if (ev.tag != expected)
        return Error(ETYPEMISMATCH);

    // the handle carries the type the value was encrypted as
    auto trueTag { tag_from_wire(ev.handle.type_byte()) };
    if (!trueTag)
        return trueTag.error();
    if (*trueTag != expected)
        return Error(ETYPEMISMATCH);

    auto raw { service.decrypt(ev.handle) };
    if (!raw)
        return raw.error();
    return decode_word(*raw, expected);
}

}
