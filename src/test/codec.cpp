#include "codec/codec.hpp"
#include "crypto/hasher_sha256.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
using namespace std;
using namespace codec;

// cleartexts kept in memory, keyed by handle
class MemoryService : public DecryptionService {
public:
    bool available { true };
    EncryptedValue put(const NativeValue& v, TypeTag t)
    {
        auto word { encode(v, t) };
        assert(word);
        auto h { Handle::make(hashSHA256(std::span<const uint8_t>(*word)), t, 0) };
        store.insert_or_assign(h, *word);
        return { h, t, 0, {} };
    }
    void put_raw(const Handle& h, const RawCleartext& w) { store.insert_or_assign(h, w); }
    Result<RawCleartext> decrypt(const Handle& h) override
    {
        if (!available)
            return Error(EDECRYPTUNAVAIL);
        auto iter { store.find(h) };
        if (iter == store.end())
            return Error(ENOTFOUND);
        return iter->second;
    }

private:
    std::map<Handle, RawCleartext> store;
};

Address sample_address()
{
    auto a { Address::parse("0x00112233445566778899aabbccddeeff00112233") };
    assert(a);
    return *a;
}

void test_tags()
{
    assert(tag_from_wire(6).value() == TypeTag::Uint128);
    assert(tag_from_wire(7).value() == TypeTag::Address);
    assert(tag_from_wire(8).error().code == EDEPRECATEDTAG);
    assert(tag_from_wire(1).error().code == EUNSUPPORTEDTAG);
    assert(tag_from_wire(200).error().code == EUNSUPPORTEDTAG);
    assert(tag_bits(TypeTag::Uint8).value() == 8);
    assert(tag_bits(TypeTag::Address).value() == 160);
    assert(tag_bits(TypeTag::Uint256).error().code == EDEPRECATEDTAG);
}

void test_round_trip()
{
    MemoryService service;
    Codec c(service);
    auto check = [&](const NativeValue& v, TypeTag t) {
        auto ev { service.put(v, t) };
        auto d { c.decode(ev, t) };
        assert(d);
        assert(*d == v);
    };
    check(true, TypeTag::Bool);
    check(false, TypeTag::Bool);
    check(BigUint(255), TypeTag::Uint8);
    check(BigUint(0), TypeTag::Uint16);
    check(BigUint(0xFFFFFFFFull), TypeTag::Uint32);
    check(BigUint(0xFFFFFFFFFFFFFFFFull), TypeTag::Uint64);
    check(BigUint::pow2(128) - BigUint(1), TypeTag::Uint128);
    check(sample_address(), TypeTag::Address);

    auto d { c.decode(service.put(sample_address(), TypeTag::Address), TypeTag::Address) };
    assert(d->to_string() == "0x00112233445566778899aabbccddeeff00112233");
}

void test_mismatch()
{
    MemoryService service;
    Codec c(service);
    auto ev { service.put(BigUint(1000), TypeTag::Uint64) };
    // declared tag differs from expected
    assert(c.decode(ev, TypeTag::Uint128).error().code == ETYPEMISMATCH);
    // declared tag lies about the handle's true type
    auto lying { ev };
    lying.tag = TypeTag::Uint128;
    assert(c.decode(lying, TypeTag::Uint128).error().code == ETYPEMISMATCH);
    // Uint256 is rejected by name
    auto legacy { ev };
    legacy.tag = TypeTag::Uint256;
    assert(c.decode(legacy, TypeTag::Uint256).error().code == EDEPRECATEDTAG);
    // cleartext wider than the type fails closed
    std::array<uint8_t, 32> raw {};
    raw[15] = 1; // 2^128
    auto h { Handle::make(hashSHA256(std::span<const uint8_t>(raw)), TypeTag::Uint128, 0) };
    service.put_raw(h, raw);
    assert(c.decode({ h, TypeTag::Uint128, 0, {} }, TypeTag::Uint128).error().code == ETYPEMISMATCH);
}

void test_unavailable()
{
    MemoryService service;
    Codec c(service);
    auto ev { service.put(BigUint(7), TypeTag::Uint128) };
    service.available = false;
    assert(c.decode(ev, TypeTag::Uint128).error().code == EDECRYPTUNAVAIL);
    service.available = true;
    assert(c.decode(ev, TypeTag::Uint128).value() == NativeValue(BigUint(7)));
}

void test_encode()
{
    assert(encode(BigUint(256), TypeTag::Uint8).error().code == ETYPEMISMATCH);
    assert(encode(true, TypeTag::Uint8).error().code == ETYPEMISMATCH);
    assert(encode(BigUint(1), TypeTag::Uint256).error().code == EDEPRECATEDTAG);
    auto w { encode(sample_address(), TypeTag::Address) };
    assert(w);
    for (size_t i = 0; i < 12; ++i)
        assert((*w)[i] == 0);
    assert((*w)[12] == 0x00 && (*w)[13] == 0x11 && (*w)[31] == 0x33);

    CalldataFragment bad {};
    bad[30] = 1; // bool must be 0 or 1
    assert(decode_word(bad, TypeTag::Bool).error().code == ETYPEMISMATCH);
    CalldataFragment dirty {};
    dirty[0] = 1; // address with non-zero top bytes
    assert(decode_word(dirty, TypeTag::Address).error().code == ETYPEMISMATCH);
}

void test_calldata()
{
    Selector sel { 0xa9, 0x05, 0x9c, 0xbb };
    std::vector<TypedArg> args {
        { sample_address(), TypeTag::Address },
        { BigUint(1000), TypeTag::Uint128 },
    };
    std::vector<TypeTag> schema { TypeTag::Address, TypeTag::Uint128 };
    auto data { build_calldata(sel, args, schema) };
    assert(data);
    assert(data->size() == 4 + 2 * 32);
    assert((*data)[0] == 0xa9 && (*data)[3] == 0xbb);
    CalldataFragment second;
    std::copy(data->begin() + 36, data->end(), second.begin());
    assert(decode_word(second, TypeTag::Uint128).value() == NativeValue(BigUint(1000)));

    std::vector<TypeTag> wrong { TypeTag::Address, TypeTag::Uint64 };
    assert(build_calldata(sel, args, wrong).error().code == ETYPEMISMATCH);
    std::vector<TypeTag> shorter { TypeTag::Address };
    assert(build_calldata(sel, args, shorter).error().code == ESCHEMALEN);
}

int main()
{
    test_tags();
    test_round_trip();
    test_mismatch();
    test_unavailable();
    test_encode();
    test_calldata();
    cout << "codec tests passed" << endl;
    return 0;
}
