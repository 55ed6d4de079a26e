#pragma once
#include "encrypted_value.hpp"
#include "native_value.hpp"
#include <array>
#include <span>
#include <vector>

namespace codec {

// one 32 byte ABI word
using CalldataFragment = std::array<uint8_t, 32>;
using Selector = std::array<uint8_t, 4>;

// big-endian 32 byte plaintext as returned by the decryption service
using RawCleartext = std::array<uint8_t, 32>;

// Threshold-decryption service. Tag-agnostic: it only resolves a handle
// to its raw plaintext, interpretation happens in Codec::decode.
class DecryptionService {
public:
    virtual ~DecryptionService() = default;
    [[nodiscard]] virtual Result<RawCleartext> decrypt(const Handle&) = 0;
};

// encryption side, used to re-encrypt published amounts
class EncryptionService {
public:
    virtual ~EncryptionService() = default;
    [[nodiscard]] virtual Result<EncryptedValue> encrypt(const NativeValue&, TypeTag, uint8_t securityZone) = 0;
};

[[nodiscard]] Result<CalldataFragment> encode(const NativeValue&, TypeTag);
[[nodiscard]] Result<NativeValue> decode_word(const CalldataFragment&, TypeTag);

struct TypedArg {
    NativeValue value;
    TypeTag tag;
};

// selector followed by one word per argument, each argument's tag must
// equal the corresponding schema slot
[[nodiscard]] Result<std::vector<uint8_t>> build_calldata(const Selector&,
    std::span<const TypedArg> args, std::span<const TypeTag> expectedSchema);

class Codec {
public:
    Codec(DecryptionService& service)
        : service(service)
    {
    }
    [[nodiscard]] Result<NativeValue> decode(const EncryptedValue&, TypeTag expected);

private:
    DecryptionService& service;
};

}
