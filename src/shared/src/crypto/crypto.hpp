#pragma once

#include "address.hpp"
#include "hash.hpp"
#include "secp256k1.h"
#include "secp256k1_recovery.h"
#include <array>
#include <optional>
#include <span>
#include <string>

void ECC_Start();
void ECC_Stop();

// forward declaractions
class RecoverableSignature;

class PubKey {
    friend class PrivKey;
    friend class RecoverableSignature;

public:
    PubKey(const std::string&);
    bool operator==(const PubKey& rhs) const;
    // operator id: last 20 bytes of SHA256 over the compressed key
    Address address() const;
    std::string to_string() const;

private:
    PubKey() {};
    PubKey(const RecoverableSignature& recsig, const Hash&);
    std::array<uint8_t, 33> serialize() const;

private:
    secp256k1_pubkey pubkey;
};

class PrivKey {
public:
    PrivKey();
    PrivKey(std::string_view hex);
    std::string to_string() const;
    friend bool operator==(const PrivKey& a, const PrivKey& b);
    PubKey pubkey() const;
    RecoverableSignature sign(const Hash&) const;

private: // private methods
    static bool check(const uint8_t* vch);

private: // private data
    std::array<uint8_t, 32> keydata;
};

class RecoverableSignature {
public:
    static constexpr size_t length = 65;
    friend class PrivKey;
    friend class PubKey;
    RecoverableSignature(std::span<const uint8_t, 65>);
    RecoverableSignature(std::string_view hex);
    static std::optional<RecoverableSignature> from_bytes(std::span<const uint8_t>);
    std::string to_string() const;
    void serialize(uint8_t* out65) const;
    std::array<uint8_t, 65> serialize() const
    {
        std::array<uint8_t, 65> res;
        serialize(res.data());
        return res;
    };
    PubKey recover_pubkey(const Hash&) const;

private: // private methods
    RecoverableSignature() {}; // uninitialized
    bool construct(std::span<const uint8_t, 65>);
    bool check() const; // check for lower S
    RecoverableSignature(const uint8_t* keydata, const Hash&);

private: // private data
    secp256k1_ecdsa_recoverable_signature recsig;
};
