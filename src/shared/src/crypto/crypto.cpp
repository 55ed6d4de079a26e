#include "crypto.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"
#include "hasher_sha256.hpp"
#include <algorithm>
#include <climits>
#include <cstring>
#include <functional>
#include <random>
#include <stdexcept>

namespace {
secp256k1_context* secp256k1_ctx = nullptr;
}

void ECC_Start()
{
    if (secp256k1_ctx != nullptr)
        return;
    secp256k1_ctx = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY | SECP256K1_CONTEXT_SIGN);
    if (secp256k1_ctx == nullptr)
        throw std::runtime_error("Cannot create secp256k1 context");
}

void ECC_Stop()
{
    if (secp256k1_ctx)
        secp256k1_context_destroy(secp256k1_ctx);
    secp256k1_ctx = nullptr;
}

//////////////////////////////
// PubKey methods
//////////////////////////////

PubKey::PubKey(const std::string& hex)
{
    std::array<uint8_t, 33> serialized;
    if (parse_hex(hex, serialized) && secp256k1_ec_pubkey_parse(secp256k1_ctx, &pubkey, serialized.data(), serialized.size()))
        return;
    throw Error(EBADPUBKEY);
};

bool PubKey::operator==(const PubKey& rhs) const
{
    return secp256k1_ec_pubkey_cmp(secp256k1_ctx, &pubkey, &rhs.pubkey) == 0;
};

Address PubKey::address() const
{
    auto serialized { serialize() };
    auto sha { hashSHA256(serialized.data(), serialized.size()) };
    Address ret;
    std::copy(sha.end() - 20, sha.end(), ret.begin());
    return ret;
}

std::array<uint8_t, 33> PubKey::serialize() const
{
    std::array<uint8_t, 33> ret;
    size_t len = ret.size();
    int ok { secp256k1_ec_pubkey_serialize(secp256k1_ctx, ret.data(), &len, &pubkey,
        SECP256K1_EC_COMPRESSED) };
    if (!ok)
        throw Error(EBADPUBKEY);
    return ret;
}
std::string PubKey::to_string() const { return serialize_hex(serialize()); }

PubKey::PubKey(const RecoverableSignature& recsig, const Hash& h)
{
    if (!secp256k1_ecdsa_recover(secp256k1_ctx, &pubkey, &recsig.recsig, h.data()))
        throw Error(ECORRUPTEDSIG);
};

//////////////////////////////
// Key methods
//////////////////////////////

PrivKey::PrivKey()
{
    // Be careful on exotic systems where std::random_device is not secure.
    std::independent_bits_engine<std::random_device, CHAR_BIT, uint16_t> e;
    do {
        std::generate(std::begin(keydata), std::end(keydata), [&]() { return uint8_t(e()); });
    } while (!check(keydata.data()));
}

PrivKey::PrivKey(std::string_view key)
{
    if (!parse_hex(key, keydata) || check(keydata.data()) == false)
        throw Error(EBADPRIVKEY);
};

bool operator==(const PrivKey& a, const PrivKey& b)
{
    return memcmp(a.keydata.data(), b.keydata.data(), b.keydata.size()) == 0;
}

std::string PrivKey::to_string() const { return serialize_hex(keydata); }

PubKey PrivKey::pubkey() const
{
    PubKey pk {};
    if (!secp256k1_ec_pubkey_create(secp256k1_ctx, &pk.pubkey, keydata.data()))
        throw Error(EBADPRIVKEY);
    return pk;
};
RecoverableSignature PrivKey::sign(const Hash& h) const
{
    return RecoverableSignature(keydata.data(), h);
};

bool PrivKey::check(const uint8_t* vch)
{
    return secp256k1_ec_seckey_verify(secp256k1_ctx, vch);
};

//////////////////////////////
// RecoverableSignature methods
//////////////////////////////

std::optional<RecoverableSignature> RecoverableSignature::from_bytes(std::span<const uint8_t> s)
{
    if (s.size() != length)
        return {};
    RecoverableSignature res { RecoverableSignature() };
    if (res.construct(s.first<65>()))
        return res;
    return {};
}

bool RecoverableSignature::construct(std::span<const uint8_t, 65> v)
{
    int recid = v[64];
    if (recid < 0 || recid > 3 || (secp256k1_ecdsa_recoverable_signature_parse_compact(secp256k1_ctx, &recsig, v.data(), recid) != 1) || (check() != true)) {
        return false;
    }
    return true;
};

RecoverableSignature::RecoverableSignature(std::span<const uint8_t, 65> v)
{
    if (!construct(v))
        throw Error(ECORRUPTEDSIG);
}

namespace {
std::array<uint8_t, 65> parse_sig(std::string_view sv)
{
    std::array<uint8_t, 65> out;
    if (!parse_hex(sv, out))
        throw Error(EPARSESIG);
    return out;
}
}

RecoverableSignature::RecoverableSignature(std::string_view sv)
    : RecoverableSignature(std::span<const uint8_t, 65>(parse_sig(sv)))
{
}

bool RecoverableSignature::check() const // check for lower S
{
    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_convert(secp256k1_ctx, &sig, &recsig))
        return false;
    int res = secp256k1_ecdsa_signature_normalize(secp256k1_ctx, nullptr, &sig);
    return res == 0;
}

void RecoverableSignature::serialize(uint8_t* out65) const
{
    int recid { -1 };
    secp256k1_ecdsa_recoverable_signature_serialize_compact(
        secp256k1_ctx, out65, &recid, &recsig);
    out65[64] = uint8_t(recid);
}

std::string RecoverableSignature::to_string() const
{
    return serialize_hex(serialize());
}
PubKey RecoverableSignature::recover_pubkey(const Hash& h) const
{
    return PubKey(*this, h);
}

RecoverableSignature::RecoverableSignature(const uint8_t* keydata, const Hash& h)
{
    int ret = secp256k1_ecdsa_sign_recoverable(
        secp256k1_ctx, &recsig, h.data(), keydata,
        secp256k1_nonce_function_rfc6979, nullptr);
    if (!ret)
        throw Error(EBADPRIVKEY);
}
