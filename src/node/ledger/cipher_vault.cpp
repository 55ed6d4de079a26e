#include "cipher_vault.hpp"
#include "crypto/hasher_sha256.hpp"
#include <random>

LocalCipherVault::LocalCipherVault(SQLite::Database& db, Address requester)
    : requesterId(requester)
    , createTables(db)
    , stmtInsert(db, "INSERT INTO `Ciphertexts` (`handle`, `tag`, `cleartext`) VALUES (?,?,?)")
    , stmtSelect(db, "SELECT `cleartext` FROM `Ciphertexts` WHERE `handle`=?")
    , stmtGrant(db, "INSERT OR IGNORE INTO `DecryptGrants` (`operator`) VALUES (?)")
    , stmtRevoke(db, "DELETE FROM `DecryptGrants` WHERE `operator`=?")
    , stmtHasGrant(db, "SELECT EXISTS(SELECT 1 FROM `DecryptGrants` WHERE `operator`=?)")
{
}

Result<codec::EncryptedValue> LocalCipherVault::encrypt(const codec::NativeValue& v,
    codec::TypeTag tag, uint8_t securityZone)
{
    auto word { codec::encode(v, tag) };
    if (!word)
        return word.error();

    std::random_device rd;
    std::array<uint8_t, 16> nonce;
    for (auto& b : nonce)
        b = uint8_t(rd());

    Hash digest { hash_args_SHA256(std::string_view("veilbatch/ciphertext"),
        std::span<const uint8_t>(nonce), codec::tag_to_wire(tag), securityZone,
        std::span<const uint8_t>(*word)) };
    auto handle { codec::Handle::make(digest, tag, securityZone) };
    stmtInsert.run(handle, codec::tag_to_wire(tag), *word);
    return codec::EncryptedValue {
        .handle { handle },
        .tag = tag,
        .securityZone = securityZone,
        .proof { digest.begin(), digest.end() }
    };
}

Result<codec::RawCleartext> LocalCipherVault::decrypt(const codec::Handle& h)
{
    if (!has_grant(requesterId))
        return Error(EDECRYPTUNAVAIL);
    auto r { stmtSelect.one(h) };
    if (!r.has_value())
        return Error(ENOTFOUND);
    return r.get_array<32>(0);
}

void LocalCipherVault::grant(const Address& operatorId)
{
    stmtGrant.run(operatorId);
}

void LocalCipherVault::revoke(const Address& operatorId)
{
    stmtRevoke.run(operatorId);
}

bool LocalCipherVault::has_grant(const Address& operatorId)
{
    return stmtHasGrant.one(operatorId).get<bool>(0);
}
