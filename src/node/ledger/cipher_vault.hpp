#pragma once
#include "codec/codec.hpp"
#include "crypto/address.hpp"
#include "db/sqlite.hpp"

// Local stand-in for the threshold FHE coprocessor. Cleartexts are kept
// in the ledger database next to their handles. Decryption is served only
// to operators holding a grant, otherwise it reports EDECRYPTUNAVAIL.
class LocalCipherVault : public codec::DecryptionService, public codec::EncryptionService {
public:
    LocalCipherVault(SQLite::Database& db, Address requester);

    [[nodiscard]] Result<codec::EncryptedValue> encrypt(const codec::NativeValue&,
        codec::TypeTag, uint8_t securityZone) override;
    [[nodiscard]] Result<codec::RawCleartext> decrypt(const codec::Handle&) override;

    void grant(const Address& operatorId);
    void revoke(const Address& operatorId);
    bool has_grant(const Address& operatorId);
    const Address& requester() const { return requesterId; }

private:
    Address requesterId;
    struct CreateTables {
        CreateTables(SQLite::Database& db)
        {
            db.exec("CREATE TABLE IF NOT EXISTS `Ciphertexts` ( `handle` BLOB "
                    "PRIMARY KEY, `tag` INTEGER NOT NULL, `cleartext` BLOB NOT NULL "
                    ") WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `DecryptGrants` ( `operator` BLOB "
                    "PRIMARY KEY ) WITHOUT ROWID");
        }
    } createTables;
    sqlite::Statement stmtInsert;
    sqlite::Statement stmtSelect;
    sqlite::Statement stmtGrant;
    sqlite::Statement stmtRevoke;
    sqlite::Statement stmtHasGrant;
};
