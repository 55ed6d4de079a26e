#pragma once
#include "accumulator/batch_accumulator.hpp"
#include "db/sqlite.hpp"
#include "ledger.hpp"
#include <functional>
#include <string>

// Standalone deployment of the intent store: a local chain in a SQLite
// database. Every state-changing call mines one block.
class LedgerDB : public Ledger {
public:
    struct Params {
        BatchAccumulator::Params batching;
        uint32_t minAttestations { 1 };
    };
    using Clock = std::function<uint64_t()>; // unix seconds
    struct SettlementRecord {
        BatchId batchId;
        SettlementHash settlementHash;
        BlockNumber block;
        std::string document; // JSON
    };

    LedgerDB(const std::string& path, Params, Clock clock = system_clock());
    static Clock system_clock();

    Result<SubmitReceipt> submit_intent(const IntentSubmission&) override;
    Result<BlockNumber> block_number() override;
    Result<std::vector<LogEntry>> events(BlockNumber from, BlockNumber to) override;
    Result<Batch> get_batch(const BatchId&) override;
    Result<Intent> get_intent(const IntentId&) override;
    Result<std::vector<Batch>> open_batches() override;
    Result<bool> finalize_batch(const BatchId&, FinalizeTrigger, const Address& caller) override;
    Result<SettlementReceipt> submit_settlement(const defi::SettlementSubmission&) override;
    Result<bool> is_committee_member_selected(const BatchId&, const Address& operatorId) override;
    Result<void> register_operator(const Address& operatorId) override;
    Result<void> post_attestation(const BatchId&, const SettlementHash&, const RecoverableSignature&) override;
    Result<std::vector<Attestation>> attestations(const BatchId&) override;

    // local chain inspection
    void mine(uint64_t nBlocks = 1);
    Tip tip();
    std::vector<Batch> finalized_batches();
    std::vector<SettlementRecord> latest_settlements(size_t limit);
    SQLite::Database& database() { return db; }

private:
    void load_state();
    void rollback_state();
    Tip mine_block();
    bool is_committee_member(const Address&);
    void persist_changes();
    void persist_batch(const Batch&);
    void insert_event(BlockNumber, std::string_view topic, const std::vector<uint8_t>& data);
    Result<void> verify_signatures(const defi::SettlementSubmission&);

    // Runs a write operation in a transaction. The in-memory accumulator
    // is reloaded from the database if the operation throws.
    template <typename R>
    R write(std::function<R()> f);

private:
    SQLite::Database db;
    Params params;
    Clock clock;
    struct CreateTables {
        CreateTables(SQLite::Database& db, uint64_t genesisTimestamp)
        {
            db.exec("PRAGMA foreign_keys = ON");
            db.exec("CREATE TABLE IF NOT EXISTS `Blocks` ( `height` INTEGER "
                    "PRIMARY KEY, `timestamp` INTEGER NOT NULL )");
            db.exec("INSERT OR IGNORE INTO `Blocks` (`height`, `timestamp`) VALUES (0, "
                + std::to_string(genesisTimestamp) + ")");
            db.exec("CREATE TABLE IF NOT EXISTS `Intents` ( `id` BLOB PRIMARY KEY, "
                    "`submitter` BLOB NOT NULL, `token_in` BLOB NOT NULL, "
                    "`token_out` BLOB NOT NULL, `handle` BLOB NOT NULL, "
                    "`tag` INTEGER NOT NULL, `zone` INTEGER NOT NULL, "
                    "`proof` BLOB, `pool` BLOB NOT NULL, "
                    "`submitted_at` INTEGER NOT NULL, `deadline` INTEGER NOT NULL "
                    ") WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `Batches` ( `id` BLOB PRIMARY KEY, "
                    "`seq` INTEGER NOT NULL UNIQUE, `pool` BLOB NOT NULL, "
                    "`created_at` INTEGER NOT NULL, `last_intent_at` INTEGER NOT NULL, "
                    "`last_intent_ts` INTEGER NOT NULL, `finalized_at` INTEGER, "
                    "`state` INTEGER NOT NULL ) WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `BatchIntents` ( `batch` BLOB NOT NULL, "
                    "`pos` INTEGER NOT NULL, `intent` BLOB NOT NULL, "
                    "PRIMARY KEY(`batch`, `pos`) ) WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `Events` ( `block` INTEGER NOT NULL, "
                    "`topic` TEXT NOT NULL, `data` BLOB NOT NULL )");
            db.exec("CREATE INDEX IF NOT EXISTS `EventsBlock` ON `Events` (`block`)");
            db.exec("CREATE TABLE IF NOT EXISTS `Committee` ( `operator` BLOB "
                    "PRIMARY KEY, `registered_at` INTEGER NOT NULL ) WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `Attestations` ( `batch` BLOB NOT NULL, "
                    "`hash` BLOB NOT NULL, `operator` BLOB NOT NULL, "
                    "`signature` BLOB NOT NULL, "
                    "PRIMARY KEY(`batch`, `operator`, `hash`) ) WITHOUT ROWID");
            db.exec("CREATE TABLE IF NOT EXISTS `Settlements` ( `batch` BLOB PRIMARY KEY, "
                    "`hash` BLOB NOT NULL, `block` INTEGER NOT NULL, "
                    "`document` TEXT NOT NULL ) WITHOUT ROWID");
        }
    } createTables;
    BatchAccumulator accumulator;
    std::map<BatchId, size_t> batchSeq;

    sqlite::Statement stmtHead;
    sqlite::Statement stmtBlockInsert;
    sqlite::Statement stmtIntentInsert;
    sqlite::Statement stmtIntentSelect;
    sqlite::Statement stmtBatchUpsert;
    sqlite::Statement stmtBatchSelectAll;
    sqlite::Statement stmtBatchSelectState;
    sqlite::Statement stmtBatchIntentInsert;
    sqlite::Statement stmtBatchIntentSelect;
    sqlite::Statement stmtEventInsert;
    sqlite::Statement stmtEventSelect;
    sqlite::Statement stmtCommitteeInsert;
    sqlite::Statement stmtCommitteeExists;
    sqlite::Statement stmtCommitteeAll;
    sqlite::Statement stmtAttestationInsert;
    sqlite::Statement stmtAttestationSelect;
    sqlite::Statement stmtSettlementInsert;
    sqlite::Statement stmtSettlementLatest;
};
