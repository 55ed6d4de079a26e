#include "ledger_db.hpp"
#include "api/json.hpp"
#include "crypto/hasher_sha256.hpp"
#include "spdlog/spdlog.h"
#include <chrono>
#include <optional>
#include <set>

LedgerDB::Clock LedgerDB::system_clock()
{
    return []() -> uint64_t {
        using namespace std::chrono;
        return duration_cast<seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

LedgerDB::LedgerDB(const std::string& path, Params p, Clock c)
    : db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
    , params(p)
    , clock(std::move(c))
    , createTables(db, clock())
    , accumulator(params.batching)
    , stmtHead(db, "SELECT `height`, `timestamp` FROM `Blocks` ORDER BY `height` DESC LIMIT 1")
    , stmtBlockInsert(db, "INSERT INTO `Blocks` (`height`, `timestamp`) VALUES (?,?)")
    , stmtIntentInsert(db, "INSERT INTO `Intents` (`id`, `submitter`, `token_in`, "
                           "`token_out`, `handle`, `tag`, `zone`, `proof`, `pool`, "
                           "`submitted_at`, `deadline`) VALUES (?,?,?,?,?,?,?,?,?,?,?)")
    , stmtIntentSelect(db, "SELECT `submitter`, `token_in`, `token_out`, `handle`, "
                           "`tag`, `zone`, `proof`, `pool`, `submitted_at`, `deadline` "
                           "FROM `Intents` WHERE `id`=?")
    , stmtBatchUpsert(db, "REPLACE INTO `Batches` (`id`, `seq`, `pool`, `created_at`, "
                          "`last_intent_at`, `last_intent_ts`, `finalized_at`, `state`) "
                          "VALUES (?,?,?,?,?,?,?,?)")
    , stmtBatchSelectAll(db, "SELECT `id`, `seq`, `pool`, `created_at`, `last_intent_at`, "
                             "`last_intent_ts`, `finalized_at`, `state` FROM `Batches` "
                             "ORDER BY `seq` ASC")
    , stmtBatchSelectState(db, "SELECT `id` FROM `Batches` WHERE `state`=? ORDER BY `seq` ASC")
    , stmtBatchIntentInsert(db, "INSERT OR IGNORE INTO `BatchIntents` (`batch`, `pos`, `intent`) VALUES (?,?,?)")
    , stmtBatchIntentSelect(db, "SELECT `intent` FROM `BatchIntents` WHERE `batch`=? ORDER BY `pos` ASC")
    , stmtEventInsert(db, "INSERT INTO `Events` (`block`, `topic`, `data`) VALUES (?,?,?)")
    , stmtEventSelect(db, "SELECT `block`, `topic`, `data` FROM `Events` WHERE "
                          "`block`>=? AND `block`<=? ORDER BY ROWID ASC")
    , stmtCommitteeInsert(db, "INSERT OR IGNORE INTO `Committee` (`operator`, `registered_at`) VALUES (?,?)")
    , stmtCommitteeExists(db, "SELECT EXISTS(SELECT 1 FROM `Committee` WHERE `operator`=?)")
    , stmtCommitteeAll(db, "SELECT `operator` FROM `Committee`")
    , stmtAttestationInsert(db, "INSERT OR IGNORE INTO `Attestations` (`batch`, `hash`, "
                                "`operator`, `signature`) VALUES (?,?,?,?)")
    , stmtAttestationSelect(db, "SELECT `hash`, `operator`, `signature` FROM "
                                "`Attestations` WHERE `batch`=?")
    , stmtSettlementInsert(db, "INSERT INTO `Settlements` (`batch`, `hash`, `block`, "
                               "`document`) VALUES (?,?,?,?)")
    , stmtSettlementLatest(db, "SELECT `batch`, `hash`, `block`, `document` FROM "
                               "`Settlements` ORDER BY `block` DESC LIMIT ?")
{
    load_state();
}

void LedgerDB::load_state()
{
    struct Loaded {
        Batch batch;
        size_t seq;
    };
    auto rows { stmtBatchSelectAll.all([](const sqlite::Row& r) {
        auto state { state_from_int(r.get<int64_t>(7)) };
        if (!state)
            throw Error(EDBCORRUPT);
        return Loaded {
            .batch {
                .id { r.get<BatchId>(0) },
                .poolId { r.get<PoolId>(2) },
                .createdAt = r.get<BlockNumber>(3),
                .lastIntentAt = r.get<BlockNumber>(4),
                .lastIntentTimestamp = r.get<uint64_t>(5),
                .finalizedAt { r.get_optional<BlockNumber>(6) },
                .intentIds {},
                .state = *state },
            .seq = r.get<uint64_t>(1)
        };
    }) };

    std::vector<Batch> batches;
    batchSeq.clear();
    for (auto& l : rows) {
        l.batch.intentIds = stmtBatchIntentSelect.all([](const sqlite::Row& r) {
            return r.get<IntentId>(0);
        },
            l.batch.id);
        batchSeq.emplace(l.batch.id, l.seq);
        batches.push_back(std::move(l.batch));
    }
    accumulator.restore(std::move(batches), batchSeq.size());
    stmtCommitteeAll.for_each([&](const sqlite::Row& r) {
        accumulator.grant_privilege(r.get<Address>(0));
    });
}

template <typename R>
R LedgerDB::write(std::function<R()> f)
{
    try {
        std::optional<R> r;
        {
            SQLite::Transaction t(db);
            r.emplace(f());
            if (r->has_value())
                t.commit();
        }
        if (!r->has_value()) {
            // discard partial in-memory changes together with the rollback
            accumulator.take_finalized();
            if (!accumulator.take_dirty().empty())
                load_state();
        }
        return std::move(*r);
    } catch (Error e) {
        spdlog::error("Ledger database write failed: {}", e.strerror());
        rollback_state();
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Ledger database write failed: {}", e.what());
        rollback_state();
        throw;
    }
}

void LedgerDB::rollback_state()
{
    accumulator.take_finalized();
    accumulator.take_dirty();
    load_state();
}

Tip LedgerDB::tip()
{
    auto r { stmtHead.one() };
    return { r.get<BlockNumber>(0), r.get<uint64_t>(1) };
}

Tip LedgerDB::mine_block()
{
    Tip t { tip() };
    t.height += 1;
    t.timestamp = std::max(t.timestamp, clock());
    stmtBlockInsert.run(t.height, t.timestamp);
    return t;
}

void LedgerDB::mine(uint64_t nBlocks)
{
    SQLite::Transaction t(db);
    for (uint64_t i = 0; i < nBlocks; ++i)
        mine_block();
    t.commit();
}

void LedgerDB::insert_event(BlockNumber block, std::string_view topic, const std::vector<uint8_t>& data)
{
    stmtEventInsert.run(block, std::string(topic), data);
}

void LedgerDB::persist_batch(const Batch& b)
{
    auto iter { batchSeq.find(b.id) };
    if (iter == batchSeq.end())
        iter = batchSeq.emplace(b.id, batchSeq.size()).first;
    stmtBatchUpsert.run(b.id, uint64_t(iter->second), b.poolId, b.createdAt,
        b.lastIntentAt, b.lastIntentTimestamp, b.finalizedAt, int64_t(b.state));
    for (size_t i = 0; i < b.intentIds.size(); ++i)
        stmtBatchIntentInsert.run(b.id, uint64_t(i), b.intentIds[i]);
}

void LedgerDB::persist_changes()
{
    for (auto& id : accumulator.take_dirty()) {
        auto b { accumulator.get(id) };
        if (!b)
            throw Error(EBUG);
        persist_batch(*b);
    }
    for (auto& f : accumulator.take_finalized()) {
        insert_event(f.block, events::BatchFinalizedEvent::TOPIC,
            events::BatchFinalizedEvent { f.batchId, f.intentCount, f.trigger }.encode());
    }
}

bool LedgerDB::is_committee_member(const Address& a)
{
    return stmtCommitteeExists.one(a).get<bool>(0);
}

Result<SubmitReceipt> LedgerDB::submit_intent(const IntentSubmission& s)
{
    return write<Result<SubmitReceipt>>([&]() -> Result<SubmitReceipt> {
        Tip t { mine_block() };
        IntentId id { hash_args_SHA256(std::string_view("veilbatch/intent"),
            s.submitter, s.poolId, s.tokenIn, s.tokenOut, s.amount.handle, t.height) };
        Intent intent {
            .id { id },
            .submitter { s.submitter },
            .tokenIn { s.tokenIn },
            .tokenOut { s.tokenOut },
            .encryptedAmount { s.amount },
            .poolId { s.poolId },
            .submittedAt = t.height,
            .deadline = s.deadline
        };
        auto batchId { accumulator.submit(intent, t) };
        if (!batchId)
            return batchId.error();
        auto& ev { s.amount };
        stmtIntentInsert.run(id, s.submitter, s.tokenIn, s.tokenOut, ev.handle,
            codec::tag_to_wire(ev.tag), ev.securityZone, ev.proof, s.poolId,
            t.height, s.deadline);
        persist_changes();
        insert_event(t.height, events::IntentSubmittedEvent::TOPIC,
            events::IntentSubmittedEvent { id, *batchId, s.poolId }.encode());
        return SubmitReceipt { id, *batchId, t.height };
    });
}

Result<BlockNumber> LedgerDB::block_number()
{
    return tip().height;
}

Result<std::vector<LogEntry>> LedgerDB::events(BlockNumber from, BlockNumber to)
{
    return stmtEventSelect.all([](const sqlite::Row& r) {
        return LogEntry {
            .block = r.get<BlockNumber>(0),
            .topic = r.get<std::string>(1),
            .data = r.get_vector(2)
        };
    },
        from, to);
}

Result<Batch> LedgerDB::get_batch(const BatchId& id)
{
    return accumulator.get(id);
}

Result<Intent> LedgerDB::get_intent(const IntentId& id)
{
    auto r { stmtIntentSelect.one(id) };
    if (!r.has_value())
        return Error(ENOTFOUND);
    auto tag { codec::tag_from_wire(uint8_t(r.get<uint32_t>(4))) };
    if (!tag)
        return Error(EDBCORRUPT);
    return Intent {
        .id { id },
        .submitter { r.get<Address>(0) },
        .tokenIn { r.get<Address>(1) },
        .tokenOut { r.get<Address>(2) },
        .encryptedAmount {
            .handle { r.get_array<32>(3) },
            .tag = *tag,
            .securityZone = uint8_t(r.get<uint32_t>(5)),
            .proof { r.get_vector(6) } },
        .poolId { r.get<PoolId>(7) },
        .submittedAt = r.get<BlockNumber>(8),
        .deadline = r.get<BlockNumber>(9)
    };
}

Result<std::vector<Batch>> LedgerDB::open_batches()
{
    return accumulator.open_batches();
}

std::vector<Batch> LedgerDB::finalized_batches()
{
    auto ids { stmtBatchSelectState.all([](const sqlite::Row& r) {
        return r.get<BatchId>(0);
    },
        int64_t(BatchState::Finalized)) };
    std::vector<Batch> res;
    for (auto& id : ids) {
        if (auto b { accumulator.get(id) })
            res.push_back(std::move(*b));
    }
    return res;
}

std::vector<LedgerDB::SettlementRecord> LedgerDB::latest_settlements(size_t limit)
{
    return stmtSettlementLatest.all([](const sqlite::Row& r) {
        return SettlementRecord {
            .batchId { r.get<BatchId>(0) },
            .settlementHash { r.get<SettlementHash>(1) },
            .block = r.get<BlockNumber>(2),
            .document = r.get<std::string>(3)
        };
    },
        uint64_t(limit));
}

Result<bool> LedgerDB::finalize_batch(const BatchId& id, FinalizeTrigger trigger, const Address& caller)
{
    return write<Result<bool>>([&]() -> Result<bool> {
        Tip t { tip() };
        t.height += 1;
        t.timestamp = std::max(t.timestamp, clock());
        auto r { accumulator.try_finalize(id, trigger, caller, t) };
        if (!r)
            return r;
        if (*r) {
            stmtBlockInsert.run(t.height, t.timestamp);
            persist_changes();
        }
        return r;
    });
}

Result<void> LedgerDB::verify_signatures(const defi::SettlementSubmission& s)
{
    auto hash { s.settlement.hash() };
    std::set<Address> signers;
    for (auto& sig : s.signatures) {
        try {
            auto signer { sig.signature.recover_pubkey(hash).address() };
            if (signer != sig.operatorId) {
                spdlog::warn("Ledger: signature does not match operator {}", sig.operatorId.to_string());
                continue;
            }
        } catch (Error e) {
            spdlog::warn("Ledger: cannot recover signer of {}: {}", sig.operatorId.to_string(), e.strerror());
            continue;
        }
        if (!is_committee_member(sig.operatorId)) {
            spdlog::warn("Ledger: {} is not in the committee", sig.operatorId.to_string());
            continue;
        }
        signers.insert(sig.operatorId);
    }
    if (signers.size() < params.minAttestations) {
        spdlog::warn("Ledger: settlement of batch {} has {} valid signatures, {} required",
            s.settlement.batchId.hex_string(), signers.size(), params.minAttestations);
        return Error(ELEDGERREJECTED);
    }
    return {};
}

Result<SettlementReceipt> LedgerDB::submit_settlement(const defi::SettlementSubmission& s)
{
    return write<Result<SettlementReceipt>>([&]() -> Result<SettlementReceipt> {
        auto& settlement { s.settlement };
        auto b { accumulator.get(settlement.batchId) };
        if (!b)
            return Error(ENOTFOUND);
        switch (b->state) {
        case BatchState::Open:
            spdlog::warn("Ledger: batch {} is not finalized", b->id.hex_string());
            return Error(ELEDGERREJECTED);
        case BatchState::Settled:
            return Error(EALREADYSETTLED);
        case BatchState::Finalized:
            break;
        }
        if (s.encryptedAmounts.size() != settlement.internalizedTransfers.size()) {
            spdlog::warn("Ledger: encrypted amount count mismatch for batch {}", b->id.hex_string());
            return Error(ELEDGERREJECTED);
        }
        if (auto v { verify_signatures(s) }; !v)
            return v.error();

        Tip t { mine_block() };
        auto settled { accumulator.mark_settled(settlement.batchId) };
        if (!settled)
            return settled.error();
        auto hash { settlement.hash() };
        persist_changes();
        stmtSettlementInsert.run(settlement.batchId, hash, t.height,
            jsonmsg::to_json(s).dump());
        insert_event(t.height, events::BatchSettledEvent::TOPIC,
            events::BatchSettledEvent {
                settlement.batchId, hash,
                uint32_t(settlement.internalizedTransfers.size()),
                uint32_t(settlement.netSwaps.size()) }
                .encode());
        return SettlementReceipt { settlement.batchId, hash, t.height };
    });
}

Result<bool> LedgerDB::is_committee_member_selected(const BatchId& id, const Address& operatorId)
{
    if (!accumulator.get(id))
        return Error(ENOTFOUND);
    // every registered operator is selected for every batch
    return is_committee_member(operatorId);
}

Result<void> LedgerDB::register_operator(const Address& operatorId)
{
    return write<Result<void>>([&]() -> Result<void> {
        Tip t { mine_block() };
        stmtCommitteeInsert.run(operatorId, t.height);
        accumulator.grant_privilege(operatorId);
        return {};
    });
}

Result<void> LedgerDB::post_attestation(const BatchId& id, const SettlementHash& hash,
    const RecoverableSignature& sig)
{
    if (!accumulator.get(id))
        return Error(ENOTFOUND);
    try {
        auto signer { sig.recover_pubkey(hash).address() };
        if (!is_committee_member(signer))
            return Error(ENOTCOMMITTEE);
        stmtAttestationInsert.run(id, hash, signer, sig.serialize());
        return {};
    } catch (Error e) {
        return e;
    }
}

Result<std::vector<Attestation>> LedgerDB::attestations(const BatchId& id)
{
    std::vector<Attestation> res;
    Error err;
    stmtAttestationSelect.for_each([&](const sqlite::Row& r) {
        auto sig { RecoverableSignature::from_bytes(r.get_vector(2)) };
        if (!sig) {
            err = EDBCORRUPT;
            return;
        }
        res.push_back({ id, r.get<SettlementHash>(0), r.get<Address>(1), *sig });
    },
        id);
    if (err)
        return err;
    return res;
}
