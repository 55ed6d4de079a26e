#pragma once
#include "batch/batch.hpp"
#include "batch/intent.hpp"
#include "defi/settlement.hpp"
#include "events/events.hpp"
#include "general/result.hpp"
#include <vector>

struct IntentSubmission {
    Address submitter;
    PoolId poolId;
    Address tokenIn;
    Address tokenOut;
    codec::EncryptedValue amount;
    BlockNumber deadline;
};

struct SubmitReceipt {
    IntentId intentId;
    BatchId batchId;
    BlockNumber block;
};

struct SettlementReceipt {
    BatchId batchId;
    SettlementHash settlementHash;
    BlockNumber block;
};

struct Attestation {
    BatchId batchId;
    SettlementHash settlementHash;
    Address operatorId; // recovered signer
    RecoverableSignature signature;
};

// Intent store and settlement target. All calls may fail with transient
// errors (ENETWORK) and are safe to repeat.
class Ledger {
public:
    virtual ~Ledger() = default;

    [[nodiscard]] virtual Result<SubmitReceipt> submit_intent(const IntentSubmission&) = 0;
    [[nodiscard]] virtual Result<BlockNumber> block_number() = 0;
    // log entries of blocks in [from, to]
    [[nodiscard]] virtual Result<std::vector<LogEntry>> events(BlockNumber from, BlockNumber to) = 0;
    [[nodiscard]] virtual Result<Batch> get_batch(const BatchId&) = 0;
    [[nodiscard]] virtual Result<Intent> get_intent(const IntentId&) = 0;
    [[nodiscard]] virtual Result<std::vector<Batch>> open_batches() = 0;
    // true if this call finalized the batch, false for benign no-ops
    [[nodiscard]] virtual Result<bool> finalize_batch(const BatchId&, FinalizeTrigger, const Address& caller) = 0;
    // EALREADYSETTLED if another publisher won the race
    [[nodiscard]] virtual Result<SettlementReceipt> submit_settlement(const defi::SettlementSubmission&) = 0;
    [[nodiscard]] virtual Result<bool> is_committee_member_selected(const BatchId&, const Address& operatorId) = 0;
    [[nodiscard]] virtual Result<void> register_operator(const Address& operatorId) = 0;
    [[nodiscard]] virtual Result<void> post_attestation(const BatchId&, const SettlementHash&, const RecoverableSignature&) = 0;
    [[nodiscard]] virtual Result<std::vector<Attestation>> attestations(const BatchId&) = 0;
};
