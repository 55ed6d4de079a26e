#pragma once
#include "batch/batch.hpp"
#include "batch/intent.hpp"
#include <map>
#include <optional>
#include <set>
#include <vector>

// Groups intents of the same pool into batches and decides when a batch
// closes. State per batch is monotonic: OPEN -> FINALIZED -> SETTLED.
class BatchAccumulator {
public:
    struct Params {
        uint64_t blockInterval { 5 };
        uint64_t maxIdleSeconds { 120 };
        size_t maxBatchSize { 64 };
    };
    struct Finalized {
        BatchId batchId;
        uint32_t intentCount;
        FinalizeTrigger trigger;
        BlockNumber block;
    };

    BatchAccumulator(Params p)
        : params(p)
    {
    }
    void restore(std::vector<Batch> batches, uint64_t batchCounter);
    void grant_privilege(const Address& a) { privileged.insert(a); }
    bool is_privileged(const Address& a) const { return privileged.contains(a); }

    // Appends the intent to the pool's open batch, opening a new one if
    // needed. An open batch whose block interval has elapsed is
    // finalized first, a batch reaching maxBatchSize right after.
    [[nodiscard]] Result<BatchId> submit(const Intent&, Tip);

    // true if this call finalized the batch, false for the no-op cases
    // (empty, already finalized or settled).
    [[nodiscard]] Result<bool> try_finalize(const BatchId&, FinalizeTrigger,
        const Address& caller, Tip);
    [[nodiscard]] Result<bool> mark_settled(const BatchId&);

    std::optional<Batch> get_open_batch(const PoolId&) const;
    std::optional<Batch> get(const BatchId&) const;
    std::vector<Batch> open_batches() const;
    std::vector<BatchId> idle_batches(uint64_t nowTimestamp) const;
    std::vector<BatchId> interval_due(BlockNumber height) const;
    uint64_t batch_counter() const { return counter; }
    const Params& get_params() const { return params; }

    // drained by the owner to persist state and emit events
    std::vector<Finalized> take_finalized();
    std::set<BatchId> take_dirty();

private:
    bool interval_elapsed(const Batch& b, BlockNumber height) const
    {
        return height >= b.createdAt + params.blockInterval;
    }
    bool idle(const Batch& b, uint64_t nowTimestamp) const
    {
        return nowTimestamp > b.lastIntentTimestamp + params.maxIdleSeconds;
    }
    bool finalize(Batch&, FinalizeTrigger, BlockNumber);
    Batch& open_new(const PoolId&, Tip);

private:
    Params params;
    uint64_t counter { 0 };
    std::map<BatchId, Batch> batches;
    std::map<PoolId, BatchId> openByPool;
    std::set<Address> privileged;
    std::vector<Finalized> finalizedLog;
    std::set<BatchId> dirty;
};
