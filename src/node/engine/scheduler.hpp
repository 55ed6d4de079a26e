#pragma once
#include "backoff.hpp"
#include "batch_processor.hpp"
#include "eventloop/timer.hpp"
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>

namespace engine {

// Owns the polling state of one committee member: the ledger block
// cursor, batches waiting for quorum and scheduled retries. Both loops
// tolerate missed ticks, the cursor only advances over scanned blocks.
class Scheduler {
public:
    using time_point = eventloop::TimerSystem::time_point;
    struct Params {
        Backoff backoff;
        uint32_t decryptAttempts { 5 };
        uint64_t maxIdleSeconds { 120 };
        uint64_t blockInterval { 5 };
        size_t outcomeHistory { 1024 }; // batches whose last outcome is kept
    };

    Scheduler(Ledger& ledger, BatchProcessor& processor, Params params,
        BlockNumber cursor = 0)
        : ledger(ledger)
        , processor(processor)
        , params(params)
        , nextBlock(cursor)
    {
    }

    // scans new BatchFinalized events, then due retries, then
    // re-announces batches still waiting for quorum
    void short_tick(time_point now);

    // finalizes idle and interval-due batches, gives deferred batches a
    // fresh round of decryption attempts
    void idle_tick(time_point now, uint64_t unixNow);

    BlockNumber cursor() const { return nextBlock; }
    const std::set<BatchId>& pending() const { return pendingBatches; }
    const std::set<BatchId>& deferred() const { return deferredBatches; }
    bool retry_scheduled(const BatchId& id) const { return retries.contains(id); }
    std::optional<time_point> next_retry() const { return timers.next(); }
    std::optional<ProcessOutcome> last_outcome(const BatchId&) const;

private:
    void scan_events(std::vector<BatchId>& work);
    void run(const BatchId&, time_point now);
    void record_outcome(const BatchId&, ProcessOutcome);

    Ledger& ledger;
    BatchProcessor& processor;
    Params params;
    BlockNumber nextBlock;
    std::set<BatchId> pendingBatches;
    std::set<BatchId> deferredBatches;
    std::map<BatchId, uint32_t> attempts;
    std::map<BatchId, eventloop::Timer> retries;
    std::map<BatchId, ProcessOutcome> outcomes;
    std::deque<BatchId> outcomeOrder; // oldest first
    eventloop::TimerSystem timers;
};

// Runs one polling step from an event loop callback. An exception escaping
// the step is logged and returned as the error that stops the node.
[[nodiscard]] std::optional<Error> guarded_tick(const std::function<void()>& tick);

}
