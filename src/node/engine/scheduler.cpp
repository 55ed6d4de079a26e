#include "scheduler.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <utility>

namespace engine {

namespace {
void add_unique(std::vector<BatchId>& work, const BatchId& id)
{
    if (std::find(work.begin(), work.end(), id) == work.end())
        work.push_back(id);
}
}

std::optional<ProcessOutcome> Scheduler::last_outcome(const BatchId& id) const
{
    auto iter { outcomes.find(id) };
    if (iter == outcomes.end())
        return {};
    return iter->second;
}

void Scheduler::record_outcome(const BatchId& id, ProcessOutcome o)
{
    auto [_, inserted] { outcomes.insert_or_assign(id, o) };
    if (!inserted)
        return;
    outcomeOrder.push_back(id);
    while (outcomeOrder.size() > params.outcomeHistory) {
        outcomes.erase(outcomeOrder.front());
        outcomeOrder.pop_front();
    }
}

void Scheduler::scan_events(std::vector<BatchId>& work)
{
    auto head { ledger.block_number() };
    if (!head) {
        spdlog::warn("Cannot read ledger head: {}", head.error().format());
        return;
    }
    if (*head < nextBlock)
        return;
    auto entries { ledger.events(nextBlock, *head) };
    if (!entries) {
        spdlog::warn("Cannot read ledger events {}-{}: {}", nextBlock, *head,
            entries.error().format());
        return;
    }
    for (auto& entry : *entries) {
        auto d { events::BatchFinalizedEvent::decode(entry) };
        d.visit_overload(
            [&](const events::Matched<events::BatchFinalizedEvent>& m) {
                auto& id { m.event.batchId };
                spdlog::debug("Batch {} finalized in block {}", id.hex_string(), entry.block);
                if (!retries.contains(id) && !deferredBatches.contains(id))
                    add_unique(work, id);
            },
            [](const events::NotThisType&) {},
            [&](const events::Malformed& m) {
                spdlog::warn("Malformed {} event in block {}: {}", entry.topic,
                    entry.block, m.error.format());
            });
    }
    nextBlock = *head + 1;
}

void Scheduler::run(const BatchId& id, time_point now)
{
    auto p { processor.process(id) };
    record_outcome(id, p.outcome);
    switch (p.outcome) {
    case ProcessOutcome::Published:
    case ProcessOutcome::AlreadySettled:
    case ProcessOutcome::Skipped:
        pendingBatches.erase(id);
        deferredBatches.erase(id);
        attempts.erase(id);
        return;
    case ProcessOutcome::Pending:
        pendingBatches.insert(id);
        attempts.erase(id);
        return;
    case ProcessOutcome::Deferred:
        break;
    }

    pendingBatches.erase(id);
    auto attempt { ++attempts[id] };
    if (p.error.code == EDECRYPTUNAVAIL && attempt >= params.decryptAttempts) {
        spdlog::error("Decryption for batch {} unavailable after {} attempts, "
                      "deferring until next idle poll",
            id.hex_string(), attempt);
        attempts.erase(id);
        deferredBatches.insert(id);
        return;
    }
    auto delay { params.backoff.delay(attempt - 1) };
    spdlog::warn("Batch {} deferred: {}, retry {} in {} ms", id.hex_string(),
        p.error.format(), attempt, delay.count());
    retries.insert_or_assign(id,
        timers.insert(now, delay, eventloop::timer_events::RetryBatch { id, attempt }));
}

void Scheduler::short_tick(time_point now)
{
    std::vector<BatchId> work;
    scan_events(work);
    for (auto& e : timers.pop_expired(now)) {
        std::visit([&](const eventloop::timer_events::RetryBatch& r) {
            retries.erase(r.batchId);
            add_unique(work, r.batchId);
        },
            e);
    }
    for (auto& id : pendingBatches)
        add_unique(work, id);
    for (auto& id : work)
        run(id, now);
}

void Scheduler::idle_tick(time_point now, uint64_t unixNow)
{
    for (auto& id : std::exchange(deferredBatches, {}))
        run(id, now);

    auto open { ledger.open_batches() };
    if (!open) {
        spdlog::warn("Cannot read open batches: {}", open.error().format());
        return;
    }
    auto head { ledger.block_number() };
    if (!head) {
        spdlog::warn("Cannot read ledger head: {}", head.error().format());
        return;
    }
    for (auto& b : *open) {
        if (b.empty())
            continue;
        std::optional<FinalizeTrigger> trigger;
        if (*head >= b.createdAt + params.blockInterval)
            trigger = FinalizeTrigger::BlockInterval;
        else if (unixNow > b.lastIntentTimestamp + params.maxIdleSeconds)
            trigger = FinalizeTrigger::Idle;
        if (!trigger)
            continue;
        auto r { ledger.finalize_batch(b.id, *trigger, processor.operator_id()) };
        if (!r) {
            auto e { r.error() };
            if (e.code == ENOTIDLE || e.code == EINTERVAL)
                spdlog::debug("Batch {} not ready: {}", b.id.hex_string(), e.format());
            else
                spdlog::warn("Cannot finalize batch {}: {}", b.id.hex_string(), e.format());
        }
    }
}

std::optional<Error> guarded_tick(const std::function<void()>& tick)
{
    try {
        tick();
        return {};
    } catch (Error e) {
        spdlog::critical("Polling loop failed: {}", e.format());
        return e;
    } catch (const std::exception& e) {
        spdlog::critical("Polling loop failed: {}", e.what());
        return Error(EBUG);
    }
}

}
