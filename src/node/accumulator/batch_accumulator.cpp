#include "batch_accumulator.hpp"
#include "crypto/hasher_sha256.hpp"
#include "spdlog/spdlog.h"
#include <utility>

void BatchAccumulator::restore(std::vector<Batch> restored, uint64_t batchCounter)
{
    batches.clear();
    openByPool.clear();
    counter = batchCounter;
    for (auto& b : restored) {
        if (b.is_open()) {
            auto [_, inserted] { openByPool.emplace(b.poolId, b.id) };
            if (!inserted)
                throw Error(EDBCORRUPT); // two open batches for one pool
        }
        auto id { b.id };
        batches.emplace(id, std::move(b));
    }
}

Batch& BatchAccumulator::open_new(const PoolId& poolId, Tip tip)
{
    BatchId id { hash_args_SHA256(std::string_view("batch"), poolId, uint64_t(counter), tip.height) };
    counter += 1;
    auto [iter, inserted] { batches.emplace(id,
        Batch {
            .id { id },
            .poolId { poolId },
            .createdAt = tip.height,
            .lastIntentAt = tip.height,
            .lastIntentTimestamp = tip.timestamp,
            .finalizedAt {},
            .intentIds {},
            .state = BatchState::Open }) };
    if (!inserted)
        throw Error(EBUG);
    openByPool.insert_or_assign(poolId, id);
    dirty.insert(id);
    return iter->second;
}

bool BatchAccumulator::finalize(Batch& b, FinalizeTrigger trigger, BlockNumber height)
{
    if (!b.is_open() || b.empty())
        return false;
    b.state = BatchState::Finalized;
    b.finalizedAt = height;
    openByPool.erase(b.poolId);
    dirty.insert(b.id);
    finalizedLog.push_back({ b.id, uint32_t(b.intentIds.size()), trigger, height });
    spdlog::info("Batch {} finalized ({}, {} intents)", b.id.hex_string(),
        trigger_name(trigger), b.intentIds.size());
    return true;
}

Result<BatchId> BatchAccumulator::submit(const Intent& intent, Tip tip)
{
    if (intent.tokenIn == intent.tokenOut)
        return Error(ESAMETOKEN);
    if (intent.expired_at(tip.height))
        return Error(EEXPIRED);

    Batch* b { nullptr };
    if (auto iter { openByPool.find(intent.poolId) }; iter != openByPool.end()) {
        b = &batches.at(iter->second);
        if (interval_elapsed(*b, tip.height))
            finalize(*b, FinalizeTrigger::BlockInterval, tip.height);
        if (!b->is_open())
            b = nullptr;
    }
    if (b == nullptr)
        b = &open_new(intent.poolId, tip);

    b->intentIds.push_back(intent.id);
    b->lastIntentAt = tip.height;
    b->lastIntentTimestamp = tip.timestamp;
    dirty.insert(b->id);
    BatchId id { b->id };
    if (b->intentIds.size() >= params.maxBatchSize)
        finalize(*b, FinalizeTrigger::MaxSize, tip.height);
    return id;
}

Result<bool> BatchAccumulator::try_finalize(const BatchId& id, FinalizeTrigger trigger,
    const Address& caller, Tip tip)
{
    auto iter { batches.find(id) };
    if (iter == batches.end())
        return Error(ENOTFOUND);
    Batch& b { iter->second };
    if (!b.is_open() || b.empty())
        return false;

    switch (trigger) {
    case FinalizeTrigger::BlockInterval:
        if (!interval_elapsed(b, tip.height))
            return Error(EINTERVAL);
        break;
    case FinalizeTrigger::Idle:
        if (!is_privileged(caller))
            return Error(ENOTPRIVILEGED);
        if (!idle(b, tip.timestamp))
            return Error(ENOTIDLE);
        break;
    case FinalizeTrigger::AdminOverride:
        if (!is_privileged(caller))
            return Error(ENOTPRIVILEGED);
        break;
    case FinalizeTrigger::MaxSize:
        if (b.intentIds.size() < params.maxBatchSize)
            return Error(EBATCHSTATE);
        break;
    }
    return finalize(b, trigger, tip.height);
}

Result<bool> BatchAccumulator::mark_settled(const BatchId& id)
{
    auto iter { batches.find(id) };
    if (iter == batches.end())
        return Error(ENOTFOUND);
    Batch& b { iter->second };
    switch (b.state) {
    case BatchState::Open:
        return Error(EBATCHSTATE);
    case BatchState::Finalized:
        b.state = BatchState::Settled;
        dirty.insert(id);
        return true;
    case BatchState::Settled:
        return false;
    }
    return Error(EBUG);
}

std::optional<Batch> BatchAccumulator::get_open_batch(const PoolId& poolId) const
{
    auto iter { openByPool.find(poolId) };
    if (iter == openByPool.end())
        return {};
    return batches.at(iter->second);
}

std::optional<Batch> BatchAccumulator::get(const BatchId& id) const
{
    auto iter { batches.find(id) };
    if (iter == batches.end())
        return {};
    return iter->second;
}

std::vector<Batch> BatchAccumulator::open_batches() const
{
    std::vector<Batch> res;
    for (auto& [_, id] : openByPool)
        res.push_back(batches.at(id));
    return res;
}

std::vector<BatchId> BatchAccumulator::idle_batches(uint64_t nowTimestamp) const
{
    std::vector<BatchId> res;
    for (auto& [_, id] : openByPool) {
        auto& b { batches.at(id) };
        if (!b.empty() && idle(b, nowTimestamp))
            res.push_back(id);
    }
    return res;
}

std::vector<BatchId> BatchAccumulator::interval_due(BlockNumber height) const
{
    std::vector<BatchId> res;
    for (auto& [_, id] : openByPool) {
        auto& b { batches.at(id) };
        if (!b.empty() && interval_elapsed(b, height))
            res.push_back(id);
    }
    return res;
}

std::vector<BatchAccumulator::Finalized> BatchAccumulator::take_finalized()
{
    return std::exchange(finalizedLog, {});
}

std::set<BatchId> BatchAccumulator::take_dirty()
{
    return std::exchange(dirty, {});
}
