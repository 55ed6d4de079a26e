#pragma once
#include "general/result.hpp"
#include "ids.hpp"
#include <optional>
#include <string_view>
#include <vector>

enum class BatchState : uint8_t {
    Open = 0,
    Finalized = 1,
    Settled = 2,
};
std::string_view state_name(BatchState);
[[nodiscard]] Result<BatchState> state_from_int(int64_t);

enum class FinalizeTrigger : uint8_t {
    BlockInterval = 0,
    Idle = 1,
    AdminOverride = 2,
    MaxSize = 3,
};
std::string_view trigger_name(FinalizeTrigger);
[[nodiscard]] Result<FinalizeTrigger> trigger_from_int(int64_t);

struct Batch {
    BatchId id;
    PoolId poolId;
    BlockNumber createdAt;
    BlockNumber lastIntentAt;
    uint64_t lastIntentTimestamp;
    std::optional<BlockNumber> finalizedAt;
    std::vector<IntentId> intentIds; // submission order
    BatchState state { BatchState::Open };

    bool is_open() const { return state == BatchState::Open; }
    bool empty() const { return intentIds.empty(); }
};
