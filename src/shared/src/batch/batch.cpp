#include "batch.hpp"

std::string_view state_name(BatchState s)
{
    switch (s) {
    case BatchState::Open:
        return "OPEN";
    case BatchState::Finalized:
        return "FINALIZED";
    case BatchState::Settled:
        return "SETTLED";
    }
    return "UNKNOWN";
}

Result<BatchState> state_from_int(int64_t i)
{
    switch (i) {
    case 0:
        return BatchState::Open;
    case 1:
        return BatchState::Finalized;
    case 2:
        return BatchState::Settled;
    }
    return Error(EDBCORRUPT);
}

std::string_view trigger_name(FinalizeTrigger t)
{
    switch (t) {
    case FinalizeTrigger::BlockInterval:
        return "block-interval";
    case FinalizeTrigger::Idle:
        return "idle";
    case FinalizeTrigger::AdminOverride:
        return "admin-override";
    case FinalizeTrigger::MaxSize:
        return "max-size";
    }
    return "unknown";
}

Result<FinalizeTrigger> trigger_from_int(int64_t i)
{
    switch (i) {
    case 0:
        return FinalizeTrigger::BlockInterval;
    case 1:
        return FinalizeTrigger::Idle;
    case 2:
        return FinalizeTrigger::AdminOverride;
    case 3:
        return FinalizeTrigger::MaxSize;
    }
    return Error(EMALFORMED);
}
