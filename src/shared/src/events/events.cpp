#include "events.hpp"
#include "general/reader.hpp"
#include "general/writer.hpp"

namespace events {
namespace {
    template <typename T>
    Decoded<T> decode_payload(const LogEntry& l, auto parse)
    {
        if (l.topic != T::TOPIC)
            return NotThisType {};
        try {
            Reader r(l.data);
            T t { parse(r) };
            if (!r.eof())
                return Malformed { Error(EMSGINTEGRITY) };
            return Matched<T> { std::move(t) };
        } catch (Error e) {
            return Malformed { e };
        }
    }
}

std::vector<uint8_t> BatchFinalizedEvent::encode() const
{
    return Writer(37) << batchId << intentCount << uint8_t(trigger);
}

Decoded<BatchFinalizedEvent> BatchFinalizedEvent::decode(const LogEntry& l)
{
    return decode_payload<BatchFinalizedEvent>(l, [](Reader& r) {
        BatchId id { r.arr<32>() };
        uint32_t count { r.uint32() };
        auto trigger { trigger_from_int(r.uint8()) };
        if (!trigger)
            throw trigger.error();
        return BatchFinalizedEvent {
            .batchId { id },
            .intentCount = count,
            .trigger = *trigger
        };
    });
}

std::vector<uint8_t> IntentSubmittedEvent::encode() const
{
    return Writer(96) << intentId << batchId << poolId;
}

Decoded<IntentSubmittedEvent> IntentSubmittedEvent::decode(const LogEntry& l)
{
    return decode_payload<IntentSubmittedEvent>(l, [](Reader& r) {
        IntentId intentId { r.arr<32>() };
        BatchId batchId { r.arr<32>() };
        PoolId poolId { r.arr<32>() };
        return IntentSubmittedEvent { intentId, batchId, poolId };
    });
}

std::vector<uint8_t> BatchSettledEvent::encode() const
{
    return Writer(72) << batchId << settlementHash << transferCount << netSwapCount;
}

Decoded<BatchSettledEvent> BatchSettledEvent::decode(const LogEntry& l)
{
    return decode_payload<BatchSettledEvent>(l, [](Reader& r) {
        BatchId batchId { r.arr<32>() };
        SettlementHash h { r.arr<32>() };
        uint32_t transfers { r.uint32() };
        uint32_t netSwaps { r.uint32() };
        return BatchSettledEvent { batchId, h, transfers, netSwaps };
    });
}

}
