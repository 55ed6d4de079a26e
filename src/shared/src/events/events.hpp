#pragma once
#include "batch/batch.hpp"
#include "batch/ids.hpp"
#include "tools/variant.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// raw ledger log entry
struct LogEntry {
    BlockNumber block;
    std::string topic;
    std::vector<uint8_t> data;
};

namespace events {

struct NotThisType {
};
struct Malformed {
    Error error;
};
template <typename T>
struct Matched {
    T event;
};

// Result of running one typed decoder on a log entry. A foreign topic is
// NotThisType, a matching topic with a broken payload is Malformed.
template <typename T>
struct Decoded : public vbt::variant<Matched<T>, NotThisType, Malformed> {
    using vbt::variant<Matched<T>, NotThisType, Malformed>::variant;
    bool matched() const { return this->template holds<Matched<T>>(); }
    const T& event() const { return this->template get<Matched<T>>().event; }
};

struct BatchFinalizedEvent {
    static constexpr const char* TOPIC = "BatchFinalized";
    BatchId batchId;
    uint32_t intentCount;
    FinalizeTrigger trigger;
    std::vector<uint8_t> encode() const;
    static Decoded<BatchFinalizedEvent> decode(const LogEntry&);
};

struct IntentSubmittedEvent {
    static constexpr const char* TOPIC = "IntentSubmitted";
    IntentId intentId;
    BatchId batchId;
    PoolId poolId;
    std::vector<uint8_t> encode() const;
    static Decoded<IntentSubmittedEvent> decode(const LogEntry&);
};

struct BatchSettledEvent {
    static constexpr const char* TOPIC = "BatchSettled";
    BatchId batchId;
    SettlementHash settlementHash;
    uint32_t transferCount;
    uint32_t netSwapCount;
    std::vector<uint8_t> encode() const;
    static Decoded<BatchSettledEvent> decode(const LogEntry&);
};

}
