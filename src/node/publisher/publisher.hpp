#pragma once
#include "codec/codec.hpp"
#include "ledger/ledger.hpp"
#include <memory>
#include <optional>
#include <set>

namespace spdlog {
class logger;
}

struct Ack {
    BatchId batchId;
    SettlementHash settlementHash;
    std::optional<BlockNumber> block; // empty if nothing was submitted
    bool alreadySettled { false };
};

// Submits quorum-signed settlements to the ledger. Publishing is
// idempotent: a batch attempted before by this process or settled by
// another publisher is acknowledged without a second state transition.
class SettlementPublisher {
public:
    SettlementPublisher(Ledger& ledger, codec::EncryptionService& encryption,
        uint32_t minAttestations, std::shared_ptr<spdlog::logger> settlementLog)
        : ledger(ledger)
        , encryption(encryption)
        , minAttestations(minAttestations)
        , settlementLog(std::move(settlementLog))
    {
    }

    [[nodiscard]] Result<Ack> publish(const defi::Settlement&,
        const std::vector<defi::CommitteeSignature>&);
    void evict(const BatchId& id) { attemptedBatches.erase(id); }
    bool attempted(const BatchId& id) const { return attemptedBatches.contains(id); }

private:
    Result<defi::SettlementSubmission> prepare(const defi::Settlement&,
        const std::vector<defi::CommitteeSignature>&);
    Result<Ack> submit(const defi::SettlementSubmission&);

    Ledger& ledger;
    codec::EncryptionService& encryption;
    uint32_t minAttestations;
    std::shared_ptr<spdlog::logger> settlementLog;
    std::set<BatchId> attemptedBatches;
};
