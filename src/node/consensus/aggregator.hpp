#pragma once
#include "defi/settlement.hpp"
#include "ledger/ledger.hpp"
#include <map>
#include <optional>

namespace consensus {

struct QuorumStatus {
    size_t count;
    size_t threshold;
    bool reached() const { return count >= threshold; }
};

// Collects committee signatures per proposed settlement hash. Each
// operator counts at most once toward the MIN_ATTESTATIONS threshold.
class Aggregator {
public:
    Aggregator(Ledger& ledger, uint32_t minAttestations)
        : ledger(ledger)
        , minAttestations(minAttestations)
    {
    }

    // Registers the settlement for signing and returns its canonical
    // hash. Proposing the same settlement again keeps collected signatures.
    SettlementHash propose(const defi::Settlement&);

    // EUNKNOWNHASH if never proposed, ENOTCOMMITTEE if the operator is not
    // selected for the batch, EINVSIG if the signature does not recover to
    // the operator.
    [[nodiscard]] Result<QuorumStatus> attest(const SettlementHash&,
        const Address& operatorId, const RecoverableSignature&);
    bool is_quorum_reached(const SettlementHash&) const;
    std::optional<QuorumStatus> status(const SettlementHash&) const;

    // sorted by operator id
    std::vector<defi::CommitteeSignature> signatures(const SettlementHash&) const;
    void forget(const SettlementHash&);
    // drops every proposal of a batch that will not be published by us
    void forget_batch(const BatchId&);
    uint32_t min_attestations() const { return minAttestations; }

private:
    struct Proposal {
        BatchId batchId;
        std::map<Address, RecoverableSignature> signatures;
    };
    QuorumStatus status(const Proposal& p) const
    {
        return { p.signatures.size(), minAttestations };
    }

    Ledger& ledger;
    uint32_t minAttestations;
    std::map<SettlementHash, Proposal> proposals;
};

}
