#include "aggregator.hpp"
#include "spdlog/spdlog.h"

namespace consensus {

SettlementHash Aggregator::propose(const defi::Settlement& s)
{
    auto hash { s.hash() };
    auto [_, inserted] { proposals.try_emplace(hash, Proposal { s.batchId, {} }) };
    if (inserted)
        spdlog::info("Proposed settlement {} for batch {}", hash.hex_string(),
            s.batchId.hex_string());
    return hash;
}

Result<QuorumStatus> Aggregator::attest(const SettlementHash& hash,
    const Address& operatorId, const RecoverableSignature& sig)
{
    auto iter { proposals.find(hash) };
    if (iter == proposals.end())
        return Error(EUNKNOWNHASH);
    auto& p { iter->second };

    auto selected { ledger.is_committee_member_selected(p.batchId, operatorId) };
    if (!selected)
        return selected.error();
    if (!*selected)
        return Error(ENOTCOMMITTEE);

    try {
        if (sig.recover_pubkey(hash).address() != operatorId)
            return Error(EINVSIG);
    } catch (Error) {
        return Error(EINVSIG);
    }

    bool wasReached { status(p).reached() };
    p.signatures.insert_or_assign(operatorId, sig);
    auto s { status(p) };
    if (s.reached() && !wasReached)
        spdlog::info("Quorum reached for settlement {} ({}/{})", hash.hex_string(),
            s.count, s.threshold);
    return s;
}

bool Aggregator::is_quorum_reached(const SettlementHash& hash) const
{
    auto s { status(hash) };
    return s && s->reached();
}

std::optional<QuorumStatus> Aggregator::status(const SettlementHash& hash) const
{
    auto iter { proposals.find(hash) };
    if (iter == proposals.end())
        return {};
    return status(iter->second);
}

std::vector<defi::CommitteeSignature> Aggregator::signatures(const SettlementHash& hash) const
{
    std::vector<defi::CommitteeSignature> res;
    auto iter { proposals.find(hash) };
    if (iter == proposals.end())
        return res;
    for (auto& [operatorId, sig] : iter->second.signatures)
        res.push_back({ operatorId, sig });
    return res;
}

void Aggregator::forget(const SettlementHash& hash)
{
    proposals.erase(hash);
}

void Aggregator::forget_batch(const BatchId& id)
{
    std::erase_if(proposals, [&](auto& p) { return p.second.batchId == id; });
}

}
