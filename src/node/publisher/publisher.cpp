#include "publisher.hpp"
#include "api/json.hpp"
#include "spdlog/spdlog.h"

namespace {
// operators whose signature recovers to their own address
size_t valid_signers(const SettlementHash& hash,
    const std::vector<defi::CommitteeSignature>& signatures)
{
    std::set<Address> s;
    for (auto& sig : signatures) {
        try {
            if (sig.signature.recover_pubkey(hash).address() == sig.operatorId)
                s.insert(sig.operatorId);
        } catch (Error e) {
            spdlog::warn("Cannot recover signer of {}: {}", sig.operatorId.to_string(), e.strerror());
        }
    }
    return s.size();
}
}

Result<defi::SettlementSubmission> SettlementPublisher::prepare(const defi::Settlement& s,
    const std::vector<defi::CommitteeSignature>& signatures)
{
    defi::SettlementSubmission sub {
        .settlement { s },
        .signatures { signatures },
        .encryptedAmounts {}
    };
    for (auto& t : s.internalizedTransfers) {
        auto a { encryption.encrypt(t.amountA, codec::TypeTag::Uint128, 0) };
        if (!a)
            return a.error();
        auto b { encryption.encrypt(t.amountB, codec::TypeTag::Uint128, 0) };
        if (!b)
            return b.error();
        sub.encryptedAmounts.push_back({ std::move(*a), std::move(*b) });
    }
    return sub;
}

Result<Ack> SettlementPublisher::submit(const defi::SettlementSubmission& sub)
{
    auto& s { sub.settlement };
    auto r { ledger.submit_settlement(sub) };
    if (r)
        return Ack { r->batchId, r->settlementHash, r->block, false };
    if (r.error().code == EALREADYSETTLED) {
        spdlog::info("Batch {} was settled by another publisher", s.batchId.hex_string());
        return Ack { s.batchId, s.hash(), {}, true };
    }
    return r.error();
}

Result<Ack> SettlementPublisher::publish(const defi::Settlement& s,
    const std::vector<defi::CommitteeSignature>& signatures)
{
    auto& id { s.batchId };
    if (auto n { valid_signers(s.hash(), signatures) }; n < minAttestations) {
        spdlog::warn("Not publishing batch {}: {} of {} valid attestations", id.hex_string(),
            n, minAttestations);
        return Error(EQUORUM);
    }
    if (attempted(id)) {
        spdlog::debug("Batch {} already published by this process", id.hex_string());
        return Ack { id, s.hash(), {}, false };
    }
    attemptedBatches.insert(id);

    auto sub { prepare(s, signatures) };
    if (!sub) {
        evict(id);
        return sub.error();
    }

    auto r { submit(*sub) };
    if (!r && r.error().code == ELEDGERREJECTED) {
        // retry once against refreshed ledger state
        spdlog::warn("Ledger rejected settlement of batch {}, retrying", id.hex_string());
        auto b { ledger.get_batch(id) };
        if (!b) {
            evict(id);
            return b.error();
        }
        if (b->state == BatchState::Settled)
            return Ack { id, s.hash(), {}, true };
        r = submit(*sub);
        if (!r && r.error().code == ELEDGERREJECTED)
            spdlog::critical("Ledger rejected settlement of batch {} twice, manual intervention required",
                id.hex_string());
    }
    if (!r) {
        evict(id);
        return r.error();
    }

    if (!r->alreadySettled) {
        spdlog::info("Published settlement {} for batch {} in block {}",
            r->settlementHash.hex_string(), id.hex_string(), *r->block);
        settlementLog->info("{}", jsonmsg::to_json(*sub).dump());
    }
    return r;
}
