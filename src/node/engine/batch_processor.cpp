#include "batch_processor.hpp"
#include "defi/matching.hpp"
#include "spdlog/spdlog.h"

namespace engine {

std::string_view outcome_name(ProcessOutcome o)
{
    switch (o) {
    case ProcessOutcome::Published:
        return "published";
    case ProcessOutcome::Pending:
        return "pending";
    case ProcessOutcome::Deferred:
        return "deferred";
    case ProcessOutcome::Skipped:
        return "skipped";
    case ProcessOutcome::AlreadySettled:
        return "already-settled";
    }
    return "unknown";
}

namespace {
// Errors that exclude a single intent instead of holding up its batch.
bool excludes_intent(Error e)
{
    switch (e.code) {
    case ETYPEMISMATCH:
    case EUNSUPPORTEDTAG:
    case EDEPRECATEDTAG:
    case EMALFORMED:
    case ENOTFOUND:
        return true;
    default:
        return false;
    }
}

Processed deferred(Error e)
{
    return { ProcessOutcome::Deferred, e };
}
}

BatchProcessor::BatchProcessor(Ledger& ledger, codec::DecryptionService& decryption,
    consensus::Aggregator& aggregator, SettlementPublisher& publisher,
    PrivKey signingKey)
    : ledger(ledger)
    , decoder(decryption)
    , aggregator(aggregator)
    , publisher(publisher)
    , signingKey(signingKey)
    , self(signingKey.pubkey().address())
{
}

Result<defi::Settlement> BatchProcessor::compute(const Batch& b)
{
    if (!b.finalizedAt)
        return Error(EBATCHSTATE);
    defi::Settlement s {
        .batchId { b.id },
        .internalizedTransfers {},
        .netSwaps {},
        .excludedIntentIds {}
    };
    std::vector<defi::MatchInput> inputs;
    for (auto& intentId : b.intentIds) {
        auto intent { ledger.get_intent(intentId) };
        if (!intent)
            return intent.error();
        if (intent->expired_at(*b.finalizedAt)) {
            spdlog::warn("Excluding intent {} of batch {}: deadline {} before finalization at {}",
                intentId.hex_string(), b.id.hex_string(), intent->deadline, *b.finalizedAt);
            s.excludedIntentIds.push_back(intentId);
            continue;
        }
        auto amount { decoder.decode(intent->encryptedAmount, codec::TypeTag::Uint128) };
        if (!amount) {
            if (!excludes_intent(amount.error()))
                return amount.error();
            spdlog::warn("Excluding intent {} of batch {}: {}", intentId.hex_string(),
                b.id.hex_string(), amount.error().format());
            s.excludedIntentIds.push_back(intentId);
            continue;
        }
        inputs.push_back({
            .id { intentId },
            .user { intent->submitter },
            .tokenIn { intent->tokenIn },
            .tokenOut { intent->tokenOut },
            .amount { amount->get<BigUint>() },
        });
    }

    auto result { defi::match(inputs) };
    if (!defi::check_conservation(inputs, result))
        return Error(EBUG);
    s.internalizedTransfers = std::move(result.transfers);
    s.netSwaps = std::move(result.netSwaps);
    return s;
}

Processed BatchProcessor::attest_and_publish(const defi::Settlement& s)
{
    auto& id { s.batchId };
    auto hash { aggregator.propose(s) };

    // announce own signature on the attestation board
    auto sig { signingKey.sign(hash) };
    if (auto r { ledger.post_attestation(id, hash, sig) }; !r)
        return deferred(r.error());
    if (auto r { aggregator.attest(hash, self, sig) }; !r)
        return deferred(r.error());

    auto board { ledger.attestations(id) };
    if (!board)
        return deferred(board.error());
    for (auto& a : *board) {
        if (a.settlementHash != hash || a.operatorId == self)
            continue;
        if (auto r { aggregator.attest(hash, a.operatorId, a.signature) }; !r) {
            if (r.error().is_transient())
                return deferred(r.error());
            spdlog::warn("Ignoring attestation of {} for batch {}: {}",
                a.operatorId.to_string(), id.hex_string(), r.error().format());
        }
    }

    if (!aggregator.is_quorum_reached(hash)) {
        auto st { aggregator.status(hash) };
        spdlog::info("Batch {} waiting for attestations ({}/{})", id.hex_string(),
            st ? st->count : 0, aggregator.min_attestations());
        return { ProcessOutcome::Pending, Error(EQUORUM) };
    }

    auto ack { publisher.publish(s, aggregator.signatures(hash)) };
    if (!ack) {
        auto e { ack.error() };
        if (e.is_transient())
            return deferred(e);
        return { ProcessOutcome::Pending, e };
    }
    aggregator.forget(hash);
    if (ack->alreadySettled)
        return { ProcessOutcome::AlreadySettled };
    return { ProcessOutcome::Published };
}

Processed BatchProcessor::process(const BatchId& id)
{
    auto p { process_batch(id) };
    switch (p.outcome) {
    case ProcessOutcome::Skipped:
    case ProcessOutcome::AlreadySettled:
        aggregator.forget_batch(id);
        break;
    case ProcessOutcome::Published:
    case ProcessOutcome::Pending:
    case ProcessOutcome::Deferred:
        break;
    }
    return p;
}

Processed BatchProcessor::process_batch(const BatchId& id)
{
    auto b { ledger.get_batch(id) };
    if (!b) {
        if (b.error().is_transient())
            return deferred(b.error());
        spdlog::error("Cannot load batch {}: {}", id.hex_string(), b.error().format());
        return { ProcessOutcome::Skipped, b.error() };
    }
    switch (b->state) {
    case BatchState::Open:
        return { ProcessOutcome::Skipped };
    case BatchState::Settled:
        return { ProcessOutcome::AlreadySettled };
    case BatchState::Finalized:
        break;
    }

    auto selected { ledger.is_committee_member_selected(id, self) };
    if (!selected)
        return deferred(selected.error());
    if (!*selected) {
        spdlog::debug("Not selected for batch {}", id.hex_string());
        return { ProcessOutcome::Skipped };
    }

    auto settlement { compute(*b) };
    if (!settlement) {
        auto e { settlement.error() };
        if (e.is_transient()) {
            spdlog::warn("Deferring batch {}: {}", id.hex_string(), e.format());
            return deferred(e);
        }
        spdlog::error("Cannot settle batch {}: {}", id.hex_string(), e.format());
        return { ProcessOutcome::Skipped, e };
    }
    return attest_and_publish(*settlement);
}

}
