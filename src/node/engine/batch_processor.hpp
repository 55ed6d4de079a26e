#pragma once
#include "codec/codec.hpp"
#include "consensus/aggregator.hpp"
#include "crypto/crypto.hpp"
#include "ledger/ledger.hpp"
#include "publisher/publisher.hpp"
#include <string_view>

namespace engine {

enum class ProcessOutcome {
    Published,
    Pending, // waiting for quorum or a rejected publication
    Deferred, // transient failure, retry with backoff
    Skipped, // not finalized, unknown or not selected
    AlreadySettled,
};
std::string_view outcome_name(ProcessOutcome);

struct Processed {
    ProcessOutcome outcome;
    Error error {}; // cause of Deferred and Pending outcomes
};

// One settlement pass over a finalized batch: decrypt, match, sign,
// collect attestations and publish on quorum. Nothing is cached between
// passes, every pass recomputes from ledger data.
class BatchProcessor {
public:
    BatchProcessor(Ledger& ledger, codec::DecryptionService& decryption,
        consensus::Aggregator& aggregator, SettlementPublisher& publisher,
        PrivKey signingKey);

    Processed process(const BatchId&);
    const Address& operator_id() const { return self; }

private:
    Processed process_batch(const BatchId&);
    // settlement content or the error that prevents computing it
    Result<defi::Settlement> compute(const Batch&);
    Processed attest_and_publish(const defi::Settlement&);

    Ledger& ledger;
    codec::Codec decoder;
    consensus::Aggregator& aggregator;
    SettlementPublisher& publisher;
    PrivKey signingKey;
    Address self;
};

}
