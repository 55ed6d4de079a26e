#pragma once
#include "batch/ids.hpp"
#include "codec/codec.hpp"
#include "crypto/address.hpp"
#include "ledger/ledger.hpp"
#include <cassert>

inline Address test_address(uint8_t n)
{
    std::array<uint8_t, 20> a {};
    a[19] = n;
    a[0] = 0xaa;
    return a;
}

inline PoolId test_pool(uint8_t n)
{
    std::array<uint8_t, 32> a {};
    a[31] = n;
    return PoolId { a };
}

inline IntentId test_intent_id(uint8_t n)
{
    std::array<uint8_t, 32> a {};
    a[0] = 0x11;
    a[31] = n;
    return IntentId { a };
}

inline BatchId test_batch_id(uint8_t n)
{
    std::array<uint8_t, 32> a {};
    a[0] = 0x22;
    a[31] = n;
    return BatchId { a };
}

// Forwards to a real ledger, injecting transient failures and
// settlement rejections on request.
class FlakyLedger : public Ledger {
public:
    FlakyLedger(Ledger& inner)
        : inner(inner)
    {
    }

    int networkFailures { 0 }; // next n calls fail with ENETWORK
    int rejections { 0 }; // next n settlement submissions are rejected
    int settlementCalls { 0 };

    Result<SubmitReceipt> submit_intent(const IntentSubmission& s) override
    {
        if (auto e { fail() })
            return e;
        return inner.submit_intent(s);
    }
    Result<BlockNumber> block_number() override
    {
        if (auto e { fail() })
            return e;
        return inner.block_number();
    }
    Result<std::vector<LogEntry>> events(BlockNumber from, BlockNumber to) override
    {
        if (auto e { fail() })
            return e;
        return inner.events(from, to);
    }
    Result<Batch> get_batch(const BatchId& id) override
    {
        if (auto e { fail() })
            return e;
        return inner.get_batch(id);
    }
    Result<Intent> get_intent(const IntentId& id) override
    {
        if (auto e { fail() })
            return e;
        return inner.get_intent(id);
    }
    Result<std::vector<Batch>> open_batches() override
    {
        if (auto e { fail() })
            return e;
        return inner.open_batches();
    }
    Result<bool> finalize_batch(const BatchId& id, FinalizeTrigger t, const Address& caller) override
    {
        if (auto e { fail() })
            return e;
        return inner.finalize_batch(id, t, caller);
    }
    Result<SettlementReceipt> submit_settlement(const defi::SettlementSubmission& s) override
    {
        settlementCalls += 1;
        if (auto e { fail() })
            return e;
        if (rejections > 0) {
            rejections -= 1;
            return Error(ELEDGERREJECTED);
        }
        return inner.submit_settlement(s);
    }
    Result<bool> is_committee_member_selected(const BatchId& id, const Address& a) override
    {
        if (auto e { fail() })
            return e;
        return inner.is_committee_member_selected(id, a);
    }
    Result<void> register_operator(const Address& a) override
    {
        if (auto e { fail() })
            return e;
        return inner.register_operator(a);
    }
    Result<void> post_attestation(const BatchId& id, const SettlementHash& h, const RecoverableSignature& sig) override
    {
        if (auto e { fail() })
            return e;
        return inner.post_attestation(id, h, sig);
    }
    Result<std::vector<Attestation>> attestations(const BatchId& id) override
    {
        if (auto e { fail() })
            return e;
        return inner.attestations(id);
    }

private:
    Error fail()
    {
        if (networkFailures > 0) {
            networkFailures -= 1;
            return ENETWORK;
        }
        return {};
    }
    Ledger& inner;
};

// Decryption service that is unavailable for the next n requests.
class FlakyDecryption : public codec::DecryptionService {
public:
    FlakyDecryption(codec::DecryptionService& inner)
        : inner(inner)
    {
    }
    int unavailable { 0 };
    int calls { 0 };
    Result<codec::RawCleartext> decrypt(const codec::Handle& h) override
    {
        calls += 1;
        if (unavailable > 0) {
            unavailable -= 1;
            return Error(EDECRYPTUNAVAIL);
        }
        return inner.decrypt(h);
    }

private:
    codec::DecryptionService& inner;
};
