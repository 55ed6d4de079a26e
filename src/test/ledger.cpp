#include "ledger/cipher_vault.hpp"
#include "ledger/ledger_db.hpp"
#include "helpers.hpp"
#include <filesystem>
#include <iostream>
using namespace std;

namespace {
const Address USDC { test_address(10) };
const Address USDT { test_address(11) };

LedgerDB::Params params(uint32_t minAttestations = 1)
{
    return {
        .batching { .blockInterval = 3, .maxIdleSeconds = 60, .maxBatchSize = 10 },
        .minAttestations = minAttestations
    };
}

IntentSubmission submission(LocalCipherVault& vault, const Address& submitter,
    Address in, Address out, uint64_t amount, BlockNumber deadline = 100)
{
    auto ev { vault.encrypt(BigUint(amount), codec::TypeTag::Uint128, 0) };
    assert(ev);
    return { submitter, test_pool(1), in, out, *ev, deadline };
}

defi::CommitteeSignature sign(const PrivKey& k, const defi::Settlement& s)
{
    return { k.pubkey().address(), k.sign(s.hash()) };
}
}

void test_cipher_vault()
{
    SQLite::Database db(":memory:", SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    auto op { test_address(1) };
    LocalCipherVault vault(db, op);
    auto ev { vault.encrypt(BigUint(1234), codec::TypeTag::Uint64, 2) };
    assert(ev);
    assert(ev->handle.type_byte() == codec::tag_to_wire(codec::TypeTag::Uint64));
    assert(ev->handle.security_zone() == 2);
    assert(ev->proof.size() == 32);

    // same value encrypts to a different handle
    auto ev2 { vault.encrypt(BigUint(1234), codec::TypeTag::Uint64, 2) };
    assert(ev2->handle != ev->handle);

    assert(vault.decrypt(ev->handle).error().code == EDECRYPTUNAVAIL);
    vault.grant(op);
    assert(vault.has_grant(op));
    codec::Codec c(vault);
    assert(c.decode(*ev, codec::TypeTag::Uint64).value() == codec::NativeValue(BigUint(1234)));
    std::array<uint8_t, 32> unknown {};
    assert(vault.decrypt(codec::Handle(unknown)).error().code == ENOTFOUND);
    vault.revoke(op);
    assert(c.decode(*ev, codec::TypeTag::Uint64).error().code == EDECRYPTUNAVAIL);

    assert(vault.encrypt(BigUint(300), codec::TypeTag::Uint8, 0).error().code == ETYPEMISMATCH);
}

void test_submit_and_finalize()
{
    uint64_t now { 1000 };
    LedgerDB ledger(":memory:", params(), [&] { return now; });
    LocalCipherVault vault(ledger.database(), test_address(1));
    auto alice { test_address(20) };

    assert(ledger.block_number().value() == 0);
    auto r1 { ledger.submit_intent(submission(vault, alice, USDC, USDT, 1000)) };
    assert(r1);
    assert(r1->block == 1);
    auto r2 { ledger.submit_intent(submission(vault, alice, USDT, USDC, 800)) };
    assert(r2 && r2->batchId == r1->batchId);
    assert(r2->intentId != r1->intentId);

    auto intent { ledger.get_intent(r1->intentId) };
    assert(intent);
    assert(intent->submitter == alice);
    assert(intent->tokenIn == USDC && intent->tokenOut == USDT);
    assert(intent->submittedAt == 1 && intent->deadline == 100);
    assert(intent->encryptedAmount.tag == codec::TypeTag::Uint128);
    assert(ledger.get_intent(test_intent_id(99)).error().code == ENOTFOUND);

    auto expired { submission(vault, alice, USDC, USDT, 5, 2) };
    assert(ledger.submit_intent(expired).error().code == EEXPIRED);
    assert(ledger.block_number().value() == 2); // rejected call did not mine

    auto id { r1->batchId };
    assert(ledger.finalize_batch(id, FinalizeTrigger::BlockInterval, alice).error().code == EINTERVAL);
    ledger.mine();
    auto f { ledger.finalize_batch(id, FinalizeTrigger::BlockInterval, alice) };
    assert(f && *f);
    auto b { ledger.get_batch(id) };
    assert(b->state == BatchState::Finalized);
    assert(b->finalizedAt == 4u);
    assert(b->intentIds.size() == 2);
    assert(ledger.open_batches()->empty());
    assert(ledger.finalized_batches().size() == 1);

    // a second finalizer observes a no-op and nothing is mined
    auto head { ledger.block_number().value() };
    assert(ledger.finalize_batch(id, FinalizeTrigger::BlockInterval, alice).value() == false);
    assert(ledger.block_number().value() == head);

    auto entries { ledger.events(0, head) };
    assert(entries);
    size_t submitted { 0 }, finalized { 0 };
    for (auto& e : *entries) {
        if (events::IntentSubmittedEvent::decode(e).matched())
            submitted += 1;
        auto d { events::BatchFinalizedEvent::decode(e) };
        if (d.matched()) {
            finalized += 1;
            assert(d.event().batchId == id);
            assert(d.event().intentCount == 2);
            assert(e.block == 4);
        }
    }
    assert(submitted == 2 && finalized == 1);
}

void test_idle_finalization_requires_committee()
{
    uint64_t now { 1000 };
    LedgerDB ledger(":memory:", params(), [&] { return now; });
    LocalCipherVault vault(ledger.database(), test_address(1));
    PrivKey k;
    auto op { k.pubkey().address() };
    auto r { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 10)) };
    assert(r);
    now = 1061;
    assert(ledger.finalize_batch(r->batchId, FinalizeTrigger::Idle, op).error().code == ENOTPRIVILEGED);
    assert(ledger.register_operator(op));
    assert(ledger.is_committee_member_selected(r->batchId, op).value());
    assert(!ledger.is_committee_member_selected(r->batchId, test_address(2)).value());
    assert(ledger.is_committee_member_selected(test_batch_id(9), op).error().code == ENOTFOUND);
    assert(ledger.finalize_batch(r->batchId, FinalizeTrigger::Idle, op).value());
}

void test_attestations_and_settlement()
{
    uint64_t now { 1000 };
    LedgerDB ledger(":memory:", params(2), [&] { return now; });
    LocalCipherVault vault(ledger.database(), test_address(1));
    PrivKey k1, k2, outsider;
    assert(ledger.register_operator(k1.pubkey().address()));
    assert(ledger.register_operator(k2.pubkey().address()));

    auto r { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 10)) };
    assert(r);
    auto id { r->batchId };
    defi::Settlement s {
        .batchId { id },
        .internalizedTransfers {},
        .netSwaps { { USDC, USDT, BigUint(10), { r->intentId } } },
        .excludedIntentIds {}
    };
    defi::SettlementSubmission sub { s, { sign(k1, s), sign(k2, s) }, {} };

    // open batches cannot be settled
    assert(ledger.submit_settlement(sub).error().code == ELEDGERREJECTED);
    assert(ledger.finalize_batch(id, FinalizeTrigger::AdminOverride, k1.pubkey().address()).value());

    // attestation board
    auto hash { s.hash() };
    assert(ledger.post_attestation(id, hash, outsider.sign(hash)).error().code == ENOTCOMMITTEE);
    assert(ledger.post_attestation(id, hash, k1.sign(hash)));
    assert(ledger.post_attestation(id, hash, k1.sign(hash))); // repeated post is harmless
    auto board { ledger.attestations(id) };
    assert(board && board->size() == 1);
    assert((*board)[0].operatorId == k1.pubkey().address());
    assert((*board)[0].settlementHash == hash);

    // quorum of two distinct members
    defi::SettlementSubmission dup { s, { sign(k1, s), sign(k1, s) }, {} };
    assert(ledger.submit_settlement(dup).error().code == ELEDGERREJECTED);
    defi::SettlementSubmission foreign { s, { sign(k1, s), sign(outsider, s) }, {} };
    assert(ledger.submit_settlement(foreign).error().code == ELEDGERREJECTED);
    auto tampered { sub };
    tampered.settlement.netSwaps[0].netAmount = BigUint(11);
    assert(ledger.submit_settlement(tampered).error().code == ELEDGERREJECTED);

    auto receipt { ledger.submit_settlement(sub) };
    assert(receipt);
    assert(receipt->settlementHash == hash);
    assert(ledger.get_batch(id)->state == BatchState::Settled);
    assert(ledger.submit_settlement(sub).error().code == EALREADYSETTLED);

    auto latest { ledger.latest_settlements(5) };
    assert(latest.size() == 1);
    assert(latest[0].batchId == id && latest[0].block == receipt->block);
    assert(latest[0].document.find(hash.hex_string()) != std::string::npos);

    auto entries { ledger.events(receipt->block, receipt->block) };
    assert(entries && entries->size() == 1);
    auto settled { events::BatchSettledEvent::decode((*entries)[0]) };
    assert(settled.matched() && settled.event().netSwapCount == 1);
}

void test_encrypted_amount_count()
{
    uint64_t now { 1000 };
    LedgerDB ledger(":memory:", params(1), [&] { return now; });
    LocalCipherVault vault(ledger.database(), test_address(1));
    PrivKey k;
    assert(ledger.register_operator(k.pubkey().address()));
    auto a { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 10)) };
    auto b { ledger.submit_intent(submission(vault, test_address(21), USDT, USDC, 10)) };
    assert(a && b);
    assert(ledger.finalize_batch(a->batchId, FinalizeTrigger::AdminOverride, k.pubkey().address()).value());
    defi::Settlement s {
        .batchId { a->batchId },
        .internalizedTransfers { { a->intentId, b->intentId, test_address(20), test_address(21),
            USDC, USDT, BigUint(10), BigUint(10) } },
        .netSwaps {},
        .excludedIntentIds {}
    };
    defi::SettlementSubmission missing { s, { sign(k, s) }, {} };
    assert(ledger.submit_settlement(missing).error().code == ELEDGERREJECTED);
    auto amount { vault.encrypt(BigUint(10), codec::TypeTag::Uint128, 0) };
    defi::SettlementSubmission complete { s, { sign(k, s) }, { { *amount, *amount } } };
    assert(ledger.submit_settlement(complete));
}

void test_reopen_restores_state()
{
    auto path { (std::filesystem::temp_directory_path() / "veilbatch_ledger_test.db3").string() };
    std::filesystem::remove(path);
    uint64_t now { 1000 };
    PrivKey k;
    BatchId finalizedId { test_batch_id(0) }, openId { test_batch_id(0) };
    {
        LedgerDB ledger(path, params(), [&] { return now; });
        LocalCipherVault vault(ledger.database(), test_address(1));
        assert(ledger.register_operator(k.pubkey().address()));
        auto r { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 10)) };
        finalizedId = r->batchId;
        assert(ledger.finalize_batch(finalizedId, FinalizeTrigger::AdminOverride, k.pubkey().address()).value());
        auto r2 { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 20)) };
        openId = r2->batchId;
    }
    {
        LedgerDB ledger(path, params(), [&] { return now; });
        assert(ledger.block_number().value() == 4);
        assert(ledger.get_batch(finalizedId)->state == BatchState::Finalized);
        auto open { ledger.open_batches() };
        assert(open->size() == 1 && (*open)[0].id == openId);
        assert((*open)[0].intentIds.size() == 1);
        // committee privileges survive the restart
        assert(ledger.finalize_batch(openId, FinalizeTrigger::AdminOverride, k.pubkey().address()).value());
        // ids of new batches keep counting
        LocalCipherVault vault(ledger.database(), test_address(1));
        auto r3 { ledger.submit_intent(submission(vault, test_address(20), USDC, USDT, 30)) };
        assert(r3 && r3->batchId != openId && r3->batchId != finalizedId);
    }
    std::filesystem::remove(path);
}

int main()
{
    ECC_Start();
    test_cipher_vault();
    test_submit_and_finalize();
    test_idle_finalization_requires_committee();
    test_attestations_and_settlement();
    test_encrypted_amount_count();
    test_reopen_restores_state();
    ECC_Stop();
    cout << "ledger tests passed" << endl;
    return 0;
}
