#include "engine/scheduler.hpp"
#include "ledger/cipher_vault.hpp"
#include "ledger/ledger_db.hpp"
#include "helpers.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/sinks/null_sink.h"
#include "spdlog/spdlog.h"
#include <iostream>
#include <stdexcept>
using namespace std;
using namespace std::chrono_literals;
using engine::ProcessOutcome;

namespace {
const Address USDC { test_address(10) };
const Address USDT { test_address(11) };

std::shared_ptr<spdlog::logger> settlement_log()
{
    static auto l { spdlog::null_logger_mt("settlement_test") };
    return l;
}

const engine::Scheduler::Params schedulerParams {
    .backoff { .base = 10ms, .max = 40ms },
    .decryptAttempts = 3,
    .maxIdleSeconds = 60,
    .blockInterval = 2
};

LedgerDB::Params ledger_params(uint32_t minAttestations, uint64_t blockInterval = 2)
{
    return {
        .batching { .blockInterval = blockInterval, .maxIdleSeconds = 60, .maxBatchSize = 16 },
        .minAttestations = minAttestations
    };
}

// one committee member: decryption access, signing key and polling state
struct Node {
    Node(LedgerDB& db, Ledger& ledger, uint32_t minAttestations,
        engine::Scheduler::Params params = schedulerParams)
        : vault(db.database(), key.pubkey().address())
        , decryption(vault)
        , aggregator(ledger, minAttestations)
        , publisher(ledger, vault, minAttestations, settlement_log())
        , processor(ledger, decryption, aggregator, publisher, key)
        , scheduler(db, processor, params)
    {
        assert(db.register_operator(address()));
        vault.grant(address());
    }
    Address address() const { return key.pubkey().address(); }

    PrivKey key;
    LocalCipherVault vault;
    FlakyDecryption decryption;
    consensus::Aggregator aggregator;
    SettlementPublisher publisher;
    engine::BatchProcessor processor;
    engine::Scheduler scheduler;
};

SubmitReceipt submit(LedgerDB& ledger, Address user, Address in, Address out,
    uint64_t amount, BlockNumber deadline = 100,
    codec::TypeTag tag = codec::TypeTag::Uint128)
{
    LocalCipherVault vault(ledger.database(), user);
    auto ev { vault.encrypt(BigUint(amount), tag, 0) };
    assert(ev);
    auto r { ledger.submit_intent({ user, test_pool(1), in, out, *ev, deadline }) };
    assert(r);
    return *r;
}

nlohmann::json settlement_document(LedgerDB& ledger, const BatchId& id)
{
    for (auto& s : ledger.latest_settlements(10))
        if (s.batchId == id)
            return nlohmann::json::parse(s.document);
    assert(false);
    return {};
}

auto now() { return eventloop::TimerSystem::clock::now(); }
}

void test_finalize_and_publish()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    Node n(ledger, ledger, 1);
    auto a { submit(ledger, test_address(20), USDC, USDT, 3000) };
    auto b { submit(ledger, test_address(21), USDT, USDC, 1000) };
    assert(a.batchId == b.batchId);
    auto id { a.batchId };

    // neither interval nor idle time elapsed
    auto t { now() };
    n.scheduler.idle_tick(t, unixNow);
    assert(ledger.get_batch(id)->state == BatchState::Open);

    ledger.mine();
    n.scheduler.idle_tick(t, unixNow);
    assert(ledger.get_batch(id)->state == BatchState::Finalized);

    n.scheduler.short_tick(t);
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Published);
    assert(ledger.get_batch(id)->state == BatchState::Settled);
    assert(n.scheduler.pending().empty());

    auto doc = settlement_document(ledger, id);
    assert(doc["internalizedTransfers"].size() == 1);
    assert(doc["internalizedTransfers"][0]["amountA"] == "1000");
    assert(doc["netSwaps"].size() == 1);
    assert(doc["netSwaps"][0]["netAmount"] == "2000");
    assert(doc["encryptedAmounts"].size() == 1);
    assert(doc["signatures"].size() == 1);

    // settled batch events are not reprocessed
    auto cursor { n.scheduler.cursor() };
    n.scheduler.short_tick(t);
    assert(n.scheduler.cursor() > cursor);
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Published);
}

void test_idle_finalization()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    Node n(ledger, ledger, 1);
    auto a { submit(ledger, test_address(20), USDC, USDT, 10) };
    n.scheduler.idle_tick(now(), 1060);
    assert(ledger.get_batch(a.batchId)->state == BatchState::Open);
    unixNow = 1061;
    n.scheduler.idle_tick(now(), 1061);
    assert(ledger.get_batch(a.batchId)->state == BatchState::Finalized);

    auto entries { ledger.events(0, ledger.block_number().value()) };
    bool idle { false };
    for (auto& e : *entries) {
        auto d { events::BatchFinalizedEvent::decode(e) };
        if (d.matched())
            idle = d.event().trigger == FinalizeTrigger::Idle;
    }
    assert(idle);
}

void test_decryption_backoff_and_deferral()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    Node n(ledger, ledger, 1);
    auto a { submit(ledger, test_address(20), USDC, USDT, 10) };
    auto id { a.batchId };
    assert(ledger.finalize_batch(id, FinalizeTrigger::AdminOverride, n.address()).value());

    n.decryption.unavailable = 3;
    auto t0 { now() };
    n.scheduler.short_tick(t0);
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Deferred);
    assert(n.scheduler.retry_scheduled(id));
    assert(n.scheduler.next_retry() == t0 + 10ms);

    // not yet due
    n.scheduler.short_tick(t0 + 5ms);
    assert(n.decryption.calls == 1);

    n.scheduler.short_tick(t0 + 10ms);
    assert(n.decryption.calls == 2);
    assert(n.scheduler.next_retry() == t0 + 30ms);

    // bounded attempts, then parked until the next idle poll
    n.scheduler.short_tick(t0 + 30ms);
    assert(n.decryption.calls == 3);
    assert(!n.scheduler.retry_scheduled(id));
    assert(n.scheduler.deferred().contains(id));
    assert(!n.scheduler.next_retry());
    n.scheduler.short_tick(t0 + 1s);
    assert(n.decryption.calls == 3);
    assert(ledger.get_batch(id)->state == BatchState::Finalized);

    n.scheduler.idle_tick(t0 + 2s, unixNow);
    assert(n.scheduler.deferred().empty());
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Published);
    assert(ledger.get_batch(id)->state == BatchState::Settled);
}

void test_excluded_intents()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1, 10), [&] { return unixNow; });
    Node n(ledger, ledger, 1);
    auto expiring { submit(ledger, test_address(20), USDC, USDT, 10, 2) };
    auto narrow { submit(ledger, test_address(21), USDC, USDT, 20, 100, codec::TypeTag::Uint64) };
    auto valid { submit(ledger, test_address(22), USDC, USDT, 30) };
    auto id { valid.batchId };
    assert(ledger.finalize_batch(id, FinalizeTrigger::AdminOverride, n.address()).value());
    assert(ledger.get_batch(id)->finalizedAt == 5u);

    n.scheduler.short_tick(now());
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Published);
    auto doc = settlement_document(ledger, id);
    auto excluded = doc["excludedIntentIds"];
    assert(excluded.size() == 2);
    assert(excluded[0] == expiring.intentId.hex_string());
    assert(excluded[1] == narrow.intentId.hex_string());
    assert(doc["netSwaps"].size() == 1);
    assert(doc["netSwaps"][0]["netAmount"] == "30");
    assert(doc["netSwaps"][0]["remainingIntentIds"][0] == valid.intentId.hex_string());
}

void test_transient_ledger_failures()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    FlakyLedger flaky(ledger);
    Node n(ledger, flaky, 1);
    auto a { submit(ledger, test_address(20), USDC, USDT, 10) };
    auto id { a.batchId };
    assert(ledger.finalize_batch(id, FinalizeTrigger::AdminOverride, n.address()).value());

    flaky.networkFailures = 1;
    auto t0 { now() };
    n.scheduler.short_tick(t0);
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Deferred);
    assert(n.scheduler.retry_scheduled(id));

    // retries are not bounded for network errors
    flaky.networkFailures = 1;
    n.scheduler.short_tick(t0 + 10ms);
    flaky.networkFailures = 1;
    n.scheduler.short_tick(t0 + 30ms);
    assert(n.scheduler.retry_scheduled(id));
    assert(n.scheduler.deferred().empty());
    assert(n.scheduler.next_retry() == t0 + 70ms);

    n.scheduler.short_tick(t0 + 70ms);
    assert(n.scheduler.last_outcome(id) == ProcessOutcome::Published);
    assert(!n.scheduler.retry_scheduled(id));
}

void test_quorum_across_members()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(2), [&] { return unixNow; });
    Node n1(ledger, ledger, 2);
    Node n2(ledger, ledger, 2);
    auto a { submit(ledger, test_address(20), USDC, USDT, 10) };
    auto id { a.batchId };
    assert(ledger.finalize_batch(id, FinalizeTrigger::AdminOverride, n1.address()).value());

    auto t { now() };
    n1.scheduler.short_tick(t);
    assert(n1.scheduler.last_outcome(id) == ProcessOutcome::Pending);
    assert(n1.scheduler.pending().contains(id));
    auto board { ledger.attestations(id) };
    assert(board && board->size() == 1);
    auto hash { (*board)[0].settlementHash };
    assert(n1.aggregator.status(hash)->count == 1);

    n2.scheduler.short_tick(t);
    assert(n2.scheduler.last_outcome(id) == ProcessOutcome::Published);
    assert(ledger.get_batch(id)->state == BatchState::Settled);
    assert(settlement_document(ledger, id)["signatures"].size() == 2);

    // the waiting member re-announces and observes the settlement
    n1.scheduler.short_tick(t + 1s);
    assert(n1.scheduler.last_outcome(id) == ProcessOutcome::AlreadySettled);
    assert(n1.scheduler.pending().empty());

    // nothing of the batch is retained by either member
    assert(!n1.aggregator.status(hash));
    assert(!n2.aggregator.status(hash));
}

void test_outcome_history_is_bounded()
{
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    auto params { schedulerParams };
    params.outcomeHistory = 1;
    Node n(ledger, ledger, 1, params);
    auto first { submit(ledger, test_address(20), USDC, USDT, 10) };
    assert(ledger.finalize_batch(first.batchId, FinalizeTrigger::AdminOverride, n.address()).value());
    n.scheduler.short_tick(now());
    assert(n.scheduler.last_outcome(first.batchId) == ProcessOutcome::Published);

    auto second { submit(ledger, test_address(21), USDC, USDT, 20) };
    assert(second.batchId != first.batchId);
    assert(ledger.finalize_batch(second.batchId, FinalizeTrigger::AdminOverride, n.address()).value());
    n.scheduler.short_tick(now());
    assert(n.scheduler.last_outcome(second.batchId) == ProcessOutcome::Published);
    assert(!n.scheduler.last_outcome(first.batchId));
}

void test_guarded_tick()
{
    int runs { 0 };
    assert(!engine::guarded_tick([&] { runs += 1; }));
    assert(runs == 1);

    auto e { engine::guarded_tick([] { throw Error(EDBCORRUPT); }) };
    assert(e && e->code == EDBCORRUPT);

    e = engine::guarded_tick([] { throw std::runtime_error("database is locked"); });
    assert(e && e->code == EBUG);

    // a ledger whose tables are gone fails inside the tick, not in the loop
    uint64_t unixNow { 1000 };
    LedgerDB ledger(":memory:", ledger_params(1), [&] { return unixNow; });
    Node n(ledger, ledger, 1);
    submit(ledger, test_address(20), USDC, USDT, 10);
    ledger.database().exec("DROP TABLE `Events`");
    e = engine::guarded_tick([&] { n.scheduler.short_tick(now()); });
    assert(e);
}

int main()
{
    ECC_Start();
    test_finalize_and_publish();
    test_idle_finalization();
    test_decryption_backoff_and_deferral();
    test_excluded_intents();
    test_transient_ledger_failures();
    test_quorum_across_members();
    test_outcome_history_is_bounded();
    test_guarded_tick();
    ECC_Stop();
    cout << "engine tests passed" << endl;
    return 0;
}
