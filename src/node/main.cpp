#include "api/json.hpp"
#include "consensus/aggregator.hpp"
#include "engine/scheduler.hpp"
#include "general/errors.hpp"
#include "global/globals.hpp"
#include "ledger/cipher_vault.hpp"
#include "ledger/ledger_db.hpp"
#include "publisher/publisher.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include "uvw.hpp"
#include <iostream>

using namespace std::chrono_literals;

namespace {
std::shared_ptr<uvw::timer_handle> shortTimer;
std::shared_ptr<uvw::timer_handle> idleTimer;
int exitCode { 0 };
}

static void shutdown(Error reason);
static void signal_caller(uv_signal_t* /*handle*/, int signum)
{
    spdlog::info("Terminating...");
    switch (signum) {
    case SIGTERM:
        shutdown(ESIGTERM);
        return;
    case SIGHUP:
        shutdown(ESIGHUP);
        return;
    case SIGINT:
        shutdown(ESIGINT);
        return;
    default:;
    }
}

static uv_signal_t sigint, sighup, sigterm;
void setup_signals(uv_loop_t* l)
{
#if defined(SIGPIPE)
    signal(SIGPIPE, SIG_IGN);
#endif
    int i;
    if ((i = uv_signal_init(l, &sigint)) < 0)
        goto error;
    if ((i = uv_signal_start(&sigint, signal_caller, SIGINT)) < 0)
        goto error;
    if ((i = uv_signal_init(l, &sighup)) < 0)
        goto error;
    if ((i = uv_signal_start(&sighup, signal_caller, SIGHUP)) < 0)
        goto error;
    if ((i = uv_signal_init(l, &sigterm)) < 0)
        goto error;
    if ((i = uv_signal_start(&sigterm, signal_caller, SIGTERM)) < 0)
        goto error;
    uv_unref((uv_handle_t*)&sigint);
    uv_unref((uv_handle_t*)&sighup);
    uv_unref((uv_handle_t*)&sigterm);
    return;
error:
    throw std::runtime_error("Cannot setup signals: " + std::string(Error(i).err_name()));
}
void free_signals()
{
    uv_close((uv_handle_t*)&sigint, nullptr);
    uv_close((uv_handle_t*)&sighup, nullptr);
    uv_close((uv_handle_t*)&sigterm, nullptr);
}

static void shutdown(Error reason)
{
    spdlog::info("Shutting down: {}", reason.strerror());
    if (shortTimer) {
        shortTimer->stop();
        shortTimer->close();
    }
    if (idleTimer) {
        idleTimer->stop();
        idleTimer->close();
    }
}

static LedgerDB::Params ledger_params(const Config& c)
{
    return {
        .batching {
            .blockInterval = c.batching.blockInterval,
            .maxIdleSeconds = c.polling.maxIdleSeconds,
            .maxBatchSize = c.batching.maxBatchSize },
        .minAttestations = c.consensus.minAttestations
    };
}

static int run_status(LedgerDB& ledger)
{
    using jsonmsg::json;
    auto tip { ledger.tip() };
    json j;
    j["head"] = { { "height", tip.height }, { "timestamp", tip.timestamp } };

    auto open { ledger.open_batches() };
    if (!open) {
        spdlog::error("Cannot read open batches: {}", open.error().format());
        return open.error().code;
    }
    json pools = json::object();
    for (auto& b : *open)
        pools[b.poolId.hex_string()] = jsonmsg::to_json(b);
    j["openBatches"] = pools;
    j["pendingBatches"] = jsonmsg::to_json(ledger.finalized_batches());

    json settlements = json::array();
    for (auto& s : ledger.latest_settlements(10)) {
        settlements.push_back({ { "batchId", s.batchId.hex_string() },
            { "settlementHash", s.settlementHash.hex_string() },
            { "block", s.block },
            { "settlement", json::parse(s.document) } });
    }
    j["settlements"] = settlements;
    std::cout << j.dump(1) << std::endl;
    return 0;
}

static int run_submit(LedgerDB& ledger, const Config& c)
{
    auto& s { c.submit };
    auto fail = [](std::string_view msg) {
        spdlog::error("{}", msg);
        return -1;
    };
    auto pool { PoolId::parse_string(s.pool) };
    if (!pool)
        return fail("Option --pool requires a 32 byte hex pool id.");
    auto tokenIn { Address::parse(s.tokenIn) };
    auto tokenOut { Address::parse(s.tokenOut) };
    if (!tokenIn || !tokenOut)
        return fail("Options --token-in and --token-out require addresses.");
    auto amount { BigUint::parse_decimal(s.amount) };
    if (!amount || !amount->fits_bits(128))
        return fail("Option --amount requires a decimal amount below 2^128.");
    if (!s.deadline)
        return fail("Option --deadline is required.");

    std::optional<Address> submitter;
    if (!s.submitter.empty())
        submitter = Address::parse(s.submitter);
    else if (c.operatorKey.signingKey)
        submitter = c.operatorKey.signingKey->pubkey().address();
    if (!submitter)
        return fail("Option --submitter requires an address unless a signing key is configured.");

    LocalCipherVault vault(ledger.database(), *submitter);
    auto encrypted { vault.encrypt(*amount, codec::TypeTag::Uint128, 0) };
    if (!encrypted) {
        spdlog::error("Cannot encrypt amount: {}", encrypted.error().format());
        return encrypted.error().code;
    }
    auto receipt { ledger.submit_intent({ .submitter { *submitter },
        .poolId { *pool },
        .tokenIn { *tokenIn },
        .tokenOut { *tokenOut },
        .amount { std::move(*encrypted) },
        .deadline = *s.deadline }) };
    if (!receipt) {
        spdlog::error("Intent rejected: {}", receipt.error().format());
        return receipt.error().code;
    }
    jsonmsg::json j;
    j["intentId"] = receipt->intentId.hex_string();
    j["batchId"] = receipt->batchId.hex_string();
    j["block"] = receipt->block;
    std::cout << j.dump(1) << std::endl;
    return 0;
}

static int run_node(LedgerDB& ledger, const Config& c)
{
    if (!c.operatorKey.signingKey) {
        spdlog::error("No signing key configured, see --signing-key.");
        return -1;
    }
    auto& key { *c.operatorKey.signingKey };
    auto self { key.pubkey().address() };
    spdlog::info("Operator address: {}", self.to_string());

    // local deployment: committee membership and decryption grant
    if (auto r { ledger.register_operator(self) }; !r) {
        spdlog::error("Cannot register operator: {}", r.error().format());
        return r.error().code;
    }
    LocalCipherVault vault(ledger.database(), self);
    vault.grant(self);

    consensus::Aggregator aggregator(ledger, c.consensus.minAttestations);
    SettlementPublisher publisher(ledger, vault, c.consensus.minAttestations,
        global().settlementLogger);
    engine::BatchProcessor processor(ledger, vault, aggregator, publisher, key);
    engine::Scheduler scheduler(ledger, processor,
        { .backoff {
              .base = std::chrono::milliseconds(c.retry.baseDelayMs),
              .max = std::chrono::milliseconds(c.retry.maxDelayMs) },
            .decryptAttempts = c.retry.decryptAttempts,
            .maxIdleSeconds = c.polling.maxIdleSeconds,
            .blockInterval = c.batching.blockInterval });

    auto l { uvw::loop::create() };
    setup_signals(l->raw());

    shortTimer = l->resource<uvw::timer_handle>();
    auto stop_on_failure = [](std::optional<Error> e) {
        if (!e)
            return;
        exitCode = e->code;
        shutdown(*e);
    };
    shortTimer->on<uvw::timer_event>([&](auto&, uvw::timer_handle&) {
        stop_on_failure(engine::guarded_tick([&] {
            scheduler.short_tick(eventloop::TimerSystem::clock::now());
        }));
    });
    idleTimer = l->resource<uvw::timer_handle>();
    idleTimer->on<uvw::timer_event>([&](auto&, uvw::timer_handle&) {
        stop_on_failure(engine::guarded_tick([&] {
            scheduler.idle_tick(eventloop::TimerSystem::clock::now(),
                LedgerDB::system_clock()());
        }));
    });
    shortTimer->start(0ms, std::chrono::seconds(c.polling.shortSeconds));
    idleTimer->start(std::chrono::seconds(c.polling.idleSeconds),
        std::chrono::seconds(c.polling.idleSeconds));

    spdlog::debug("Starting libuv loop");
    int i;
    if ((i = l->run(uvw::loop::run_mode::DEFAULT)))
        goto error;
    free_signals();
    if ((i = l->run(uvw::loop::run_mode::DEFAULT)))
        goto error;
    shortTimer.reset();
    idleTimer.reset();
    l->close();
    return exitCode;
error:
    spdlog::error("libuv error: {}", Error(i).err_name());
    return i;
}

int run_app(int argc, char** argv)
{
    int i = init_config(argc, argv);
    if (i <= 0)
        return i; // >0 means continue with execution
    global_init();
    auto& c { config() };
    spdlog::info("Ledger database: {}", c.data.ledgerdb);

    LedgerDB ledger(c.data.ledgerdb, ledger_params(c));
    switch (c.command) {
    case ConfigParams::Command::Status:
        return run_status(ledger);
    case ConfigParams::Command::Submit:
        return run_submit(ledger, c);
    case ConfigParams::Command::Run:
        return run_node(ledger, c);
    }
    return -1;
}

int main(int argc, char** argv)
{
    // stdout carries the JSON output of commands
    spdlog::set_default_logger(spdlog::stderr_color_mt("veilbatch"));
    int i;
    try {
        ECC_Start();
        i = run_app(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        i = -1;
    } catch (Error e) {
        spdlog::critical("Fatal error: {}", e.format());
        i = e.code;
    }
    spdlog::shutdown();
    ECC_Stop();
    return i;
}
