#include "config.hpp"
#include "cmdline/cmdline.h"
#include "general/errors.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include "version.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#ifdef __linux__
#include <pwd.h>
#include <unistd.h>
#endif

using namespace std;

std::string ConfigParams::get_default_datadir()
{
    const char* osBaseDir = nullptr;
#ifdef __linux__
    if ((osBaseDir = getenv("HOME")) == NULL) {
        osBaseDir = getpwuid(getuid())->pw_dir;
    }
    if (osBaseDir == nullptr)
        throw std::runtime_error("Cannot determine default data directory.");
    return std::string(osBaseDir) + "/.veilbatch/";
#else
    throw std::runtime_error("Cannot determine default data directory.");
#endif
}

namespace {

struct CmdlineParsed {
    static std::optional<CmdlineParsed> parse(int argc, char** argv)
    {
        gengetopt_args_info ai;
        if (cmdline_parser(argc, argv, &ai) != 0)
            return {};
        return CmdlineParsed { ai };
    }
    CmdlineParsed(const CmdlineParsed&) = delete;
    CmdlineParsed(CmdlineParsed&& other)
        : ai(other.ai)
    {
        other.deleteOnDestruction = false;
    };
    ~CmdlineParsed()
    {
        if (deleteOnDestruction) {
            cmdline_parser_free(&ai);
        }
    }
    auto& value() const { return ai; }

private:
    CmdlineParsed(gengetopt_args_info& ai0)
        : ai(ai0)
    {
    }

    bool deleteOnDestruction { true };
    gengetopt_args_info ai;
};

std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
std::optional<T> config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

template <>
std::optional<PrivKey> config_convert(const toml::node& n)
{
    try {
        if (auto sv { n.value<std::string_view>() })
            return PrivKey(*sv);
    } catch (Error e) {
        spdlog::error("Invalid signing key: {}", e.strerror());
    }
    throw failed_convert(n);
}

struct TableReaderData {
    const toml::table& tbl;
    std::string_view filepath;
    mutable std::map<toml::key, bool> keyUsed;
};

struct TableReader : public TableReaderData {
    bool report { true };
    TableReader(const toml::table& tbl, std::string_view filepath)
        : TableReaderData(tbl, filepath, {})
    {
        for (auto& [k, v] : tbl) {
            keyUsed.emplace(k, false);
        }
    }
    TableReader(const TableReader&) = delete;
    TableReader(TableReader&& a)
        : TableReaderData(std::move(a))
    {
        a.report = false;
    };
    ~TableReader()
    {
        if (report) {
            for (auto& [k, used] : keyUsed) {
                if (!used) {
                    spdlog::warn("Ignoring configuration setting \""s + std::string(k.str()) + "\" at line "s + std::to_string(k.source().begin.line) + " in file "s + string(filepath));
                }
            }
        }
    }

    std::optional<TableReader> subtable(std::string_view s)
    {
        if (auto it { tbl.find(s) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            auto p { it->second.as_table() };
            if (p == nullptr)
                throw std::runtime_error("Configuration file's "s + std::string(s) + " must be a table."s);
            return TableReader { *p, filepath };
        }
        return std::nullopt;
    }

    struct Entry {
        const toml::node* v;

        template <typename T>
        std::optional<T> get() const
        {
            return config_convert<T>(*v);
        }
    };
    std::optional<Entry> operator[](std::string_view key) const
    {
        if (auto it { tbl.find(key) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            return { Entry { &it->second } };
        }
        return std::nullopt;
    }
};

template <typename U>
void fill_arg(
    auto& dst,
    bool flag_given,
    U& flag_val,
    auto flag_map)
{
    if (flag_given)
        dst = flag_map(flag_val);
}

template <typename U>
void fill_arg(
    auto& dst,
    bool flag_given,
    U& flag_val)
{
    fill_arg<U>(dst, flag_given, flag_val,
        [](U& u) { return u; });
}

template <typename T>
void fill(
    T& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

template <typename T>
void fill(
    std::optional<T>& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

auto positive(std::string_view argname)
{
    return [argname](int v) -> uint32_t {
        if (v <= 0)
            throw std::runtime_error("Option --"s + string(argname) + " must be positive.");
        return uint32_t(v);
    };
}

} // namespace

tl::expected<ConfigParams, int> ConfigParams::from_args(int argc, char** argv)
{
    auto p { CmdlineParsed::parse(argc, argv) };
    if (!p)
        return tl::make_unexpected(-1);

    ConfigParams c;
    if (auto i { c.init(p->value()) }; i < 1) {
        return tl::make_unexpected(i);
    }
    return c;
}

void ConfigParams::process_args(const gengetopt_args_info& ai)
{
    fill_arg(data.ledgerdb, ai.ledger_db_given, ai.ledger_db_arg);
    fill_arg(operatorKey.signingKey, ai.signing_key_given, ai.signing_key_arg,
        [](const char* s) {
            try {
                return PrivKey(s);
            } catch (Error e) {
                throw std::runtime_error("Bad --signing-key option specified: "s + e.strerror());
            }
        });
    fill_arg(polling.shortSeconds, ai.short_poll_given, ai.short_poll_arg, positive("short-poll"));
    fill_arg(polling.idleSeconds, ai.idle_poll_given, ai.idle_poll_arg, positive("idle-poll"));
    fill_arg(polling.maxIdleSeconds, ai.max_idle_given, ai.max_idle_arg, positive("max-idle"));
    fill_arg(batching.blockInterval, ai.batch_interval_given, ai.batch_interval_arg, positive("batch-interval"));
    fill_arg(batching.maxBatchSize, ai.max_batch_size_given, ai.max_batch_size_arg, positive("max-batch-size"));
    fill_arg(consensus.minAttestations, ai.min_attestations_given, ai.min_attestations_arg, positive("min-attestations"));
    fill_arg(retry.decryptAttempts, ai.decrypt_attempts_given, ai.decrypt_attempts_arg, positive("decrypt-attempts"));

    fill_arg(submit.pool, ai.pool_given, ai.pool_arg);
    fill_arg(submit.tokenIn, ai.token_in_given, ai.token_in_arg);
    fill_arg(submit.tokenOut, ai.token_out_given, ai.token_out_arg);
    fill_arg(submit.amount, ai.amount_given, ai.amount_arg);
    fill_arg(submit.submitter, ai.submitter_given, ai.submitter_arg);
    fill_arg(submit.deadline, ai.deadline_given, ai.deadline_arg,
        [](long d) -> uint64_t {
            if (d < 0)
                throw std::runtime_error("Option --deadline must not be negative.");
            return uint64_t(d);
        });
}

void ConfigParams::process_env()
{
    if (const char* key = getenv("VEILBATCH_SIGNING_KEY"); key != nullptr) {
        try {
            operatorKey.signingKey = PrivKey(key);
        } catch (Error e) {
            throw std::runtime_error("Bad VEILBATCH_SIGNING_KEY environment variable: "s + e.strerror());
        }
    }
}

std::optional<int> ConfigParams::process_config_file(const gengetopt_args_info& ai, bool silent)
{
    std::string filename { "config.toml" };
    if (!ai.config_given && !std::filesystem::exists(filename)) {
        if (!silent)
            spdlog::debug("No config.toml file found, using default configuration");
        if (ai.test_given) {
            spdlog::error("No configuration file found.");
            return -1;
        }
    } else {
        if (ai.config_given)
            filename = ai.config_arg;
        if (!silent)
            spdlog::info("Reading configuration file \"{}\"", filename);

        // overwrite with config file
        toml::table tbl = toml::parse_file(filename);
        TableReader root(tbl, filename);

        auto s_ledger { root.subtable("ledger") };
        fill(data.ledgerdb, s_ledger, "db");

        auto s_operator { root.subtable("operator") };
        fill(operatorKey.signingKey, s_operator, "signing-key");

        auto s_polling { root.subtable("polling") };
        fill(polling.shortSeconds, s_polling, "short-seconds");
        fill(polling.idleSeconds, s_polling, "idle-seconds");
        fill(polling.maxIdleSeconds, s_polling, "max-idle-seconds");

        auto s_batching { root.subtable("batching") };
        fill(batching.blockInterval, s_batching, "block-interval");
        fill(batching.maxBatchSize, s_batching, "max-batch-size");

        auto s_consensus { root.subtable("consensus") };
        fill(consensus.minAttestations, s_consensus, "min-attestations");

        auto s_retry { root.subtable("retry") };
        fill(retry.decryptAttempts, s_retry, "decrypt-attempts");
        fill(retry.baseDelayMs, s_retry, "base-delay-ms");
        fill(retry.maxDelayMs, s_retry, "max-delay-ms");
        if (ai.test_given) {
            std::cout << "Configuration file \"" + filename + "\" is valid.\n";
            return 0;
        }
    }
    return {};
}

void ConfigParams::validate() const
{
    if (polling.shortSeconds == 0 || polling.idleSeconds == 0)
        throw std::runtime_error("Polling intervals must be positive.");
    if (batching.blockInterval == 0 || batching.maxBatchSize == 0)
        throw std::runtime_error("Batching parameters must be positive.");
    if (consensus.minAttestations == 0)
        throw std::runtime_error("min-attestations must be at least 1.");
    if (retry.decryptAttempts == 0 || retry.baseDelayMs == 0 || retry.maxDelayMs < retry.baseDelayMs)
        throw std::runtime_error("Invalid retry parameters.");
}

int ConfigParams::init(const gengetopt_args_info& ai)
{
    try {
        bool dmp(ai.dump_config_given);
        if (!dmp)
            spdlog::info("veilbatch v{}.{}.{} ", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);

        if (ai.debug_given) {
            debug = true;
            spdlog::set_level(spdlog::level::debug);
        }

        if (ai.inputs_num > 1) {
            spdlog::error("Expected at most one command.");
            return -1;
        }
        if (ai.inputs_num == 1) {
            std::string_view cmd { ai.inputs[0] };
            if (cmd == "status")
                command = Command::Status;
            else if (cmd == "submit")
                command = Command::Submit;
            else {
                spdlog::error("Unknown command '{}'.", cmd);
                return -1;
            }
        }

        data.datadir = ai.datadir_given ? std::string(ai.datadir_arg) + "/" : get_default_datadir();
        prepare_dir(data.datadir, !dmp);
        data.ledgerdb = data.datadir + "ledger.db3";

        if (auto i { process_config_file(ai, dmp) })
            return *i;
        process_env();
        process_args(ai);
        validate();

        if (dmp) {
            std::cout << dump();
            return 0;
        }
    } catch (const toml::parse_error& err) {
        std::cerr << "Error while parsing file '" << *err.source().path << "':\n"
                  << err.description() << "\n  (" << err.source().begin
                  << ")\n";
        return -1;
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    }
    return 1;
}

void ConfigParams::prepare_dir(const std::string& dir, bool log)
{
    if (!std::filesystem::exists(dir)) {
        if (log)
            spdlog::info("Creating directory {}", dir);
        std::error_code ec;
        if (!std::filesystem::create_directories(dir, ec)) {
            throw std::runtime_error("Cannot create directory " + dir + ": " + ec.message());
        }
    }
}

std::string ConfigParams::dump()
{
    toml::table tbl;
    tbl.insert_or_assign("ledger", toml::table {
                                       { "db", data.ledgerdb },
                                   });
    tbl.insert_or_assign("operator", toml::table {
                                         { "signing-key", operatorKey.signingKey ? operatorKey.signingKey->to_string() : ""s },
                                     });
    tbl.insert_or_assign("polling", toml::table {
                                        { "short-seconds", int64_t(polling.shortSeconds) },
                                        { "idle-seconds", int64_t(polling.idleSeconds) },
                                        { "max-idle-seconds", int64_t(polling.maxIdleSeconds) },
                                    });
    tbl.insert_or_assign("batching", toml::table {
                                         { "block-interval", int64_t(batching.blockInterval) },
                                         { "max-batch-size", int64_t(batching.maxBatchSize) },
                                     });
    tbl.insert_or_assign("consensus", toml::table {
                                          { "min-attestations", int64_t(consensus.minAttestations) },
                                      });
    tbl.insert_or_assign("retry", toml::table {
                                      { "decrypt-attempts", int64_t(retry.decryptAttempts) },
                                      { "base-delay-ms", int64_t(retry.baseDelayMs) },
                                      { "max-delay-ms", int64_t(retry.maxDelayMs) },
                                  });
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}

Config::Config(ConfigParams&& params)
    : ConfigParams(std::move(params))
{
}
