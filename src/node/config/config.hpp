#pragma once

#include "crypto/crypto.hpp"
#include "tools/expected.hpp"
#include <cstdint>
#include <optional>
#include <string>
struct gengetopt_args_info;

struct ConfigParams {
    enum class Command {
        Run,
        Status,
        Submit
    } command { Command::Run };
    struct Data {
        std::string datadir;
        std::string ledgerdb;
    } data;
    struct Operator {
        std::optional<PrivKey> signingKey;
    } operatorKey;
    struct Polling {
        uint32_t shortSeconds { 5 };
        uint32_t idleSeconds { 30 };
        uint32_t maxIdleSeconds { 120 };
    } polling;
    struct Batching {
        uint32_t blockInterval { 5 };
        uint32_t maxBatchSize { 64 };
    } batching;
    struct Consensus {
        uint32_t minAttestations { 1 };
    } consensus;
    struct Retry {
        uint32_t decryptAttempts { 5 };
        uint32_t baseDelayMs { 500 };
        uint32_t maxDelayMs { 30000 };
    } retry;
    struct Submit {
        std::string pool;
        std::string tokenIn;
        std::string tokenOut;
        std::string amount;
        std::optional<uint64_t> deadline;
        std::string submitter;
    } submit;
    bool debug { false };

    static tl::expected<ConfigParams, int> from_args(int argc, char** argv);
    std::string dump();

private:
    ConfigParams() { };
    static std::string get_default_datadir();
    static void prepare_dir(const std::string&, bool log);
    int init(const gengetopt_args_info&);
    void process_args(const gengetopt_args_info&);
    std::optional<int> process_config_file(const gengetopt_args_info&, bool silent);
    void process_env();
    void validate() const;
};

struct Config : public ConfigParams {
    Config(ConfigParams&&);
};
