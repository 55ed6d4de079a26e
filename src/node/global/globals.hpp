#pragma once
#include "config/config.hpp"
#include <memory>
#include <optional>

namespace spdlog {
class logger;
}

struct Global {
    std::shared_ptr<spdlog::logger> settlementLogger;
    std::optional<Config> conf;
};

const Global& global();
const Config& config();
int init_config(int argc, char** argv);
void global_init();
