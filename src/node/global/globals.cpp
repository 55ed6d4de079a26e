#include "globals.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/spdlog.h"
namespace {

auto create_settlement_logger()
{
    auto max_size = 1048576 * 5; // 5 MB
    auto max_files = 3;
    return spdlog::rotating_logger_mt("settlement_logger", config().data.datadir + "logs/settlements.log", max_size, max_files);
}

Global globalinstance;
}

const Global& global()
{
    return globalinstance;
}

int init_config(int argc, char** argv)
{
    auto p { ConfigParams::from_args(argc, argv) };
    if (!p)
        return p.error();
    globalinstance.conf.emplace(std::move(*p));
    return 1;
};

const Config& config()
{
    return *globalinstance.conf;
}

void global_init()
{
    globalinstance.settlementLogger = create_settlement_logger();
};
