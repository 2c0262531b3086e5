#include "globals.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace {
Global globalinstance;

auto create_file_logger(const std::string& path)
{
    auto max_size = 1048576 * 5; // 5 MB
    auto max_files = 3;
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_size, max_files);
}
}

int init_config(int argc, char** argv)
{
    return globalinstance.conf.init(argc, argv);
}

const Config& config()
{
    return globalinstance.conf;
}
Config& set_config()
{
    return globalinstance.conf;
}

void start_logging()
{
    auto& conf { globalinstance.conf };
    // stdout carries command results, log messages go to stderr
    std::vector<spdlog::sink_ptr> sinks { std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
    if (!conf.log.file.empty())
        sinks.push_back(create_file_logger(conf.log.file));
    globalinstance.logger = std::make_shared<spdlog::logger>("tokenledger", sinks.begin(), sinks.end());
    globalinstance.logger->set_level(spdlog::level::from_str(conf.log.level));
    spdlog::set_default_logger(globalinstance.logger);
}
