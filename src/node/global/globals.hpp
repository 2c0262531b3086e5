#pragma once
#include "config/config.hpp"
#include <memory>

namespace spdlog {
class logger;
}

struct Global {
    Config conf;
    std::shared_ptr<spdlog::logger> logger;
};

const Config& config();
Config& set_config();
int init_config(int argc, char** argv);

// installs the configured log level and the optional rotating file sink
void start_logging();
