#include "cli/executor.hpp"
#include "global/globals.hpp"
#include "spdlog/spdlog.h"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include <fstream>
#include <iostream>

namespace {
std::unique_ptr<store::KVStore> open_store()
{
    if (config().memory_backend()) {
        spdlog::debug("Using volatile in-memory ledger");
        return std::make_unique<store::MemoryStore>();
    }
    spdlog::debug("Ledger database: {}", config().db.path);
    return std::make_unique<store::SQLiteStore>(config().db.path);
}

// prints the result line, returns whether the command succeeded
bool print_result(const nlohmann::json& j)
{
    std::cout << j.dump() << std::endl;
    return j["code"] == 0;
}

int run_script(cli::Executor& executor, const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open script file \"{}\"", path);
        return 1;
    }
    std::string line;
    size_t lineno { 0 };
    while (std::getline(file, line)) {
        lineno += 1;
        auto tokens { cli::tokenize(line) };
        if (tokens.empty())
            continue;
        if (!print_result(executor.run(tokens))) {
            spdlog::error("Script \"{}\" stopped at line {}", path, lineno);
            return 1;
        }
    }
    return 0;
}
}

int run_app(int argc, char** argv)
{
    int i = init_config(argc, argv);
    if (i <= 0)
        return i; // >0 means continue with execution
    start_logging();

    auto& run { config().run };
    if (!run.script && run.command.empty()) {
        spdlog::error("No command given, see --help");
        return 1;
    }
    if (run.script && !run.command.empty()) {
        spdlog::error("Cannot combine --script with a command");
        return 1;
    }

    auto kv { open_store() };
    std::optional<AccountId> defaultCaller;
    if (run.caller)
        defaultCaller = AccountId { *run.caller };
    cli::Executor executor(*kv, std::move(defaultCaller));

    if (run.script)
        return run_script(executor, *run.script);
    return print_result(executor.run(run.command)) ? 0 : 1;
}

int main(int argc, char** argv)
{
    try {
        return run_app(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
    } catch (const Error& e) {
        spdlog::error("Fatal: {}", e.format());
    }
    return 2;
}
