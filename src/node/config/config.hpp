#pragma once

#include <optional>
#include <string>
#include <vector>
struct gengetopt_args_info;

struct Config {
    struct DB {
        std::string backend { "sqlite" };
        std::string path { "tokenledger.db3" };
    } db;
    struct Log {
        std::string level { "info" };
        std::string file; // empty means no file sink
        bool commands { false };
        bool events { false };
    } log;
    struct Run {
        std::optional<std::string> caller;
        std::optional<std::string> script;
        std::vector<std::string> command;
    } run;

    [[nodiscard]] bool memory_backend() const { return db.backend == "memory"; }
    std::string dump() const;

    // returns 1 to continue, otherwise the process exit code
    int init(int argc, char** argv);

private:
    std::optional<int> process_config_file(const gengetopt_args_info&, bool silent);
    void process_args(const gengetopt_args_info&);
};
