#include "config.hpp"
#include "cmdline/cmdline.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>

using namespace std;

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
            if (it->second.is_table() == false)
                throw std::runtime_error("Configuration file's "s + std::string(s) + " must be a table."s);
            auto p { it->second.as_table() };
            assert(p != nullptr);
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
    U& flag_val)
{
    if (flag_given)
        dst = flag_val;
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

void check_backend(const std::string& backend)
{
    if (backend != "sqlite" && backend != "memory")
        throw std::runtime_error("Unknown database backend \"" + backend + "\", expected \"sqlite\" or \"memory\".");
}

void check_level(const std::string& level)
{
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off")
        throw std::runtime_error("Unknown log level \"" + level + "\".");
}
} // namespace

void Config::process_args(const gengetopt_args_info& ai)
{
    fill_arg(db.path, ai.db_given, ai.db_arg);
    if (ai.db_given)
        db.backend = "sqlite";
    if (ai.memory_given)
        db.backend = "memory";
    fill_arg(log.file, ai.log_file_given, ai.log_file_arg);
    if (ai.log_commands_given)
        log.commands = true;
    if (ai.log_events_given)
        log.events = true;
    if (ai.debug_given)
        log.level = "debug";

    if (ai.caller_given)
        run.caller = ai.caller_arg;
    if (ai.script_given)
        run.script = ai.script_arg;
    for (unsigned i = 0; i < ai.inputs_num; ++i)
        run.command.push_back(ai.inputs[i]);
}

std::optional<int> Config::process_config_file(const gengetopt_args_info& ai, bool silent)
{
    std::string filename = "config.toml";
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
            spdlog::debug("Reading configuration file \"{}\"", filename);

        // overwrite with config file
        toml::table tbl = toml::parse_file(filename);
        TableReader root(tbl, filename);

        auto s_db { root.subtable("db") };
        fill(db.backend, s_db, "backend");
        fill(db.path, s_db, "path");

        auto s_log { root.subtable("log") };
        fill(log.level, s_log, "level");
        fill(log.file, s_log, "file");
        fill(log.commands, s_log, "commands");
        fill(log.events, s_log, "events");

        check_backend(db.backend);
        check_level(log.level);
        if (ai.test_given) {
            std::cout << "Configuration file \"" + filename + "\" is valid.\n";
            return 0;
        }
    }
    return {};
}

int Config::init(int argc, char** argv)
{
    auto p { CmdlineParsed::parse(argc, argv) };
    if (!p)
        return -1;
    auto& ai { p->value() };
    try {
        bool dmp(ai.dump_config_given);
        if (ai.debug_given)
            spdlog::set_level(spdlog::level::debug);

        if (auto i { process_config_file(ai, dmp) })
            return *i;
        process_args(ai);

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

std::string Config::dump() const
{
    toml::table tbl;
    tbl.insert_or_assign("db", toml::table {
                                   { "backend", db.backend },
                                   { "path", db.path },
                               });
    tbl.insert_or_assign("log", toml::table {
                                    { "level", log.level },
                                    { "file", log.file },
                                    { "commands", log.commands },
                                    { "events", log.events },
                                });
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}
