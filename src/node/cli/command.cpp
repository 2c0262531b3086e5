#include "command.hpp"
#include "general/hex.hpp"
#include <cctype>
#include <functional>
#include <map>
#include <span>

namespace cli {
namespace {
class Args {
public:
    Args(std::span<const std::string> args)
        : args(args)
    {
    }
    size_t size() const { return args.size(); }
    Result<AssetId> asset_id(size_t i) const
    {
        if (auto id { AssetId::parse(args[i]) })
            return *id;
        return Error(EINV_NUMBER);
    }
    Result<Funds_uint128> amount(size_t i) const
    {
        if (auto f { Funds_uint128::parse(args[i]) })
            return *f;
        return Error(EINV_NUMBER);
    }
    Result<Bytes> bytes(size_t i) const
    {
        return parse_bytes(args[i]);
    }
    AccountId account(size_t i) const
    {
        return AccountId { args[i] };
    }

private:
    std::span<const std::string> args;
};

using Parser = std::function<Command(const Args&)>;

// The parsers below throw Error on malformed arguments, parse_invocation
// converts it back.
template <typename T>
T value_of(Result<T>&& r)
{
    return std::move(r).value_throw();
}

const std::map<std::string_view, std::pair<size_t, Parser>> parsers {
    { "create", { 0, [](const Args&) -> Command {
                     return command::Create {};
                 } } },
    { "set-metadata", { 3, [](const Args& a) -> Command {
                           return command::SetMetadata { value_of(a.asset_id(0)), value_of(a.bytes(1)), value_of(a.bytes(2)) };
                       } } },
    { "mint", { 3, [](const Args& a) -> Command {
                   return command::Mint { value_of(a.asset_id(0)), value_of(a.amount(1)), a.account(2) };
               } } },
    { "burn", { 2, [](const Args& a) -> Command {
                   return command::Burn { value_of(a.asset_id(0)), value_of(a.amount(1)) };
               } } },
    { "transfer", { 3, [](const Args& a) -> Command {
                       return command::Transfer { value_of(a.asset_id(0)), value_of(a.amount(1)), a.account(2) };
                   } } },
    { "asset", { 1, [](const Args& a) -> Command {
                    return command::Asset { value_of(a.asset_id(0)) };
                } } },
    { "metadata", { 1, [](const Args& a) -> Command {
                       return command::Metadata { value_of(a.asset_id(0)) };
                   } } },
    { "balance", { 2, [](const Args& a) -> Command {
                      return command::Balance { value_of(a.asset_id(0)), a.account(1) };
                  } } },
    { "nonce", { 0, [](const Args&) -> Command {
                    return command::Nonce {};
                } } },
    { "unique-mint", { 2, [](const Args& a) -> Command {
                          return command::UniqueMint { value_of(a.bytes(0)), value_of(a.amount(1)) };
                      } } },
    { "unique-burn", { 2, [](const Args& a) -> Command {
                          return command::UniqueBurn { value_of(a.asset_id(0)), value_of(a.amount(1)) };
                      } } },
    { "unique-transfer", { 3, [](const Args& a) -> Command {
                              return command::UniqueTransfer { value_of(a.asset_id(0)), value_of(a.amount(1)), a.account(2) };
                          } } },
    { "unique-asset", { 1, [](const Args& a) -> Command {
                           return command::UniqueAsset { value_of(a.asset_id(0)) };
                       } } },
    { "unique-balance", { 2, [](const Args& a) -> Command {
                             return command::UniqueBalance { value_of(a.asset_id(0)), a.account(1) };
                         } } },
    { "unique-nonce", { 0, [](const Args&) -> Command {
                           return command::UniqueNonce {};
                       } } },
};
}

std::vector<std::string> tokenize(std::string_view line)
{
    std::vector<std::string> out;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
            ++i;
        if (i == line.size() || line[i] == '#')
            break;
        auto begin { i };
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])))
            ++i;
        out.emplace_back(line.substr(begin, i - begin));
    }
    return out;
}

Result<Bytes> parse_bytes(std::string_view s)
{
    if (s.starts_with("0x")) {
        Bytes out;
        if (!parse_hex(s.substr(2), out))
            return Error(EINV_HEX);
        return out;
    }
    return Bytes(s.begin(), s.end());
}

Result<Invocation> parse_invocation(const std::vector<std::string>& tokens)
{
    std::span<const std::string> rest { tokens };
    std::optional<AccountId> caller;
    if (!rest.empty() && rest[0].starts_with("@")) {
        if (rest[0].size() == 1)
            return Error(EINV_ARGS);
        caller = AccountId { rest[0].substr(1) };
        rest = rest.subspan(1);
    }
    if (rest.empty())
        return Error(EINV_ARGS);

    auto iter { parsers.find(rest[0]) };
    if (iter == parsers.end())
        return Error(EUNKNOWNCMD);
    auto& [nargs, parser] { iter->second };
    Args args { rest.subspan(1) };
    if (args.size() != nargs)
        return Error(EINV_ARGS);
    try {
        return Invocation { std::move(caller), parser(args) };
    } catch (Error e) {
        return e;
    }
}
}
