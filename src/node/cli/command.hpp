#pragma once
#include "general/result.hpp"
#include "ledger/asset.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cli {
namespace command {
    // fungible registry
    struct Create {
    };
    struct SetMetadata {
        AssetId assetId;
        Bytes name;
        Bytes symbol;
    };
    struct Mint {
        AssetId assetId;
        Funds_uint128 amount;
        AccountId to;
    };
    struct Burn {
        AssetId assetId;
        Funds_uint128 amount;
    };
    struct Transfer {
        AssetId assetId;
        Funds_uint128 amount;
        AccountId to;
    };
    struct Asset {
        AssetId assetId;
    };
    struct Metadata {
        AssetId assetId;
    };
    struct Balance {
        AssetId assetId;
        AccountId account;
    };
    struct Nonce {
    };

    // unique registry
    struct UniqueMint {
        Bytes metadata;
        Funds_uint128 supply;
    };
    struct UniqueBurn {
        AssetId assetId;
        Funds_uint128 amount;
    };
    struct UniqueTransfer {
        AssetId assetId;
        Funds_uint128 amount;
        AccountId to;
    };
    struct UniqueAsset {
        AssetId assetId;
    };
    struct UniqueBalance {
        AssetId assetId;
        AccountId account;
    };
    struct UniqueNonce {
    };
}

using Command = std::variant<command::Create, command::SetMetadata,
    command::Mint, command::Burn, command::Transfer, command::Asset,
    command::Metadata, command::Balance, command::Nonce, command::UniqueMint,
    command::UniqueBurn, command::UniqueTransfer, command::UniqueAsset,
    command::UniqueBalance, command::UniqueNonce>;

// A command line "[@caller] <command> [args...]" after parsing.
struct Invocation {
    std::optional<AccountId> caller;
    Command command;
};

// splits a script line at whitespace, returns no tokens for blank lines
// and comments
std::vector<std::string> tokenize(std::string_view line);

[[nodiscard]] Result<Invocation> parse_invocation(const std::vector<std::string>& tokens);

// byte string arguments are taken literally unless prefixed with "0x"
[[nodiscard]] Result<Bytes> parse_bytes(std::string_view);
}
