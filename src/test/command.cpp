#include "cli/command.hpp"
#include "cli/executor.hpp"
#include "store/memory_store.hpp"
#include <cassert>
#include <iostream>
using namespace std;

using Tokens = std::vector<std::string>;

void test_tokenize()
{
    assert(cli::tokenize("").empty());
    assert(cli::tokenize("   \t ").empty());
    assert(cli::tokenize("# comment").empty());
    assert(cli::tokenize("  @alice  mint 0 100 bob") == Tokens({ "@alice", "mint", "0", "100", "bob" }));
    assert(cli::tokenize("nonce # trailing") == Tokens({ "nonce" }));
}

void test_parse()
{
    {
        auto inv { cli::parse_invocation({ "@alice", "mint", "0", "100", "bob" }) };
        assert(inv.has_value());
        assert(inv->caller == AccountId { "alice" });
        auto& m { std::get<cli::command::Mint>(inv->command) };
        assert(m.assetId == AssetId { 0 });
        assert(m.amount == Funds_uint128(100));
        assert(m.to == AccountId { "bob" });
    }
    {
        auto inv { cli::parse_invocation({ "balance", "3", "carol" }) };
        assert(inv.has_value());
        assert(!inv->caller);
        assert(std::holds_alternative<cli::command::Balance>(inv->command));
    }
    {
        auto inv { cli::parse_invocation({ "set-metadata", "1", "Token", "0x544f4b" }) };
        auto& s { std::get<cli::command::SetMetadata>(inv.value().command) };
        assert(s.name == Bytes({ 'T', 'o', 'k', 'e', 'n' }));
        assert(s.symbol == Bytes({ 'T', 'O', 'K' }));
    }
    {
        auto inv { cli::parse_invocation({ "unique-mint", "meta", "340282366920938463463374607431768211455" }) };
        auto& m { std::get<cli::command::UniqueMint>(inv.value().command) };
        assert(m.supply == Funds_uint128::max());
    }

    auto error_of = [](Tokens t) {
        auto inv { cli::parse_invocation(t) };
        assert(!inv.has_value());
        return inv.error().code;
    };
    assert(error_of({}) == EINV_ARGS);
    assert(error_of({ "@alice" }) == EINV_ARGS);
    assert(error_of({ "@", "create" }) == EINV_ARGS);
    assert(error_of({ "frobnicate" }) == EUNKNOWNCMD);
    assert(error_of({ "mint", "0", "100" }) == EINV_ARGS);
    assert(error_of({ "create", "extra" }) == EINV_ARGS);
    assert(error_of({ "mint", "x", "100", "bob" }) == EINV_NUMBER);
    assert(error_of({ "burn", "0", "-5" }) == EINV_NUMBER);
    assert(error_of({ "burn", "0", "340282366920938463463374607431768211456" }) == EINV_NUMBER);
    assert(error_of({ "set-metadata", "0", "0xabc", "T" }) == EINV_HEX);
}

void test_executor()
{
    store::MemoryStore kv;
    cli::Executor e(kv, AccountId { "alice" });

    auto created { e.run(Tokens { "create" }) };
    assert(created["code"] == 0);
    assert(created["data"] == "0");
    assert(created["events"].size() == 1);
    assert(created["events"][0]["event"] == "Created");
    assert(created["events"][0]["registry"] == "fungible");
    assert(created["events"][0]["owner"] == "alice");

    assert(e.run(Tokens { "mint", "0", "100", "alice" })["code"] == 0);
    auto transferred { e.run(Tokens { "transfer", "0", "40", "bob" }) };
    assert(transferred["events"][0]["amount"] == "40");
    assert(e.run(Tokens { "balance", "0", "bob" })["data"] == "40");

    // explicit caller overrides the default one
    auto denied { e.run(Tokens { "@bob", "mint", "0", "1", "bob" }) };
    assert(denied["code"] == ENOPERMISSION);
    assert(denied["name"] == "ENOPERMISSION");
    assert(!denied.contains("events"));

    auto asset { e.run(Tokens { "asset", "0" }) };
    assert(asset["data"]["owner"] == "alice");
    assert(asset["data"]["supply"] == "100");
    assert(e.run(Tokens { "asset", "9" })["code"] == EUNKNOWN);
    assert(e.run(Tokens { "metadata", "0" })["data"].is_null());
    assert(e.run(Tokens { "set-metadata", "0", "Token", "TOK" })["code"] == 0);
    assert(e.run(Tokens { "metadata", "0" })["data"]["symbol"] == "544f4b");
    assert(e.run(Tokens { "nonce" })["data"] == "1");

    auto minted { e.run(Tokens { "@carol", "unique-mint", "0x01", "10" }) };
    assert(minted["data"] == "0");
    assert(minted["events"][0]["registry"] == "unique");
    assert(minted["events"][0]["creator"] == "carol");
    assert(e.run(Tokens { "unique-mint", "meta", "0" })["code"] == ENOSUPPLY);
    assert(e.run(Tokens { "unique-burn", "0", "1" })["code"] == ENOTOWNED);
    assert(e.run(Tokens { "@carol", "unique-transfer", "0", "4", "dave" })["code"] == 0);
    assert(e.run(Tokens { "unique-balance", "0", "dave" })["data"] == "4");
    assert(e.run(Tokens { "unique-asset", "0" })["data"]["metadata"] == "01");
    assert(e.run(Tokens { "unique-nonce" })["data"] == "1");

    assert(e.run(Tokens { "bogus" })["code"] == EUNKNOWNCMD);
}

void test_missing_caller()
{
    store::MemoryStore kv;
    cli::Executor e(kv, std::nullopt);
    assert(e.run(Tokens { "create" })["code"] == ENOCALLER);
    // queries need no caller
    assert(e.run(Tokens { "nonce" })["code"] == 0);
    assert(kv.size() == 0);
}

int main()
{
    test_tokenize();
    test_parse();
    test_executor();
    test_missing_caller();
    cout << "command tests passed" << endl;
    return 0;
}
