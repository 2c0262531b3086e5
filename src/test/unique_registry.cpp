#include "helpers.hpp"
#include "ledger/unique_registry.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include <iostream>
using namespace std;

struct Fixture {
    store::MemoryStore kv;
    RecordingEventSink sink;
    unique::Registry registry { kv, sink };
};

const Bytes meta { 'm', 'e', 't', 'a' };
const Bytes meta2 { 'm', 'e', 't', 'a', '2' };

void test_mint()
{
    Fixture f;
    auto& r { f.registry };
    auto id { r.mint(alice, meta, 10) };
    assert(id.value() == AssetId { 0 });
    assert(r.asset(*id) == UniqueAssetDetails(alice, meta, 10));
    assert(r.balance(*id, alice) == Funds_uint128(10));
    auto& e { last_event<unique::event::Created>(f.sink.uniqueEvents) };
    assert(e.creator == alice);
    assert(e.asset_id == *id);
    assert(r.nonce() == AssetId { 1 });
}

void test_mint_zero_supply()
{
    Fixture f;
    auto& r { f.registry };
    auto entries { f.kv.entries() };
    auto id { r.mint(alice, meta, 0) };
    assert(!id && id.error().code == ENOSUPPLY);
    // no id consumed
    assert(r.nonce() == AssetId { 0 });
    assert(f.kv.entries() == entries);
    assert(f.sink.size() == 0);
}

void test_scenario()
{
    Fixture f;
    auto& r { f.registry };
    auto id0 { r.mint(carol, meta, 10).value() };
    auto id1 { r.mint(dave, meta2, 5).value() };
    assert(id0 == AssetId { 0 });
    assert(id1 == AssetId { 1 });

    // both act on asset 1 only
    assert(r.burn(dave, id1, 2).has_value());
    assert(r.balance(id1, dave) == Funds_uint128(3));
    assert(r.asset(id1)->supply == Funds_uint128(3));
    {
        auto& e { last_event<unique::event::Burned>(f.sink.uniqueEvents) };
        assert(e.asset_id == id1);
        assert(e.owner == dave);
        assert(e.total_supply == Funds_uint128(3));
    }

    assert(r.transfer(dave, id1, 1, carol).has_value());
    assert(r.balance(id1, dave) == Funds_uint128(2));
    assert(r.balance(id1, carol) == Funds_uint128(1));
    {
        auto& e { last_event<unique::event::Transferred>(f.sink.uniqueEvents) };
        assert(e.asset_id == id1);
        assert(e.amount == Funds_uint128(1));
    }

    // asset 0 untouched
    assert(r.balance(id0, carol) == Funds_uint128(10));
    assert(r.balance(id0, dave) == Funds_uint128::zero());
    assert(r.asset(id0)->supply == Funds_uint128(10));
}

void test_not_owned()
{
    Fixture f;
    auto& r { f.registry };
    auto id { r.mint(carol, meta, 10).value() };
    auto entries { f.kv.entries() };
    auto nEvents { f.sink.size() };

    auto b { r.burn(dave, id, 1) };
    assert(!b && b.error().code == ENOTOWNED);
    auto t { r.transfer(dave, id, 1, carol) };
    assert(!t && t.error().code == ENOTOWNED);

    AssetId unknown { 5 };
    assert(r.burn(carol, unknown, 1).error().code == EUNKNOWN);
    assert(r.transfer(carol, unknown, 1, dave).error().code == EUNKNOWN);

    assert(f.kv.entries() == entries);
    assert(f.sink.size() == nEvents);
}

void test_clamping()
{
    Fixture f;
    auto& r { f.registry };
    auto id { r.mint(carol, meta, 10).value() };

    assert(r.transfer(carol, id, 15, dave).has_value());
    assert(r.balance(id, carol) == Funds_uint128::zero());
    assert(r.balance(id, dave) == Funds_uint128(10));
    assert(last_event<unique::event::Transferred>(f.sink.uniqueEvents).amount == Funds_uint128(10));

    // holding nothing now
    assert(r.transfer(carol, id, 1, dave).error().code == ENOTOWNED);

    assert(r.burn(dave, id, 100).has_value());
    assert(r.balance(id, dave) == Funds_uint128::zero());
    assert(r.asset(id)->supply == Funds_uint128::zero());
    assert(r.burn(dave, id, 1).error().code == ENOTOWNED);
}

void test_id_overflow()
{
    Fixture f;
    auto& r { f.registry };
    store::StorageValue<AssetId>(f.kv, "unique.Nonce").set(AssetId::max());
    auto entries { f.kv.entries() };
    auto id { r.mint(alice, meta, 1) };
    assert(!id && id.error().code == ETYPEOVERFLOW);
    assert(r.nonce() == AssetId::max());
    assert(f.kv.entries() == entries);
    assert(f.sink.size() == 0);
}

void test_sellable()
{
    Fixture f;
    auto& r { f.registry };
    auto id { r.mint(carol, meta, 10).value() };
    ledger::Sellable& s { r };

    assert(s.amount_owned(id, carol) == Funds_uint128(10));
    assert(s.amount_owned(id, dave) == Funds_uint128::zero());

    assert(s.transfer(id, carol, dave, 4) == Funds_uint128(4));
    assert(s.amount_owned(id, carol) == Funds_uint128(6));
    assert(s.amount_owned(id, dave) == Funds_uint128(4));
    assert(last_event<unique::event::Transferred>(f.sink.uniqueEvents).amount == Funds_uint128(4));

    // clamps to the held amount
    assert(s.transfer(id, dave, carol, 9) == Funds_uint128(4));
    assert(s.amount_owned(id, carol) == Funds_uint128(10));

    // nothing held or unknown asset, nothing moved and no event
    auto nEvents { f.sink.size() };
    assert(s.transfer(id, dave, carol, 1) == Funds_uint128::zero());
    assert(s.transfer(AssetId { 3 }, carol, dave, 1) == Funds_uint128::zero());
    assert(f.sink.size() == nEvents);

    // a zero amount from a positive balance moves nothing and emits nothing
    auto entries { f.kv.entries() };
    assert(s.transfer(id, carol, dave, 0) == Funds_uint128::zero());
    assert(f.sink.size() == nEvents);
    assert(f.kv.entries() == entries);
    assert(s.amount_owned(id, carol) == Funds_uint128(10));
}

void check_empty_metadata(store::KVStore& kv)
{
    RecordingEventSink sink;
    unique::Registry r(kv, sink);
    auto id { r.mint(alice, {}, 1) };
    assert(id.has_value());
    assert(r.asset(*id) == UniqueAssetDetails(alice, {}, 1));
    assert(r.balance(*id, alice) == Funds_uint128(1));
}

void test_empty_metadata()
{
    {
        store::MemoryStore kv;
        check_empty_metadata(kv);
    }
    {
        TempDBPath tmp("unique_empty_test");
        store::SQLiteStore kv(tmp.path);
        check_empty_metadata(kv);
    }
}

void test_shared_store()
{
    // both registries keep their own tables in one store
    store::MemoryStore kv;
    RecordingEventSink sink;
    unique::Registry u(kv, sink);
    auto id { u.mint(alice, meta, 3).value() };
    assert(id == AssetId { 0 });
    store::StorageValue<AssetId> fungibleNonce(kv, "fungible.Nonce");
    assert(!fungibleNonce.get());
    assert(sink.fungibleEvents.empty());
    assert(sink.uniqueEvents.size() == 1);
}

void test_sqlite_backend()
{
    TempDBPath tmp("unique_test");
    {
        store::SQLiteStore kv(tmp.path);
        RecordingEventSink sink;
        unique::Registry r(kv, sink);
        assert(r.mint(carol, meta, 10).value() == AssetId { 0 });
        assert(r.transfer(carol, AssetId { 0 }, 3, dave).has_value());
        assert(r.burn(dave, AssetId { 0 }, 5).has_value());
        assert(r.burn(alice, AssetId { 0 }, 5).error().code == ENOTOWNED);
    }
    {
        store::SQLiteStore kv(tmp.path);
        RecordingEventSink sink;
        unique::Registry r(kv, sink);
        assert(r.nonce() == AssetId { 1 });
        assert(r.asset(AssetId { 0 }) == UniqueAssetDetails(carol, meta, 7));
        assert(r.balance(AssetId { 0 }, carol) == Funds_uint128(7));
        assert(r.balance(AssetId { 0 }, dave) == Funds_uint128::zero());
    }
}

int main()
{
    test_mint();
    test_mint_zero_supply();
    test_scenario();
    test_not_owned();
    test_clamping();
    test_id_overflow();
    test_sellable();
    test_empty_metadata();
    test_shared_store();
    test_sqlite_backend();
    cout << "unique registry tests passed" << endl;
    return 0;
}
