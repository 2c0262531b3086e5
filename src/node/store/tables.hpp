#pragma once
#include "general/reader.hpp"
#include "general/writer.hpp"
#include "kv_store.hpp"
#include <string>
#include <string_view>

// Typed views on a KVStore. A key is the table prefix, a zero byte and
// the serialized key parts. Values are serialized records which must be
// constructible from a Reader.
namespace store {

template <typename... Keys>
[[nodiscard]] Bytes make_key(std::string_view prefix, const Keys&... keys)
{
    return serialize(prefix, uint8_t(0), keys...);
}

template <typename Value>
[[nodiscard]] std::optional<Value> decode(const std::optional<Bytes>& b)
{
    if (!b)
        return {};
    return parse_exact<Value>(*b);
}

// single value cell
template <typename Value>
class StorageValue {
public:
    StorageValue(KVStore& kv, std::string prefix)
        : kv(kv)
        , key(make_key(prefix))
    {
    }
    [[nodiscard]] std::optional<Value> get() const
    {
        return decode<Value>(kv.get(key));
    }
    void set(const Value& v)
    {
        kv.put(key, serialize(v));
    }

private:
    KVStore& kv;
    Bytes key;
};

template <typename Value, typename... Keys>
class StorageMapBase {
public:
    StorageMapBase(KVStore& kv, std::string prefix)
        : kv(kv)
        , prefix(std::move(prefix))
    {
    }
    [[nodiscard]] std::optional<Value> get(const Keys&... keys) const
    {
        return decode<Value>(kv.get(make_key(prefix, keys...)));
    }
    [[nodiscard]] bool contains(const Keys&... keys) const
    {
        return kv.get(make_key(prefix, keys...)).has_value();
    }
    void insert(const Keys&... keys, const Value& v)
    {
        kv.put(make_key(prefix, keys...), serialize(v));
    }

    // f receives the current entry as std::optional<Value>&,
    // an engaged optional is written back
    template <typename F>
    void mutate(const Keys&... keys, F&& f)
    {
        auto v { get(keys...) };
        f(v);
        if (v)
            insert(keys..., *v);
    }

    // f returns a Result, the entry is written back only on success
    template <typename F>
    auto try_mutate(const Keys&... keys, F&& f)
    {
        auto v { get(keys...) };
        auto res { f(v) };
        if (res.has_value() && v)
            insert(keys..., *v);
        return res;
    }

private:
    KVStore& kv;
    std::string prefix;
};

template <typename Key, typename Value>
using StorageMap = StorageMapBase<Value, Key>;

template <typename Key1, typename Key2, typename Value>
using StorageDoubleMap = StorageMapBase<Value, Key1, Key2>;
}
