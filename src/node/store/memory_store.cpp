#include "memory_store.hpp"

namespace store {
std::optional<Bytes> MemoryStore::get(std::span<const uint8_t> key) const
{
    if (auto iter { data.find(Bytes(key.begin(), key.end())) }; iter != data.end())
        return iter->second;
    return {};
}

void MemoryStore::put(std::span<const uint8_t> key, std::span<const uint8_t> value)
{
    Bytes k(key.begin(), key.end());
    if (in_transaction() && !originals.contains(k)) {
        // only the first write in a transaction records the original
        std::optional<Bytes> original;
        if (auto iter { data.find(k) }; iter != data.end())
            original = iter->second;
        originals.emplace(k, std::move(original));
    }
    data.insert_or_assign(std::move(k), Bytes(value.begin(), value.end()));
}

void MemoryStore::begin()
{
    originals.clear();
}

void MemoryStore::commit()
{
    originals.clear();
}

void MemoryStore::rollback() noexcept
{
    for (auto& [key, original] : originals) {
        if (original)
            data.insert_or_assign(key, std::move(*original));
        else
            data.erase(key);
    }
    originals.clear();
}
}
