#pragma once
#include "kv_store.hpp"
#include <map>

namespace store {

// Volatile backend, rollback replays an undo journal of the values
// overwritten since the transaction began.
class MemoryStore : public KVStore {
public:
    [[nodiscard]] std::optional<Bytes> get(std::span<const uint8_t> key) const override;
    void put(std::span<const uint8_t> key, std::span<const uint8_t> value) override;

    const std::map<Bytes, Bytes>& entries() const { return data; }
    size_t size() const { return data.size(); }

protected:
    void begin() override;
    void commit() override;
    void rollback() noexcept override;

private:
    std::map<Bytes, Bytes> data;
    std::map<Bytes, std::optional<Bytes>> originals;
};
}
