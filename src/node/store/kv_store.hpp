#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace store {
using Bytes = std::vector<uint8_t>;

class StoreTransaction;

// Persistent key-value storage backing the registries. Writes made inside
// a StoreTransaction are discarded unless the transaction is committed.
class KVStore {
public:
    virtual ~KVStore() = default;
    [[nodiscard]] virtual std::optional<Bytes> get(std::span<const uint8_t> key) const = 0;
    virtual void put(std::span<const uint8_t> key, std::span<const uint8_t> value) = 0;

    [[nodiscard]] StoreTransaction transaction();
    bool in_transaction() const { return transactionOpen; }

protected:
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;

private:
    friend class StoreTransaction;
    bool transactionOpen { false };
};

class StoreTransaction {
public:
    void commit();
    ~StoreTransaction();
    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction(StoreTransaction&& other)
        : parent(other.parent)
    {
        other.parent = nullptr;
    }

private:
    friend KVStore;
    StoreTransaction(KVStore& parent)
        : parent(&parent)
    {
    }
    KVStore* parent;
};
}
