#pragma once
#include "SQLiteCpp/Database.h"
#include "SQLiteCpp/Transaction.h"
#include "general/filelock/filelock.hpp"
#include "kv_store.hpp"
#include "sqlite/sqlite_fwd.hpp"
#include <string>

namespace store {

// Durable backend, all keys live in a single table of a SQLite database.
class SQLiteStore : public KVStore {
public:
    SQLiteStore(const std::string& path);
    [[nodiscard]] std::optional<Bytes> get(std::span<const uint8_t> key) const override;
    void put(std::span<const uint8_t> key, std::span<const uint8_t> value) override;
    [[nodiscard]] size_t byte_size() const;

protected:
    void begin() override;
    void commit() override;
    void rollback() noexcept override;

private:
    struct Database : public SQLite::Database {
        Database(const std::string& path);
    } db;
    Filelock fl;
    std::optional<SQLite::Transaction> tx;
    mutable sqlite::Statement stmtSelect;
    sqlite::Statement stmtUpsert;
    mutable sqlite::Statement stmtGetDBSize;
};
}
