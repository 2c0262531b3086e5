#include "sqlite_store.hpp"
#include "sqlite/sqlite.hpp"
#include <spdlog/spdlog.h>

namespace store {
SQLiteStore::Database::Database(const std::string& path)
    : SQLite::Database([&]() -> auto& {
    spdlog::debug("Opening ledger database \"{}\"", path);
    return path; }(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
{
    exec("CREATE TABLE IF NOT EXISTS `KV` ("
         "`key` BLOB NOT NULL, "
         "`value` BLOB NOT NULL, "
         "PRIMARY KEY(`key`)) "
         "WITHOUT ROWID");
}

SQLiteStore::SQLiteStore(const std::string& path)
    : db(path)
    , fl(path)
    , stmtSelect(db, "SELECT `value` FROM `KV` WHERE `key`=?")
    , stmtUpsert(db, "INSERT OR REPLACE INTO `KV` (`key`, `value`) VALUES (?,?)")
    , stmtGetDBSize(db, "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size();")
{
}

std::optional<Bytes> SQLiteStore::get(std::span<const uint8_t> key) const
{
    return stmtSelect.one(key).process([](const sqlite::Row& r) {
        return r.get_vector(0);
    });
}

void SQLiteStore::put(std::span<const uint8_t> key, std::span<const uint8_t> value)
{
    stmtUpsert.run(key, value);
}

size_t SQLiteStore::byte_size() const
{
    return stmtGetDBSize.one().get<int64_t>(0);
}

void SQLiteStore::begin()
{
    tx.emplace(db);
}

void SQLiteStore::commit()
{
    tx->commit();
    tx.reset();
}

void SQLiteStore::rollback() noexcept
{
    // SQLite::Transaction rolls back unless committed
    tx.reset();
}
}
