#include "kmslocal/persistence/sqlite/SqliteAdapterFactory.hpp"

#include "../StoreAdapterBase.hpp"
#include "kmslocal/codec/CodecErrors.hpp"
#include "kmslocal/persistence/PersistenceErrors.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include <sqlite3.h>

namespace kmslocal::persistence::sqlite
{
namespace
{

using kmslocal::codec::CodecError;
using kmslocal::core::KeySnapshot;
using kmslocal::core::KeyStoreError;
using kmslocal::core::KeyStoreResult;

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "sqlite: exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw IoError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw IoError(sqliteErr(raw, "sqlite: open failed"));
    }
    return db;
}

// Prepare failures while loading mean the file is not one of ours (no such table, not a database).
[[nodiscard]] SqliteStmtPtr prepareForLoad(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw CodecError(sqliteErr(db, "sqlite: unexpected schema"));
    }
    return stmt;
}

[[nodiscard]] SqliteStmtPtr prepareForSave(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw IoError(sqliteErr(db, "sqlite: prepare failed"));
    }
    return stmt;
}

// SQLite integers are signed 64-bit; u64 values travel through them bit for bit.
[[nodiscard]] sqlite3_int64 toSqlInt(std::uint64_t v) noexcept
{
    return static_cast<sqlite3_int64>(v);
}

[[nodiscard]] std::uint64_t fromSqlInt(sqlite3_int64 v) noexcept
{
    return static_cast<std::uint64_t>(v);
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS kms_meta ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " count INTEGER NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS kms_entries ("
             " version INTEGER PRIMARY KEY,"
             " created INTEGER NOT NULL,"
             " data BLOB NOT NULL"
             ");");
}

// Rolls back unless commit() succeeded.
class ImmediateTransaction final
{
public:
    explicit ImmediateTransaction(sqlite3* db) : m_db{ db }
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }

    ImmediateTransaction(const ImmediateTransaction&) = delete;
    ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;
    ImmediateTransaction(ImmediateTransaction&&) = delete;
    ImmediateTransaction& operator=(ImmediateTransaction&&) = delete;

    ~ImmediateTransaction()
    {
        if (!m_committed)
        {
            (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        exec(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db{ nullptr };
    bool m_committed{ false };
};

void writeSnapshot(sqlite3* db, const KeySnapshot& snapshot)
{
    ensureSchema(db);
    ImmediateTransaction tx{ db };

    exec(db, "DELETE FROM kms_entries;");

    auto meta = prepareForSave(db, "INSERT INTO kms_meta(id, count) VALUES (1, ?)"
                                   " ON CONFLICT(id) DO UPDATE SET count=excluded.count;");
    if (sqlite3_bind_int64(meta.get(), 1, toSqlInt(snapshot.count)) != SQLITE_OK)
    {
        throw IoError(sqliteErr(db, "sqlite: bind count failed"));
    }
    if (sqlite3_step(meta.get()) != SQLITE_DONE)
    {
        throw IoError(sqliteErr(db, "sqlite: upsert meta failed"));
    }

    auto insert = prepareForSave(db, "INSERT INTO kms_entries(version, created, data) VALUES (?, ?, ?);");
    for (const auto& [version, record] : snapshot.entries)
    {
        if (sqlite3_reset(insert.get()) != SQLITE_OK || sqlite3_clear_bindings(insert.get()) != SQLITE_OK)
        {
            throw IoError(sqliteErr(db, "sqlite: reset failed"));
        }
        if (sqlite3_bind_int64(insert.get(), 1, toSqlInt(version)) != SQLITE_OK ||
            sqlite3_bind_int64(insert.get(), 2, toSqlInt(record.createdAtUnixSeconds)) != SQLITE_OK)
        {
            throw IoError(sqliteErr(db, "sqlite: bind entry failed"));
        }
        // zeroblob keeps an empty payload NOT NULL.
        const int dataRc = record.data.empty()
                               ? sqlite3_bind_zeroblob(insert.get(), 3, 0)
                               : sqlite3_bind_blob64(insert.get(), 3, record.data.data(),
                                                     static_cast<sqlite3_uint64>(record.data.size()), SQLITE_STATIC);
        if (dataRc != SQLITE_OK)
        {
            throw IoError(sqliteErr(db, "sqlite: bind data failed"));
        }
        if (sqlite3_step(insert.get()) != SQLITE_DONE)
        {
            throw IoError(sqliteErr(db, "sqlite: insert entry failed"));
        }
    }

    tx.commit();
}

[[nodiscard]] KeySnapshot readSnapshot(sqlite3* db)
{
    KeySnapshot out{};

    auto meta = prepareForLoad(db, "SELECT count FROM kms_meta WHERE id = 1;");
    const int metaRc = sqlite3_step(meta.get());
    if (metaRc != SQLITE_ROW)
    {
        throw CodecError(sqliteErr(db, "sqlite: missing kms_meta row"));
    }
    if (sqlite3_column_type(meta.get(), 0) != SQLITE_INTEGER)
    {
        throw CodecError("sqlite: kms_meta.count is not an integer");
    }
    out.count = fromSqlInt(sqlite3_column_int64(meta.get(), 0));

    auto rows = prepareForLoad(db, "SELECT version, created, data FROM kms_entries ORDER BY version;");
    int stepRc = SQLITE_ROW;
    while ((stepRc = sqlite3_step(rows.get())) == SQLITE_ROW)
    {
        if (sqlite3_column_type(rows.get(), 0) != SQLITE_INTEGER ||
            sqlite3_column_type(rows.get(), 1) != SQLITE_INTEGER || sqlite3_column_type(rows.get(), 2) != SQLITE_BLOB)
        {
            throw CodecError("sqlite: invalid kms_entries row");
        }

        const kmslocal::core::Version version{ fromSqlInt(sqlite3_column_int64(rows.get(), 0)) };
        if (version == 0U)
        {
            throw CodecError("sqlite: version 0 is never issued");
        }

        kmslocal::core::KeyRecord record{};
        record.createdAtUnixSeconds = fromSqlInt(sqlite3_column_int64(rows.get(), 1));
        const void* dataPtr = sqlite3_column_blob(rows.get(), 2);
        const int dataBytes = sqlite3_column_bytes(rows.get(), 2);
        if (dataBytes < 0 || (dataBytes > 0 && dataPtr == nullptr))
        {
            throw CodecError("sqlite: invalid kms_entries row");
        }
        record.data.resize(static_cast<std::size_t>(dataBytes));
        if (dataBytes > 0)
        {
            std::memcpy(record.data.data(), dataPtr, static_cast<std::size_t>(dataBytes));
        }

        if (!out.entries.emplace(version, std::move(record)).second)
        {
            throw CodecError("sqlite: duplicate version");
        }
    }
    if (stepRc != SQLITE_DONE)
    {
        throw IoError(sqliteErr(db, "sqlite: select entries failed"));
    }
    return out;
}

class SqliteAdapter final : public kmslocal::persistence::detail::StoreAdapterBase
{
public:
    SqliteAdapter(std::filesystem::path dbPath, KeySnapshot snapshot)
        : StoreAdapterBase{ AdapterKind::Sqlite, std::move(dbPath), std::move(snapshot) }
    {
    }

    [[nodiscard]] KeyStoreResult<std::monostate> save() override
    {
        auto snapshotRes{ store().snapshot() };
        if (std::holds_alternative<KeyStoreError>(snapshotRes))
        {
            return std::get<KeyStoreError>(snapshotRes);
        }

        try
        {
            auto db = openDb(path(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
            writeSnapshot(db.get(), std::get<KeySnapshot>(snapshotRes));
        }
        catch (const IoError&)
        {
            return KeyStoreError::Io;
        }
        return std::monostate{};
    }
};

} // namespace

KeyStoreResult<std::unique_ptr<kmslocal::persistence::IPersistenceAdapter>>
loadSqliteAdapter(const std::filesystem::path& dbPath)
{
    KeySnapshot snapshot{};
    try
    {
        auto db = openDb(dbPath, SQLITE_OPEN_READONLY);
        snapshot = readSnapshot(db.get());
    }
    catch (const IoError&)
    {
        return KeyStoreError::Io;
    }
    catch (const CodecError&)
    {
        return KeyStoreError::Codec;
    }
    return std::unique_ptr<kmslocal::persistence::IPersistenceAdapter>{ std::make_unique<SqliteAdapter>(
        dbPath, std::move(snapshot)) };
}

std::unique_ptr<kmslocal::persistence::IPersistenceAdapter> makeSqliteAdapter(const std::filesystem::path& dbPath,
                                                                           KeySnapshot snapshot)
{
    return std::make_unique<SqliteAdapter>(dbPath, std::move(snapshot));
}

} // namespace kmslocal::persistence::sqlite
