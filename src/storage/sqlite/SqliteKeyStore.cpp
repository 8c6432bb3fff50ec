#include "itemcrypt/storage/sqlite/SqliteKeyStoreFactory.hpp"

#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include "itemcrypt/storage/StorageErrors.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <sqlite3.h>

namespace itemcrypt::storage::sqlite
{
namespace
{

using itemcrypt::core::EncryptionKey;

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
        std::string msg = sqliteErr(db, "keystore: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw KeyStoreError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw KeyStoreError(sqliteErr(raw, "keystore: sqlite3_open_v2 failed"));
    }
    return db;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS encryption_keys ("
             " tag TEXT PRIMARY KEY,"
             " account TEXT NULL,"
             " key_data BLOB NOT NULL,"
             " created_at INTEGER NOT NULL"
             ");");
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw KeyStoreError(sqliteErr(db, "keystore: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text, const char* what)
{
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw KeyStoreError(std::string{ what } + " too long");
    }
    // A null pointer would bind SQL NULL instead of an empty string.
    const char* data = text.empty() ? "" : text.data();
    if (sqlite3_bind_text(stmt, index, data, static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw KeyStoreError(sqliteErr(db, what));
    }
}

// Rolls back unless commit() ran.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db) : m_db{ db }
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    ~Transaction()
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
    sqlite3* m_db;
    bool m_committed{ false };
};

class SqliteKeyStore final : public itemcrypt::storage::IKeyStore
{
public:
    explicit SqliteKeyStore(const std::filesystem::path& dbPath) : m_db{ openDb(dbPath) }
    {
        ensureSchema(m_db.get());
    }

    [[nodiscard]] std::optional<EncryptionKey> key(std::string_view tag) const override
    {
        SqliteStmtPtr stmt{ prepare(m_db.get(), "SELECT account, key_data FROM encryption_keys WHERE tag = ?;") };
        bindText(m_db.get(), stmt.get(), 1, tag, "keystore: bind tag failed");

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        if (stepRc != SQLITE_ROW)
        {
            throw KeyStoreError(sqliteErr(m_db.get(), "keystore: select key failed"));
        }

        std::optional<std::string> account{};
        if (sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL)
        {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
            const int textBytes = sqlite3_column_bytes(stmt.get(), 0);
            if (text != nullptr && textBytes >= 0)
            {
                account = std::string{ text, static_cast<std::size_t>(textBytes) };
            }
        }

        const void* blob = sqlite3_column_blob(stmt.get(), 1);
        const int blobBytes = sqlite3_column_bytes(stmt.get(), 1);
        if (blob == nullptr || blobBytes <= 0)
        {
            throw itemcrypt::core::MalformedData{ "keystore: empty key_data" };
        }

        // Copy out of SQLite's buffer so the raw key can be wiped.
        const itemcrypt::security::SecureBuffer raw{ itemcrypt::security::secureBufferFrom(std::span<const std::uint8_t>{
            static_cast<const std::uint8_t*>(blob), static_cast<std::size_t>(blobBytes) }) };
        return EncryptionKey::fromRawData(raw, std::move(account));
    }

    EncryptionKey setKey(const EncryptionKey& newKey, std::string_view tag) override
    {
        const itemcrypt::security::SecureBuffer raw{ newKey.rawData() };
        if (raw.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw KeyStoreError("keystore: key too large");
        }
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

        Transaction tx{ m_db.get() };
        {
            SqliteStmtPtr del{ prepare(m_db.get(), "DELETE FROM encryption_keys WHERE tag = ?;") };
            bindText(m_db.get(), del.get(), 1, tag, "keystore: bind tag failed");
            if (sqlite3_step(del.get()) != SQLITE_DONE)
            {
                throw KeyStoreError(sqliteErr(m_db.get(), "keystore: delete previous key failed"));
            }
        }
        {
            SqliteStmtPtr ins{ prepare(m_db.get(), "INSERT INTO encryption_keys(tag, account, key_data, created_at)"
                                                   " VALUES (?, ?, ?, ?);") };
            bindText(m_db.get(), ins.get(), 1, tag, "keystore: bind tag failed");
            if (newKey.context())
            {
                bindText(m_db.get(), ins.get(), 2, *newKey.context(), "keystore: bind account failed");
            }
            else if (sqlite3_bind_null(ins.get(), 2) != SQLITE_OK)
            {
                throw KeyStoreError(sqliteErr(m_db.get(), "keystore: bind account failed"));
            }
            if (sqlite3_bind_blob(ins.get(), 3, raw.data(), static_cast<int>(raw.size()), SQLITE_STATIC) != SQLITE_OK)
            {
                throw KeyStoreError(sqliteErr(m_db.get(), "keystore: bind key_data failed"));
            }
            if (sqlite3_bind_int64(ins.get(), 4, static_cast<sqlite3_int64>(now)) != SQLITE_OK)
            {
                throw KeyStoreError(sqliteErr(m_db.get(), "keystore: bind created_at failed"));
            }
            if (sqlite3_step(ins.get()) != SQLITE_DONE)
            {
                throw KeyStoreError(sqliteErr(m_db.get(), "keystore: insert key failed"));
            }
        }
        tx.commit();

        std::optional<EncryptionKey> stored{ key(tag) };
        if (!stored)
        {
            throw KeyStoreError("keystore: key missing after write");
        }
        return std::move(*stored);
    }

    std::optional<EncryptionKey> deleteKey(std::string_view tag) override
    {
        std::optional<EncryptionKey> existing{};
        try
        {
            existing = key(tag);
        }
        catch (const itemcrypt::core::MalformedData&)
        {
            // Unreadable entries are still removed; there is just nothing to hand back.
            existing.reset();
        }

        SqliteStmtPtr del{ prepare(m_db.get(), "DELETE FROM encryption_keys WHERE tag = ?;") };
        bindText(m_db.get(), del.get(), 1, tag, "keystore: bind tag failed");
        if (sqlite3_step(del.get()) != SQLITE_DONE)
        {
            throw KeyStoreError(sqliteErr(m_db.get(), "keystore: delete key failed"));
        }
        return existing;
    }

private:
    SqliteDbPtr m_db;
};

} // namespace

[[nodiscard]] std::unique_ptr<itemcrypt::storage::IKeyStore> makeSqliteKeyStore(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteKeyStore>(dbPath);
}

} // namespace itemcrypt::storage::sqlite
