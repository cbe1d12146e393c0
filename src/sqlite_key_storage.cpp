#include "sqlite_key_storage.hpp"
#include <iostream>

namespace keypub {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string describe(sqlite3* db, const std::string& what) {
    return what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db, "bind failed"));
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

}

SqliteKeyStorage::SqliteKeyStorage(const std::string& db_path)
    : db_path_(db_path)
{
    writer_ = open_connection(SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    // WAL must be switched on by a writer before readers attach.
    exec(writer_.get(), "PRAGMA journal_mode=WAL;");
    exec(writer_.get(),
         "CREATE TABLE IF NOT EXISTS pub_keys ("
         "  id TEXT PRIMARY KEY,"
         "  public_key TEXT NOT NULL,"
         "  note TEXT"
         ");");

    reader_ = open_connection(SQLITE_OPEN_READONLY);

    std::cout << "[*] SQLite key store ready: " << db_path_ << "\n";
}

SqliteKeyStorage::DbPtr SqliteKeyStorage::open_connection(int flags) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &raw, flags | SQLITE_OPEN_NOMUTEX, nullptr);
    DbPtr db(raw);
    if (rc != SQLITE_OK) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db.get(), "cannot open " + db_path_));
    }
    sqlite3_busy_timeout(db.get(), kBusyTimeoutMs);
    sqlite3_extended_result_codes(db.get(), 1);
    return db;
}

void SqliteKeyStorage::exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreError(StoreError::Kind::UNAVAILABLE, "schema setup failed: " + detail);
    }
}

SqliteKeyStorage::StmtPtr SqliteKeyStorage::prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db, "prepare failed"));
    }
    return StmtPtr(raw);
}

// Single atomic INSERT on the writer connection.
void SqliteKeyStorage::create(const KeyRecord& record) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sqlite3* db = writer_.get();

    auto stmt = prepare(db, "INSERT INTO pub_keys (id, public_key, note) VALUES (?, ?, ?)");
    bind_text(db, stmt.get(), 1, record.id);
    bind_text(db, stmt.get(), 2, record.public_key);
    if (record.note) {
        bind_text(db, stmt.get(), 3, *record.note);
    } else if (sqlite3_bind_null(stmt.get(), 3) != SQLITE_OK) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db, "bind failed"));
    }

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return;

    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        throw StoreError(StoreError::Kind::CONFLICT, "duplicate id " + record.id);
    }
    throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db, "insert failed"));
}

std::optional<KeyRecord> SqliteKeyStorage::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    sqlite3* db = reader_.get();

    auto stmt = prepare(db, "SELECT id, public_key, note FROM pub_keys WHERE id = ?");
    bind_text(db, stmt.get(), 1, id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw StoreError(StoreError::Kind::UNAVAILABLE, describe(db, "select failed"));
    }

    KeyRecord record;
    record.id = column_text(stmt.get(), 0);
    record.public_key = column_text(stmt.get(), 1);
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
        record.note = column_text(stmt.get(), 2);
    }
    return record;
}

}
