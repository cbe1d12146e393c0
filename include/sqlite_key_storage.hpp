#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <sqlite3.h>
#include "key_storage.hpp"

namespace keypub {

// SQLite-backed key store.
// One writer connection (serialized by write_mutex_) and one reader
// connection. WAL mode lets lookups run while an insert is in progress.
class SqliteKeyStorage : public KeyStorage {
public:
    /**
     * Opens (creating if missing) the database file and ensures the
     * pub_keys table exists.
     * @throws StoreError UNAVAILABLE if the file cannot be opened or initialized.
     */
    explicit SqliteKeyStorage(const std::string& db_path);
    ~SqliteKeyStorage() override = default;

    SqliteKeyStorage(const SqliteKeyStorage&) = delete;
    SqliteKeyStorage& operator=(const SqliteKeyStorage&) = delete;

    void create(const KeyRecord& record) override;
    std::optional<KeyRecord> get(const std::string& id) override;
    std::string backend_name() const override { return "sqlite"; }

    const std::string& path() const { return db_path_; }

private:
    struct DbCloser {
        void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
    };
    struct StmtFinalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using DbPtr = std::unique_ptr<sqlite3, DbCloser>;
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

    std::string db_path_;

    DbPtr writer_;
    std::mutex write_mutex_;

    DbPtr reader_;
    std::mutex read_mutex_;

    DbPtr open_connection(int flags);
    void exec(sqlite3* db, const char* sql);
    StmtPtr prepare(sqlite3* db, const char* sql);
};

}
