#include <gtest/gtest.h>
#include "sqlite_key_storage.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace keypub;
using namespace keypub::testing;

class SqliteKeyStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage = std::make_unique<SqliteKeyStorage>(db.path());
    }

    TempDb db;
    std::unique_ptr<SqliteKeyStorage> storage;
};

TEST_F(SqliteKeyStorageTest, CreateThenGet) {
    KeyRecord record{IdGenerator::generate_id(), make_key(32), std::string("laptop")};
    storage->create(record);

    auto found = storage->get(record.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, record);
    EXPECT_EQ(storage->backend_name(), "sqlite");
    EXPECT_EQ(storage->path(), db.path());
}

TEST_F(SqliteKeyStorageTest, AbsentNoteIsNull) {
    KeyRecord record{IdGenerator::generate_id(), make_key(32), std::nullopt};
    storage->create(record);

    auto found = storage->get(record.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->note.has_value());
}

TEST_F(SqliteKeyStorageTest, MissingIdReturnsNullopt) {
    EXPECT_FALSE(storage->get(IdGenerator::generate_id()).has_value());
    EXPECT_FALSE(storage->get("' OR 1=1 --").has_value());
}

TEST_F(SqliteKeyStorageTest, DuplicateIdIsConflict) {
    KeyRecord record{IdGenerator::generate_id(), make_key(32), std::nullopt};
    storage->create(record);

    KeyRecord again{record.id, make_key(32, 50), std::string("other")};
    try {
        storage->create(again);
        FAIL() << "duplicate insert succeeded";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), StoreError::Kind::CONFLICT);
    }
    EXPECT_EQ(storage->get(record.id)->public_key, record.public_key);
    EXPECT_EQ(count_rows(db.path()), 1);
}

TEST_F(SqliteKeyStorageTest, RecordsSurviveReopen) {
    KeyRecord record{IdGenerator::generate_id(), make_key(32), std::string("\xE4\xB8\xAD\xE6\x96\x87")};
    storage->create(record);
    storage.reset();

    SqliteKeyStorage reopened(db.path());
    auto found = reopened.get(record.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, record);
}

TEST(SqliteKeyStorageOpenTest, UnwritablePathIsUnavailable) {
    try {
        SqliteKeyStorage storage("/nonexistent-keypub-dir/sub/keys.db");
        FAIL() << "opened a database in a missing directory";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), StoreError::Kind::UNAVAILABLE);
    }
}

TEST_F(SqliteKeyStorageTest, ConcurrentWritersAndReaders) {
    const int num_threads = 8;
    const int per_thread = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < per_thread; ++i) {
                KeyRecord record{IdGenerator::generate_id(), make_key(32, static_cast<unsigned char>(t)),
                                 std::string("t") + std::to_string(t)};
                try {
                    storage->create(record);
                    auto found = storage->get(record.id);
                    if (!found || !(*found == record)) failures++;
                } catch (const StoreError&) {
                    failures++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(failures, 0);
    EXPECT_EQ(count_rows(db.path()), num_threads * per_thread);
}
