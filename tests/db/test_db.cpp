// REVGUARD - Database Tests
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include "revguard/db/database.h"
#include "revguard/db/leveldb.h"

#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace revguard;
using namespace revguard::db;

namespace {

std::vector<std::string> ScanKeys(const Database& db, const std::string& prefix) {
    std::vector<std::string> keys;
    Status s = db.Scan(prefix, [&](const std::string& key, const std::string&) {
        keys.push_back(key);
        return Status::Ok();
    });
    EXPECT_TRUE(s.ok()) << s.ToString();
    return keys;
}

// Shared checks run against both backends
void CheckPutGet(Database& db) {
    std::string value;
    EXPECT_TRUE(db.Get("k", &value).IsNotFound());
    ASSERT_TRUE(db.Put("k", "v1").ok());
    ASSERT_TRUE(db.Put("k", "v2").ok());
    ASSERT_TRUE(db.Get("k", &value).ok());
    EXPECT_EQ(value, "v2");
}

void CheckBatch(Database& db) {
    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Put("a", "3");
    EXPECT_EQ(batch.Count(), 3u);
    ASSERT_TRUE(db.Write(batch, true).ok());

    std::string value;
    ASSERT_TRUE(db.Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    ASSERT_TRUE(db.Get("b", &value).ok());
    EXPECT_EQ(value, "2");
}

void CheckScan(Database& db) {
    for (const char* k : {"A\x03", "A\x01", "U1", "A\x02", "B"}) {
        ASSERT_TRUE(db.Put(k, "v").ok());
    }
    EXPECT_EQ(ScanKeys(db, "A"), (std::vector<std::string>{"A\x01", "A\x02", "A\x03"}));
    EXPECT_EQ(ScanKeys(db, "U").size(), 1u);
    EXPECT_TRUE(ScanKeys(db, "Z").empty());

    int visited = 0;
    Status s = db.Scan("A", [&](const std::string&, const std::string&) {
        ++visited;
        return visited == 2 ? Status::Corruption("stop") : Status::Ok();
    });
    EXPECT_TRUE(s.IsCorruption());
    EXPECT_EQ(visited, 2);
}

} // namespace

// ============================================================================
// LevelDB Backend
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() /
               ("revguard_db_test_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(dir_);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

TEST_F(LevelDBTest, PutGet) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    CheckPutGet(*db);
}

TEST_F(LevelDBTest, BatchAppliesAllPuts) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    CheckBatch(*db);
}

TEST_F(LevelDBTest, ScanVisitsPrefixInOrder) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    CheckScan(*db);
}

TEST_F(LevelDBTest, OpenMissingWithoutCreateFails) {
    Options options;
    options.createIfMissing = false;
    auto [status, db] = OpenDatabase(dir_ / "missing", options);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, OpenWithoutCacheOrFilter) {
    Options options;
    options.cacheBytes = 0;
    options.bloomBitsPerKey = 0;
    auto [status, db] = OpenDatabase(dir_, options);
    ASSERT_TRUE(status.ok()) << status.ToString();
    CheckPutGet(*db);
}

TEST_F(LevelDBTest, PersistsAcrossReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        WriteBatch batch;
        batch.Put("durable", "yes");
        ASSERT_TRUE(db->Write(batch, true).ok());
    }
    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get("durable", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, SecondOpenIsLocked) {
    auto first = Open();
    ASSERT_NE(first, nullptr);
    auto [status, second] = OpenDatabase(dir_);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(second, nullptr);
}

// ============================================================================
// Memory Backend
// ============================================================================

TEST(MemoryDatabaseTest, PutGet) {
    MemoryDatabase db;
    CheckPutGet(db);
}

TEST(MemoryDatabaseTest, BatchAppliesAllPuts) {
    MemoryDatabase db;
    CheckBatch(db);
}

TEST(MemoryDatabaseTest, ScanVisitsPrefixInOrder) {
    MemoryDatabase db;
    CheckScan(db);
}

TEST(MemoryDatabaseTest, VisitorMayWrite) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("Ka", "1").ok());
    ASSERT_TRUE(db.Put("Kb", "2").ok());

    int visited = 0;
    Status s = db.Scan("K", [&](const std::string& key, const std::string&) {
        ++visited;
        return db.Put(key + "x", "copy");
    });
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(visited, 2);
    EXPECT_EQ(ScanKeys(db, "K").size(), 4u);
}

// ============================================================================
// Status
// ============================================================================

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("engine 7").ToString(), "NotFound: engine 7");
    EXPECT_EQ(Status::Corruption("bad record").ToString(), "Corruption: bad record");
    EXPECT_EQ(Status::NotSupported("ledger version 2").code(), Status::Code::NotSupported);
    EXPECT_TRUE(Status::IOError("disk").IsIOError());
    EXPECT_FALSE(Status::IOError("disk").ok());
}
