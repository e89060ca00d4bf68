// SOLSAFE - Database Tests
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include <gtest/gtest.h>
#include "solsafe/db/database.h"
#include "solsafe/db/leveldb.h"
#include "solsafe/db/memory.h"
#include <filesystem>
#include <random>
#include <vector>

using namespace solsafe;
using namespace solsafe::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::TestWithParam<Backend> {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("solsafe_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(testDir_ / "test_db", Options(), GetParam());
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Basic Operations (both backends)
// ============================================================================

TEST_P(DatabaseTest, OpenReportsBackend) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_STREQ(db->Name(), BackendName(GetParam()));
}

TEST_P(DatabaseTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    Status s = db->Get(Slice("key1"), &value);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_EQ(value, "value1");

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value2")).ok());
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value2");

    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
}

TEST_P(DatabaseTest, MissingKeyIsNotFound) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    std::string value;
    Status s = db->Get(Slice("absent"), &value);
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.IsNotFound());
}

TEST_P(DatabaseTest, DeleteMissingKeySucceeds) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(db->Delete(Slice("never-written")).ok());
}

TEST_P(DatabaseTest, BinaryValues) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    Bytes blob = {0x00, 0xFF, 0x00, 0x7F};
    ASSERT_TRUE(db->Put(Slice("bin"), Slice(blob)).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("bin"), &value).ok());
    ASSERT_EQ(value.size(), 4u);
    EXPECT_EQ(static_cast<uint8_t>(value[1]), 0xFF);
}

TEST_P(DatabaseTest, WriteBatchIsApplied) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("stale"), Slice("x")).ok());

    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("stale"));
    EXPECT_EQ(batch.Count(), 3u);
    ASSERT_TRUE(db->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("a"), &value).ok());
    EXPECT_EQ(value, "1");
    ASSERT_TRUE(db->Get(Slice("b"), &value).ok());
    EXPECT_EQ(value, "2");
    EXPECT_TRUE(db->Get(Slice("stale"), &value).IsNotFound());

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST_P(DatabaseTest, IteratorVisitsKeysInOrder) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    for (const char* key : {"v/3", "c/aa", "v/1", "v/2", "x/9"}) {
        ASSERT_TRUE(db->Put(Slice(key), Slice("val")).ok());
    }

    std::vector<std::string> keys;
    auto it = db->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"c/aa", "v/1", "v/2", "v/3", "x/9"}));
}

TEST_P(DatabaseTest, PrefixScan) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice(MakeKey(prefix::VOTE_RECORD, "7")), Slice("a")).ok());
    ASSERT_TRUE(db->Put(Slice(MakeKey(prefix::VOTE_RECORD, "12")), Slice("b")).ok());
    ASSERT_TRUE(db->Put(Slice(MakeKey(prefix::COMMITMENT_INDEX, "ff")), Slice("c")).ok());

    const std::string votePrefix = MakeKey(prefix::VOTE_RECORD);
    std::vector<std::string> found;
    auto it = db->NewIterator();
    for (it->Seek(votePrefix); it->Valid() && it->key().starts_with(votePrefix); it->Next()) {
        found.push_back(it->key().ToString());
        EXPECT_FALSE(it->value().empty());
    }
    EXPECT_EQ(found, (std::vector<std::string>{"v/12", "v/7"}));
}

INSTANTIATE_TEST_SUITE_P(Backends, DatabaseTest,
                         ::testing::Values(Backend::LevelDB, Backend::Memory),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                             return std::string(BackendName(info.param));
                         });

// ============================================================================
// LevelDB Specifics
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("solsafe_leveldb_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

TEST_F(LevelDBTest, DataSurvivesReopen) {
    {
        auto [status, db] = OpenDatabase(testDir_);
        ASSERT_TRUE(status.ok()) << status.ToString();
        WriteOptions wo;
        wo.sync = true;
        ASSERT_TRUE(db->Put(wo, Slice("persist"), Slice("yes")).ok());
    }

    auto [status, db] = OpenDatabase(testDir_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, ErrorIfExists) {
    {
        auto [status, db] = OpenDatabase(testDir_);
        ASSERT_TRUE(status.ok());
    }

    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_, opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, MissingWithoutCreate) {
    Options opts;
    opts.create_if_missing = false;
    auto [status, db] = OpenDatabase(testDir_ / "nowhere", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, CacheAndBloomFilter) {
    Options opts;
    opts.block_cache_size = 1 << 20;
    opts.bloom_filter_bits = 10;
    auto [status, db] = OpenDatabase(testDir_, opts);
    ASSERT_TRUE(status.ok()) << status.ToString();

    ASSERT_TRUE(db->Put(Slice("k"), Slice("v")).ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");
}

TEST_F(LevelDBTest, DestroyRemovesData) {
    {
        auto [status, db] = OpenDatabase(testDir_);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put(Slice("gone"), Slice("soon")).ok());
    }
    ASSERT_TRUE(DestroyDatabase(testDir_).ok());

    auto [status, db] = OpenDatabase(testDir_);
    ASSERT_TRUE(status.ok());
    std::string value;
    EXPECT_TRUE(db->Get(Slice("gone"), &value).IsNotFound());
}

// ============================================================================
// Memory Backend and Helpers
// ============================================================================

TEST(MemoryDatabaseTest, IteratorIsSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put(Slice("a"), Slice("1")).ok());

    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put(Slice("b"), Slice("2")).ok());

    size_t seen = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++seen;
    }
    EXPECT_EQ(seen, 1u);
    EXPECT_EQ(db.Size(), 2u);

    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

TEST(DatabaseHelpersTest, BackendNames) {
    EXPECT_EQ(ParseBackend("leveldb"), Backend::LevelDB);
    EXPECT_EQ(ParseBackend("memory"), Backend::Memory);
    EXPECT_FALSE(ParseBackend("rocksdb").has_value());
    EXPECT_FALSE(ParseBackend("").has_value());
    EXPECT_STREQ(BackendName(Backend::LevelDB), "leveldb");
}

TEST(DatabaseHelpersTest, MakeKey) {
    EXPECT_EQ(MakeKey(prefix::VOTE_RECORD, "42"), "v/42");
    EXPECT_EQ(MakeKey(prefix::COMMITMENT_INDEX, "abcd"), "c/abcd");
    EXPECT_EQ(MakeKey(prefix::VOTE_RECORD), "v/");
}

TEST(DatabaseHelpersTest, StatusStrings) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("k").ToString(), "NotFound: k");
    EXPECT_EQ(Status::Corruption("bad").ToString(), "Corruption: bad");
    EXPECT_TRUE(Status::IOError().IsIOError());
}

TEST(DatabaseHelpersTest, SliceCompare) {
    EXPECT_TRUE(Slice("abc") < Slice("abd"));
    EXPECT_TRUE(Slice("ab") < Slice("abc"));
    EXPECT_TRUE(Slice("v/12").starts_with(Slice("v/")));
    EXPECT_FALSE(Slice("v").starts_with(Slice("v/")));
    EXPECT_EQ(Slice(""), Slice());
}
