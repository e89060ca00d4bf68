// SOLSAFE - Commitment Store Tests
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include <gtest/gtest.h>
#include "solsafe/core/errors.h"
#include "solsafe/db/memory.h"
#include "solsafe/store/commitment_store.h"
#include "solsafe/store/envelope.h"
#include "solsafe/util/config.h"

#include <filesystem>
#include <random>
#include <stdexcept>

using namespace solsafe;
using namespace solsafe::store;
using vote::VoteCommitment;

namespace {

vote::Salt MakeSalt(Byte seed) {
    vote::Salt salt;
    for (size_t i = 0; i < salt.size(); ++i) {
        salt[i] = static_cast<Byte>(seed + i);
    }
    return salt;
}

/// Iterator that yields nothing and reports a backend error
class BrokenIterator : public db::Iterator {
public:
    bool Valid() const override { return false; }
    void SeekToFirst() override {}
    void Seek(const db::Slice&) override {}
    void Next() override {}
    db::Slice key() const override { return db::Slice(); }
    db::Slice value() const override { return db::Slice(); }
    db::Status status() const override { return db::Status::IOError("iterator failed"); }
};

/// In-memory backend whose reads, writes or scans can be made to fail
class FlakyDatabase : public db::MemoryDatabase {
public:
    using MemoryDatabase::Get;
    using MemoryDatabase::Write;
    using MemoryDatabase::NewIterator;

    db::Status Get(const db::ReadOptions& options, const db::Slice& key,
                   std::string* value) override {
        if (failReads) return db::Status::IOError("read failed");
        return MemoryDatabase::Get(options, key, value);
    }

    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        if (failWrites) return db::Status::IOError("disk full");
        return MemoryDatabase::Write(options, batch);
    }

    std::unique_ptr<db::Iterator> NewIterator(const db::ReadOptions& options) override {
        if (failScans) return std::make_unique<BrokenIterator>();
        return MemoryDatabase::NewIterator(options);
    }

    bool failReads{false};
    bool failWrites{false};
    bool failScans{false};
};

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class CommitmentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Reset(StoreOptions());
    }

    void Reset(StoreOptions options) {
        store_ = std::make_unique<CommitmentStore>(std::make_unique<db::MemoryDatabase>(),
                                                   options);
    }

    /// Overwrite the raw record for caseId
    void PutRaw(CaseId caseId, const std::string& value) {
        ASSERT_TRUE(store_->GetDatabase()
                        .Put(db::Slice(CommitmentStore::RecordKey(caseId)), db::Slice(value))
                        .ok());
    }

    std::string GetRaw(CaseId caseId) {
        std::string value;
        db::Status s = store_->GetDatabase().Get(db::Slice(CommitmentStore::RecordKey(caseId)),
                                                 &value);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return value;
    }

    std::unique_ptr<CommitmentStore> store_;
};

// ============================================================================
// Save / Load
// ============================================================================

TEST_F(CommitmentStoreTest, SaveAndLoad) {
    VoteCommitment vc(42, true, MakeSalt(1));
    store_->Save(42, vc);

    auto loaded = store_->Load(42);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, vc);
    EXPECT_TRUE(store_->Contains(42));
    EXPECT_EQ(store_->FindCase(vc.GetCommitment()), CaseId(42));
}

TEST_F(CommitmentStoreTest, LoadAbsent) {
    EXPECT_FALSE(store_->Load(7).has_value());
    EXPECT_FALSE(store_->Contains(7));
}

TEST_F(CommitmentStoreTest, KeysAndLayout) {
    VoteCommitment vc(42, false, MakeSalt(3));
    store_->Save(42, vc);

    EXPECT_EQ(CommitmentStore::RecordKey(42), "v/42");
    EXPECT_EQ(CommitmentStore::IndexKey(vc.GetCommitment()), "c/" + vc.GetCommitment().ToHex());

    StoredEnvelope env = StoredEnvelope::FromJSON(GetRaw(42));
    EXPECT_TRUE(env.IsIntact());
    EXPECT_EQ(env.payload, vote::SerializeVoteCommitment(vc));

    std::string indexed;
    ASSERT_TRUE(store_->GetDatabase()
                    .Get(db::Slice(CommitmentStore::IndexKey(vc.GetCommitment())), &indexed)
                    .ok());
    EXPECT_EQ(indexed, "42");
}

TEST_F(CommitmentStoreTest, SaveUnderWrongCaseRejected) {
    VoteCommitment vc(42, true, MakeSalt(1));
    EXPECT_THROW(store_->Save(43, vc), std::invalid_argument);
    EXPECT_FALSE(store_->Contains(43));
}

TEST_F(CommitmentStoreTest, CommitmentNeverSharedAcrossCases) {
    VoteCommitment first(1, true, MakeSalt(9));
    VoteCommitment second(2, true, MakeSalt(9));
    ASSERT_EQ(first.GetCommitment(), second.GetCommitment());

    store_->Save(1, first);
    EXPECT_THROW(store_->Save(2, second), std::invalid_argument);
    EXPECT_FALSE(store_->Contains(2));
    EXPECT_EQ(store_->FindCase(first.GetCommitment()), CaseId(1));
}

TEST_F(CommitmentStoreTest, SavingSameRecordTwice) {
    VoteCommitment vc(5, true, MakeSalt(2));
    store_->Save(5, vc);
    EXPECT_NO_THROW(store_->Save(5, vc));
    EXPECT_EQ(*store_->Load(5), vc);
}

TEST_F(CommitmentStoreTest, OverwriteMovesIndex) {
    VoteCommitment oldVc(5, true, MakeSalt(2));
    VoteCommitment newVc(5, false, MakeSalt(4));
    store_->Save(5, oldVc);
    store_->Save(5, newVc);

    EXPECT_EQ(*store_->Load(5), newVc);
    EXPECT_FALSE(store_->FindCase(oldVc.GetCommitment()).has_value());
    EXPECT_EQ(store_->FindCase(newVc.GetCommitment()), CaseId(5));

    // The released commitment can now be used elsewhere
    VoteCommitment reused(6, true, MakeSalt(2));
    EXPECT_NO_THROW(store_->Save(6, reused));
}

// ============================================================================
// Remove / List
// ============================================================================

TEST_F(CommitmentStoreTest, RemoveDropsRecordAndIndex) {
    VoteCommitment vc(11, true, MakeSalt(5));
    store_->Save(11, vc);

    store_->Remove(11);
    EXPECT_FALSE(store_->Contains(11));
    EXPECT_FALSE(store_->Load(11).has_value());
    EXPECT_FALSE(store_->FindCase(vc.GetCommitment()).has_value());

    EXPECT_NO_THROW(store_->Remove(11));
    EXPECT_NO_THROW(store_->Remove(999));
}

TEST_F(CommitmentStoreTest, ListCasesAscending) {
    EXPECT_TRUE(store_->ListCases().empty());

    for (CaseId id : {33u, 2u, 10u, 100u}) {
        store_->Save(id, VoteCommitment(id, id % 2 == 0, MakeSalt(static_cast<Byte>(id))));
    }
    EXPECT_EQ(store_->ListCases(), (std::vector<CaseId>{2, 10, 33, 100}));

    store_->Remove(10);
    EXPECT_EQ(store_->ListCases(), (std::vector<CaseId>{2, 33, 100}));
}

TEST_F(CommitmentStoreTest, ListSkipsForeignKeys) {
    store_->Save(3, VoteCommitment(3, true, MakeSalt(1)));
    ASSERT_TRUE(store_->GetDatabase().Put(db::Slice("v/not-a-case"), db::Slice("x")).ok());
    ASSERT_TRUE(store_->GetDatabase().Put(db::Slice("w/4"), db::Slice("x")).ok());
    EXPECT_EQ(store_->ListCases(), (std::vector<CaseId>{3}));
}

// ============================================================================
// Integrity
// ============================================================================

TEST_F(CommitmentStoreTest, FlippedPayloadBitIsIntegrityError) {
    store_->Save(42, VoteCommitment(42, true, MakeSalt(1)));

    StoredEnvelope env = StoredEnvelope::FromJSON(GetRaw(42));
    env.payload[20] ^= 0x01;
    PutRaw(42, env.ToJSON());

    try {
        store_->Load(42);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.Key(), "v/42");
    }

    // Kept for inspection by default
    EXPECT_TRUE(store_->Contains(42));
    EXPECT_THROW(store_->Load(42), IntegrityError);
}

TEST_F(CommitmentStoreTest, FlippedChecksumIsIntegrityError) {
    store_->Save(8, VoteCommitment(8, false, MakeSalt(6)));

    StoredEnvelope env = StoredEnvelope::FromJSON(GetRaw(8));
    env.checksum[0] ^= 0x80;
    PutRaw(8, env.ToJSON());

    EXPECT_THROW(store_->Load(8), IntegrityError);
}

TEST_F(CommitmentStoreTest, UnreadableRecordIsIntegrityError) {
    PutRaw(12, "{not json");
    EXPECT_THROW(store_->Load(12), IntegrityError);

    PutRaw(12, "{\"checksum\":\"00\"}");
    EXPECT_THROW(store_->Load(12), IntegrityError);
}

TEST_F(CommitmentStoreTest, ResealedBadPayloadIsIntegrityError) {
    // Checksum matches but the record inside is not a vote commitment
    PutRaw(13, StoredEnvelope::Seal({1, 2, 3}).ToJSON());
    EXPECT_THROW(store_->Load(13), IntegrityError);

    Bytes payload = vote::SerializeVoteCommitment(VoteCommitment(13, true, MakeSalt(7)));
    payload[9] = 0;
    PutRaw(13, StoredEnvelope::Seal(payload).ToJSON());
    EXPECT_THROW(store_->Load(13), IntegrityError);
}

TEST_F(CommitmentStoreTest, RecordFromAnotherCaseIsIntegrityError) {
    store_->Save(1, VoteCommitment(1, true, MakeSalt(1)));
    PutRaw(2, GetRaw(1));
    EXPECT_THROW(store_->Load(2), IntegrityError);
}

TEST_F(CommitmentStoreTest, PurgeCorruptDeletesEntry) {
    StoreOptions options;
    options.purgeCorrupt = true;
    Reset(options);

    VoteCommitment vc(42, true, MakeSalt(1));
    store_->Save(42, vc);

    StoredEnvelope env = StoredEnvelope::FromJSON(GetRaw(42));
    env.payload.back() ^= 0xFF;
    PutRaw(42, env.ToJSON());

    EXPECT_THROW(store_->Load(42), IntegrityError);
    EXPECT_FALSE(store_->Contains(42));
    EXPECT_FALSE(store_->Load(42).has_value());
    EXPECT_FALSE(store_->FindCase(vc.GetCommitment()).has_value());

    // The stale index entry does not block the commitment
    EXPECT_NO_THROW(store_->Save(43, VoteCommitment(43, true, MakeSalt(1))));
    EXPECT_EQ(store_->FindCase(vc.GetCommitment()), CaseId(43));
}

TEST_F(CommitmentStoreTest, CorruptRecordCanBeReplaced) {
    PutRaw(20, "garbage");
    VoteCommitment vc(20, false, MakeSalt(8));
    store_->Save(20, vc);
    EXPECT_EQ(*store_->Load(20), vc);
}

TEST_F(CommitmentStoreTest, RemoveCorruptRecord) {
    PutRaw(21, "garbage");
    store_->Remove(21);
    EXPECT_FALSE(store_->Contains(21));
}

TEST_F(CommitmentStoreTest, RemoveCorruptRecordDropsIndex) {
    VoteCommitment vc(21, true, MakeSalt(5));
    VoteCommitment other(22, false, MakeSalt(6));
    store_->Save(21, vc);
    store_->Save(22, other);
    PutRaw(21, "garbage");

    store_->Remove(21);
    EXPECT_FALSE(store_->Contains(21));

    std::string indexed;
    EXPECT_TRUE(store_->GetDatabase()
                    .Get(db::Slice(CommitmentStore::IndexKey(vc.GetCommitment())), &indexed)
                    .IsNotFound());
    EXPECT_EQ(store_->FindCase(other.GetCommitment()), CaseId(22));
}

TEST_F(CommitmentStoreTest, ReplacingCorruptRecordDropsOldIndex) {
    VoteCommitment oldVc(23, true, MakeSalt(7));
    VoteCommitment newVc(23, false, MakeSalt(8));
    store_->Save(23, oldVc);
    PutRaw(23, "garbage");

    store_->Save(23, newVc);
    EXPECT_EQ(*store_->Load(23), newVc);
    EXPECT_FALSE(store_->FindCase(oldVc.GetCommitment()).has_value());
    EXPECT_EQ(store_->FindCase(newVc.GetCommitment()), CaseId(23));
}

// ============================================================================
// Backend Failures
// ============================================================================

class StoreBackendFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        Reset(StoreOptions());
    }

    void Reset(StoreOptions options) {
        auto database = std::make_unique<FlakyDatabase>();
        db_ = database.get();
        store_ = std::make_unique<CommitmentStore>(std::move(database), options);
    }

    FlakyDatabase* db_{nullptr};
    std::unique_ptr<CommitmentStore> store_;
};

TEST_F(StoreBackendFailureTest, SaveWriteFailure) {
    VoteCommitment vc(42, true, MakeSalt(1));
    db_->failWrites = true;
    EXPECT_THROW(store_->Save(42, vc), StorageError);

    db_->failWrites = false;
    EXPECT_EQ(db_->Size(), 0u);
    EXPECT_FALSE(store_->Contains(42));
    EXPECT_FALSE(store_->FindCase(vc.GetCommitment()).has_value());
}

TEST_F(StoreBackendFailureTest, FailedOverwriteKeepsPreviousRecord) {
    VoteCommitment oldVc(42, true, MakeSalt(1));
    VoteCommitment newVc(42, false, MakeSalt(2));
    store_->Save(42, oldVc);

    db_->failWrites = true;
    EXPECT_THROW(store_->Save(42, newVc), StorageError);

    db_->failWrites = false;
    EXPECT_EQ(*store_->Load(42), oldVc);
    EXPECT_EQ(store_->FindCase(oldVc.GetCommitment()), CaseId(42));
    EXPECT_FALSE(store_->FindCase(newVc.GetCommitment()).has_value());
}

TEST_F(StoreBackendFailureTest, LoadReadFailure) {
    store_->Save(42, VoteCommitment(42, true, MakeSalt(1)));
    db_->failReads = true;
    EXPECT_THROW(store_->Load(42), StorageError);
    EXPECT_THROW(store_->Contains(42), StorageError);
    EXPECT_THROW(store_->Load(7), StorageError);
}

TEST_F(StoreBackendFailureTest, RemoveWriteFailure) {
    VoteCommitment vc(42, true, MakeSalt(1));
    store_->Save(42, vc);

    db_->failWrites = true;
    EXPECT_THROW(store_->Remove(42), StorageError);

    db_->failWrites = false;
    EXPECT_EQ(*store_->Load(42), vc);
}

TEST_F(StoreBackendFailureTest, ListCasesScanFailure) {
    store_->Save(42, VoteCommitment(42, true, MakeSalt(1)));
    db_->failScans = true;
    EXPECT_THROW(store_->ListCases(), StorageError);
}

TEST_F(StoreBackendFailureTest, FailedPurgeStillReportsIntegrityError) {
    StoreOptions options;
    options.purgeCorrupt = true;
    Reset(options);

    store_->Save(42, VoteCommitment(42, true, MakeSalt(1)));
    ASSERT_TRUE(db_->Put(db::Slice(CommitmentStore::RecordKey(42)), db::Slice("{garbage")).ok());

    db_->failWrites = true;
    try {
        store_->Load(42);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.Key(), "v/42");
        EXPECT_NE(std::string(e.what()).find("purge failed"), std::string::npos) << e.what();
    }

    db_->failWrites = false;
    EXPECT_TRUE(store_->Contains(42));
}

TEST_F(StoreBackendFailureTest, FailedPurgeScanStillReportsIntegrityError) {
    StoreOptions options;
    options.purgeCorrupt = true;
    Reset(options);

    ASSERT_TRUE(db_->Put(db::Slice(CommitmentStore::RecordKey(9)), db::Slice("garbage")).ok());
    db_->failScans = true;
    EXPECT_THROW(store_->Load(9), IntegrityError);

    db_->failScans = false;
    EXPECT_TRUE(store_->Contains(9));
}

// ============================================================================
// Construction and Configuration
// ============================================================================

TEST(CommitmentStoreConfigTest, NullDatabaseRejected) {
    EXPECT_THROW(CommitmentStore(nullptr), std::invalid_argument);
}

TEST(CommitmentStoreConfigTest, OptionsFromConfig) {
    util::ConfigManager config;
    StoreOptions defaults = StoreOptions::FromConfig(config);
    EXPECT_FALSE(defaults.purgeCorrupt);
    EXPECT_FALSE(defaults.sync);

    ASSERT_TRUE(config.ParseString("[store]\npurgecorrupt=1\nsync=true\n").success);
    StoreOptions options = StoreOptions::FromConfig(config);
    EXPECT_TRUE(options.purgeCorrupt);
    EXPECT_TRUE(options.sync);
}

// ============================================================================
// Persistence
// ============================================================================

class PersistentStoreTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        testDir_ = std::filesystem::temp_directory_path() /
                   ("solsafe_store_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<CommitmentStore> Open() {
        auto [status, db] = db::OpenDatabase(testDir_);
        EXPECT_TRUE(status.ok()) << status.ToString();
        if (!status.ok()) {
            return nullptr;
        }
        StoreOptions options;
        options.sync = true;
        return std::make_unique<CommitmentStore>(std::move(db), options);
    }
};

TEST_F(PersistentStoreTest, SurvivesRestart) {
    VoteCommitment vc(77, true, MakeSalt(3));
    {
        auto store = Open();
        ASSERT_NE(store, nullptr);
        store->Save(77, vc);
    }

    auto store = Open();
    ASSERT_NE(store, nullptr);
    auto loaded = store->Load(77);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, vc);
    EXPECT_EQ(store->FindCase(vc.GetCommitment()), CaseId(77));
    EXPECT_EQ(store->ListCases(), (std::vector<CaseId>{77}));
}

TEST_F(PersistentStoreTest, RemovalSurvivesRestart) {
    {
        auto store = Open();
        ASSERT_NE(store, nullptr);
        store->Save(1, VoteCommitment(1, true, MakeSalt(1)));
        store->Save(2, VoteCommitment(2, false, MakeSalt(2)));
        store->Remove(1);
    }

    auto store = Open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->ListCases(), (std::vector<CaseId>{2}));
}
