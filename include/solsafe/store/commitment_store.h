// SOLSAFE - Commitment Store
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Durable home for a juror's vote secrets between commit and reveal.
//
// Layout in the underlying database:
//   v/<caseId>        -> StoredEnvelope JSON around the serialized VoteCommitment
//   c/<commitment>    -> caseId, so a commitment is never recorded for two cases
//
// A record and its index entry are always written and removed together in
// one batch.

#ifndef SOLSAFE_STORE_COMMITMENT_STORE_H
#define SOLSAFE_STORE_COMMITMENT_STORE_H

#include "solsafe/db/database.h"
#include "solsafe/vote/commitment.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace solsafe {

namespace util {
class ConfigManager;
}

namespace store {

struct StoreOptions {
    /// Delete an entry that fails its integrity check when it is read.
    /// Off by default so the damaged record stays available for inspection.
    bool purgeCorrupt{false};

    /// fsync every write
    bool sync{false};

    /// Read store.purgecorrupt and store.sync
    static StoreOptions FromConfig(const util::ConfigManager& config);
};

class CommitmentStore {
public:
    explicit CommitmentStore(std::unique_ptr<db::Database> database,
                             StoreOptions options = StoreOptions());

    CommitmentStore(const CommitmentStore&) = delete;
    CommitmentStore& operator=(const CommitmentStore&) = delete;

    /**
     * Persist vc under caseId, replacing any earlier record for the case.
     * @throws std::invalid_argument if vc belongs to another case or its
     *         commitment is already recorded under another case
     * @throws StorageError if the backend write fails
     */
    void Save(CaseId caseId, const vote::VoteCommitment& vc);

    /**
     * Read the record for caseId.
     * @return nullopt if nothing is stored for the case
     * @throws IntegrityError if the record is unreadable or fails its checksum,
     *         also when purgecorrupt is set and the purge itself fails
     * @throws StorageError if the backend read fails
     */
    std::optional<vote::VoteCommitment> Load(CaseId caseId);

    /// Drop the record for caseId and its index entry. A damaged record takes
    /// every index entry naming the case with it. Removing an absent record is
    /// a no-op. Throws StorageError on backend failure.
    void Remove(CaseId caseId);

    /// Whether a record exists, without checking its integrity
    bool Contains(CaseId caseId);

    /// Case ids with a record, ascending
    std::vector<CaseId> ListCases();

    /// Case a commitment is recorded under
    std::optional<CaseId> FindCase(const Hash256& commitment);

    const StoreOptions& GetOptions() const { return options_; }
    db::Database& GetDatabase() { return *db_; }

    static std::string RecordKey(CaseId caseId);
    static std::string IndexKey(const Hash256& commitment);

private:
    std::optional<std::string> ReadRaw(const std::string& key);
    void Apply(db::WriteBatch& batch, const std::string& what);

    /// Commitment held by an intact record, nullopt if absent or damaged
    std::optional<Hash256> PeekCommitment(CaseId caseId);

    /// Index keys whose value names caseId
    std::vector<std::string> IndexKeysFor(CaseId caseId);

    /// Log, purge if configured, and throw IntegrityError for the record of caseId
    [[noreturn]] void RejectCorrupt(CaseId caseId, const std::string& what);

    std::unique_ptr<db::Database> db_;
    StoreOptions options_;
    std::mutex mutex_;
};

} // namespace store
} // namespace solsafe

#endif // SOLSAFE_STORE_COMMITMENT_STORE_H
