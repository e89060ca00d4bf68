// SOLSAFE - Commitment Store Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/store/commitment_store.h"
#include "solsafe/core/errors.h"
#include "solsafe/store/envelope.h"
#include "solsafe/util/config.h"
#include "solsafe/util/logging.h"

#include <algorithm>
#include <charconv>
#include <ios>
#include <stdexcept>

namespace solsafe {
namespace store {

namespace {

/// Strict decimal case id; rejects signs, spaces and zero
std::optional<CaseId> ParseCaseId(const char* begin, const char* end) {
    if (begin == end) {
        return std::nullopt;
    }
    CaseId value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<CaseId> ParseCaseId(const std::string& str) {
    return ParseCaseId(str.data(), str.data() + str.size());
}

} // namespace

StoreOptions StoreOptions::FromConfig(const util::ConfigManager& config) {
    StoreOptions options;
    options.purgeCorrupt = config.GetBool(util::ConfigKeys::STORE_PURGECORRUPT, false);
    options.sync = config.GetBool(util::ConfigKeys::STORE_SYNC, false);
    return options;
}

CommitmentStore::CommitmentStore(std::unique_ptr<db::Database> database, StoreOptions options)
    : db_(std::move(database)), options_(options) {
    if (!db_) {
        throw std::invalid_argument("CommitmentStore requires a database");
    }
    LOG_DEBUG(util::LogCategory::STORE)
        << "Commitment store on " << db_->Name() << " backend (purgecorrupt="
        << options_.purgeCorrupt << ", sync=" << options_.sync << ")";
}

// ============================================================================
// Keys
// ============================================================================

std::string CommitmentStore::RecordKey(CaseId caseId) {
    return db::MakeKey(db::prefix::VOTE_RECORD, std::to_string(caseId));
}

std::string CommitmentStore::IndexKey(const Hash256& commitment) {
    return db::MakeKey(db::prefix::COMMITMENT_INDEX, commitment.ToHex());
}

// ============================================================================
// Backend Access
// ============================================================================

std::optional<std::string> CommitmentStore::ReadRaw(const std::string& key) {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Read of '" << key << "' failed: " << s.ToString();
        throw StorageError("read of '" + key + "' failed: " + s.ToString());
    }
    return value;
}

void CommitmentStore::Apply(db::WriteBatch& batch, const std::string& what) {
    db::WriteOptions wo;
    wo.sync = options_.sync;
    db::Status s = db_->Write(wo, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << what << " failed: " << s.ToString();
        throw StorageError(what + " failed: " + s.ToString());
    }
}

std::optional<Hash256> CommitmentStore::PeekCommitment(CaseId caseId) {
    auto raw = ReadRaw(RecordKey(caseId));
    if (!raw) {
        return std::nullopt;
    }
    try {
        StoredEnvelope env = StoredEnvelope::FromJSON(*raw);
        if (!env.IsIntact()) {
            return std::nullopt;
        }
        return vote::DeserializeVoteCommitment(env.payload).GetCommitment();
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::vector<std::string> CommitmentStore::IndexKeysFor(CaseId caseId) {
    const std::string prefix = db::MakeKey(db::prefix::COMMITMENT_INDEX);
    const std::string owner = std::to_string(caseId);
    std::vector<std::string> keys;

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (it->value() == db::Slice(owner)) {
            keys.push_back(it->key().ToString());
        }
    }

    db::Status s = it->status();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Index scan failed: " << s.ToString();
        throw StorageError("index scan failed: " + s.ToString());
    }
    return keys;
}

void CommitmentStore::RejectCorrupt(CaseId caseId, const std::string& what) {
    const std::string key = RecordKey(caseId);
    LOG_ERROR(util::LogCategory::STORE) << "Integrity failure for '" << key << "': " << what;

    if (!options_.purgeCorrupt) {
        throw IntegrityError(key, what);
    }

    // The integrity failure is what the caller sees, whether or not the purge lands
    try {
        db::WriteBatch batch;
        for (const std::string& indexKey : IndexKeysFor(caseId)) {
            batch.Delete(indexKey);
        }
        batch.Delete(key);
        Apply(batch, "purge of '" + key + "'");
        LOG_WARN(util::LogCategory::STORE) << "Purged corrupt entry '" << key << "'";
    } catch (const StorageError& e) {
        LOG_ERROR(util::LogCategory::STORE) << "Corrupt entry '" << key << "' kept: " << e.what();
        throw IntegrityError(key, what + " (purge failed: " + e.what() + ")");
    }
    throw IntegrityError(key, what);
}

// ============================================================================
// Operations
// ============================================================================

void CommitmentStore::Save(CaseId caseId, const vote::VoteCommitment& vc) {
    if (vc.GetCaseId() != caseId) {
        throw std::invalid_argument("commitment for case " + std::to_string(vc.GetCaseId()) +
                                    " cannot be stored under case " + std::to_string(caseId));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string indexKey = IndexKey(vc.GetCommitment());
    if (auto indexed = ReadRaw(indexKey)) {
        auto owner = ParseCaseId(*indexed);
        if (owner && *owner != caseId && PeekCommitment(*owner) == vc.GetCommitment()) {
            LOG_WARN(util::LogCategory::STORE)
                << "Refusing to reuse commitment " << vc.GetCommitment().ToShortHex()
                << " of case " << *owner << " for case " << caseId;
            throw std::invalid_argument("commitment already recorded for case " +
                                        std::to_string(*owner));
        }
    }

    db::WriteBatch batch;

    // A replaced record takes its index entry with it
    auto previous = PeekCommitment(caseId);
    if (previous && *previous != vc.GetCommitment()) {
        batch.Delete(IndexKey(*previous));
    } else if (!previous && ReadRaw(RecordKey(caseId))) {
        for (const std::string& staleKey : IndexKeysFor(caseId)) {
            if (staleKey != indexKey) {
                batch.Delete(staleKey);
            }
        }
    }

    StoredEnvelope env = StoredEnvelope::Seal(vote::SerializeVoteCommitment(vc));
    batch.Put(RecordKey(caseId), env.ToJSON());
    batch.Put(indexKey, std::to_string(caseId));
    Apply(batch, "save of case " + std::to_string(caseId));

    LOG_INFO(util::LogCategory::STORE)
        << "Saved vote secret for case " << caseId
        << " (commitment " << vc.GetCommitment().ToShortHex() << ")";
}

std::optional<vote::VoteCommitment> CommitmentStore::Load(CaseId caseId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = RecordKey(caseId);
    auto raw = ReadRaw(key);
    if (!raw) {
        LOG_DEBUG(util::LogCategory::STORE) << "No vote secret for case " << caseId;
        return std::nullopt;
    }

    StoredEnvelope env;
    try {
        env = StoredEnvelope::FromJSON(*raw);
    } catch (const std::invalid_argument& e) {
        RejectCorrupt(caseId, std::string("unreadable envelope: ") + e.what());
    }

    if (!env.IsIntact()) {
        RejectCorrupt(caseId, "checksum mismatch");
    }

    try {
        vote::VoteCommitment vc = vote::DeserializeVoteCommitment(env.payload);
        if (vc.GetCaseId() != caseId) {
            RejectCorrupt(caseId, "record belongs to case " + std::to_string(vc.GetCaseId()));
        }
        return vc;
    } catch (const std::invalid_argument& e) {
        RejectCorrupt(caseId, std::string("bad payload: ") + e.what());
    } catch (const std::ios_base::failure& e) {
        RejectCorrupt(caseId, std::string("truncated payload: ") + e.what());
    }
}

void CommitmentStore::Remove(CaseId caseId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = RecordKey(caseId);
    if (!ReadRaw(key)) {
        return;
    }

    db::WriteBatch batch;
    if (auto commitment = PeekCommitment(caseId)) {
        batch.Delete(IndexKey(*commitment));
    } else {
        // Damaged record: its commitment is unknown, so drop every index entry naming the case
        for (const std::string& indexKey : IndexKeysFor(caseId)) {
            batch.Delete(indexKey);
        }
    }
    batch.Delete(key);
    Apply(batch, "removal of case " + std::to_string(caseId));

    LOG_INFO(util::LogCategory::STORE) << "Removed vote secret for case " << caseId;
}

bool CommitmentStore::Contains(CaseId caseId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadRaw(RecordKey(caseId)).has_value();
}

std::vector<CaseId> CommitmentStore::ListCases() {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string prefix = db::MakeKey(db::prefix::VOTE_RECORD);
    std::vector<CaseId> cases;

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        db::Slice key = it->key();
        auto caseId = ParseCaseId(key.data() + prefix.size(), key.data() + key.size());
        if (!caseId) {
            LOG_WARN(util::LogCategory::STORE) << "Skipping unexpected key '" << key.ToString() << "'";
            continue;
        }
        cases.push_back(*caseId);
    }

    db::Status s = it->status();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Listing cases failed: " << s.ToString();
        throw StorageError("listing cases failed: " + s.ToString());
    }

    std::sort(cases.begin(), cases.end());
    return cases;
}

std::optional<CaseId> CommitmentStore::FindCase(const Hash256& commitment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto indexed = ReadRaw(IndexKey(commitment));
    if (!indexed) {
        return std::nullopt;
    }
    return ParseCaseId(*indexed);
}

} // namespace store
} // namespace solsafe
