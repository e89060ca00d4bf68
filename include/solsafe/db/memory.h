// SOLSAFE - In-Memory Database
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Map-backed database selected with backend=memory. Nothing survives the
// process; used by tests and dry runs.

#ifndef SOLSAFE_DB_MEMORY_H
#define SOLSAFE_DB_MEMORY_H

#include "solsafe/db/database.h"

#include <map>
#include <mutex>

namespace solsafe {
namespace db {

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// The iterator walks a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const char* Name() const override { return "memory"; }

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

/**
 * Iterator over a private copy of a MemoryDatabase's contents.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace solsafe

#endif // SOLSAFE_DB_MEMORY_H
