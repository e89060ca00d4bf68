// SOLSAFE - Database Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/db/database.h"
#include "solsafe/db/leveldb.h"
#include "solsafe/db/memory.h"
#include "solsafe/util/logging.h"

#include <system_error>

namespace solsafe {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// Backend Selection
// ============================================================================

std::optional<Backend> ParseBackend(const std::string& name) {
    if (name == "leveldb") return Backend::LevelDB;
    if (name == "memory") return Backend::Memory;
    return std::nullopt;
}

const char* BackendName(Backend backend) {
    switch (backend) {
        case Backend::LevelDB: return "leveldb";
        case Backend::Memory: return "memory";
    }
    return "unknown";
}

// ============================================================================
// Database Factory Functions
// ============================================================================

namespace {

std::pair<Status, std::unique_ptr<Database>> OpenLevelDB(
    const std::filesystem::path& path, const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        return {FromLevelDBStatus(s), nullptr};
    }

    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(raw, cache.release(), filter.release(), path)};
}

} // namespace

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options,
    Backend backend)
{
    std::pair<Status, std::unique_ptr<Database>> result;
    switch (backend) {
        case Backend::LevelDB:
            result = OpenLevelDB(path, options);
            break;
        case Backend::Memory:
            result.first = Status::Ok();
            result.second = std::make_unique<MemoryDatabase>();
            break;
    }

    if (result.first.ok()) {
        LOG_DEBUG(util::LogCategory::DB)
            << "Opened " << BackendName(backend) << " database"
            << (backend == Backend::LevelDB ? " at " + path.string() : std::string());
    } else {
        LOG_ERROR(util::LogCategory::DB)
            << "Cannot open " << BackendName(backend) << " database at "
            << path.string() << ": " << result.first.ToString();
    }
    return result;
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace solsafe
