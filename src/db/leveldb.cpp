// REVGUARD - Database Backends Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/db/leveldb.h"

#include <leveldb/write_batch.h>

#include <system_error>

namespace revguard {
namespace db {

namespace {

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    return Status::IOError(s.ToString());
}

bool HasPrefix(const leveldb::Slice& key, const std::string& prefix) {
    return key.starts_with(leveldb::Slice(prefix));
}

} // namespace

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(std::unique_ptr<leveldb::Cache> cache,
                                 std::unique_ptr<const leveldb::FilterPolicy> filter)
    : cache_(std::move(cache)), filter_(std::move(filter)) {}

LevelDBDatabase::~LevelDBDatabase() = default;

std::pair<Status, std::unique_ptr<Database>> LevelDBDatabase::Open(
    const std::filesystem::path& path, const Options& options) {
    std::unique_ptr<leveldb::Cache> cache;
    if (options.cacheBytes > 0) {
        cache.reset(leveldb::NewLRUCache(options.cacheBytes));
    }
    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloomBitsPerKey > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloomBitsPerKey));
    }

    leveldb::Options lo;
    lo.create_if_missing = options.createIfMissing;
    lo.block_cache = cache.get();
    lo.filter_policy = filter.get();

    if (options.createIfMissing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    std::unique_ptr<LevelDBDatabase> database(
        new LevelDBDatabase(std::move(cache), std::move(filter)));
    leveldb::DB* raw = nullptr;
    Status s = FromLevelDB(leveldb::DB::Open(lo, path.string(), &raw));
    if (!s.ok()) {
        return {s, nullptr};
    }
    database->db_.reset(raw);
    return {Status::Ok(), std::move(database)};
}

Status LevelDBDatabase::Get(const std::string& key, std::string* value) const {
    return FromLevelDB(db_->Get(leveldb::ReadOptions(), key, value));
}

Status LevelDBDatabase::Put(const std::string& key, const std::string& value) {
    return FromLevelDB(db_->Put(leveldb::WriteOptions(), key, value));
}

Status LevelDBDatabase::Write(const WriteBatch& batch, bool sync) {
    leveldb::WriteBatch updates;
    for (const auto& [key, value] : batch.Puts()) {
        updates.Put(key, value);
    }
    leveldb::WriteOptions options;
    options.sync = sync;
    return FromLevelDB(db_->Write(options, &updates));
}

Status LevelDBDatabase::Scan(const std::string& prefix, const Visitor& visit) const {
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid() && HasPrefix(it->key(), prefix); it->Next()) {
        Status s = visit(it->key().ToString(), it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    return FromLevelDB(it->status());
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const std::string& key, std::string* value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return Status::NotFound(key);
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteBatch& batch, bool) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : batch.Puts()) {
        data_[key] = value;
    }
    return Status::Ok();
}

Status MemoryDatabase::Scan(const std::string& prefix, const Visitor& visit) const {
    std::vector<std::pair<std::string, std::string>> range;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = data_.lower_bound(prefix);
             it != data_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
            range.push_back(*it);
        }
    }
    for (const auto& [key, value] : range) {
        Status s = visit(key, value);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::Ok();
}

} // namespace db
} // namespace revguard
