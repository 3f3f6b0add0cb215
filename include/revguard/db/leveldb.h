// REVGUARD - Database Backends
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// LevelDB implementation of the database interface, and an in-memory
// implementation with the same ordering semantics.

#ifndef REVGUARD_DB_LEVELDB_H
#define REVGUARD_DB_LEVELDB_H

#include "revguard/db/database.h"

#include <map>
#include <mutex>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

namespace revguard {
namespace db {

class LevelDBDatabase : public Database {
public:
    static std::pair<Status, std::unique_ptr<Database>> Open(
        const std::filesystem::path& path, const Options& options);

    ~LevelDBDatabase() override;

    Status Get(const std::string& key, std::string* value) const override;
    Status Put(const std::string& key, const std::string& value) override;
    Status Write(const WriteBatch& batch, bool sync) override;
    Status Scan(const std::string& prefix, const Visitor& visit) const override;

private:
    LevelDBDatabase(std::unique_ptr<leveldb::Cache> cache,
                    std::unique_ptr<const leveldb::FilterPolicy> filter);

    // Declared first so they are destroyed after db_, which references them
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::unique_ptr<leveldb::DB> db_;
};

/**
 * Ordered in-memory store. Scan visits a copy of the matching range, so a
 * visitor may write to the database without affecting the scan.
 */
class MemoryDatabase : public Database {
public:
    Status Get(const std::string& key, std::string* value) const override;
    Status Put(const std::string& key, const std::string& value) override;
    Status Write(const WriteBatch& batch, bool sync) override;
    Status Scan(const std::string& prefix, const Visitor& visit) const override;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace revguard

#endif // REVGUARD_DB_LEVELDB_H
