// REVGUARD - Database Abstraction Layer
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Ordered key-value store the ledger is persisted on. The on-disk backend is
// LevelDB; MemoryDatabase serves tests and dry runs. Records are only added
// or overwritten, so the interface has no delete.

#ifndef REVGUARD_DB_DATABASE_H
#define REVGUARD_DB_DATABASE_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace revguard {
namespace db {

/// Outcome of a database operation
class Status {
public:
    enum class Code { Ok, NotFound, Corruption, NotSupported, IOError };

    Status() = default;

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(Code::NotFound, std::move(msg)); }
    static Status Corruption(std::string msg) { return Status(Code::Corruption, std::move(msg)); }
    static Status NotSupported(std::string msg) { return Status(Code::NotSupported, std::move(msg)); }
    static Status IOError(std::string msg) { return Status(Code::IOError, std::move(msg)); }

    bool ok() const { return code_ == Code::Ok; }
    bool IsNotFound() const { return code_ == Code::NotFound; }
    bool IsCorruption() const { return code_ == Code::Corruption; }
    bool IsNotSupported() const { return code_ == Code::NotSupported; }
    bool IsIOError() const { return code_ == Code::IOError; }

    Code code() const { return code_; }

    /// "OK", or "<Code>: <message>"
    std::string ToString() const;

private:
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    Code code_{Code::Ok};
    std::string message_;
};

/// Puts applied together by Database::Write
class WriteBatch {
public:
    void Put(std::string key, std::string value) {
        puts_.emplace_back(std::move(key), std::move(value));
    }

    size_t Count() const { return puts_.size(); }

    /// In insertion order; a later put of the same key wins
    const std::vector<std::pair<std::string, std::string>>& Puts() const { return puts_; }

private:
    std::vector<std::pair<std::string, std::string>> puts_;
};

class Database {
public:
    /// Called per record during Scan; a non-OK result stops the scan
    using Visitor = std::function<Status(const std::string& key, const std::string& value)>;

    virtual ~Database() = default;

    /// NotFound when the key is absent
    virtual Status Get(const std::string& key, std::string* value) const = 0;

    virtual Status Put(const std::string& key, const std::string& value) = 0;

    /// Apply every put of `batch` atomically. With `sync` the write reaches
    /// stable storage before returning.
    virtual Status Write(const WriteBatch& batch, bool sync) = 0;

    /// Visit records whose key starts with `prefix`, in ascending key order.
    /// Returns the first non-OK visitor result, else the backend's status.
    virtual Status Scan(const std::string& prefix, const Visitor& visit) const = 0;
};

struct Options {
    bool createIfMissing = true;
    /// LevelDB block cache; 0 keeps LevelDB's default
    size_t cacheBytes = 8 << 20;
    /// Bloom filter bits per key; 0 disables the filter
    int bloomBitsPerKey = 10;
};

/// Open or create a LevelDB database at `path`
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path, const Options& options = Options());

} // namespace db
} // namespace revguard

#endif // REVGUARD_DB_DATABASE_H
