// REVGUARD - Database Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/db/database.h"
#include "revguard/db/leveldb.h"

namespace revguard {
namespace db {

std::string Status::ToString() const {
    switch (code_) {
        case Code::Ok: return "OK";
        case Code::NotFound: return "NotFound: " + message_;
        case Code::Corruption: return "Corruption: " + message_;
        case Code::NotSupported: return "NotSupported: " + message_;
        case Code::IOError: return "IOError: " + message_;
    }
    return "Unknown: " + message_;
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path, const Options& options) {
    return LevelDBDatabase::Open(path, options);
}

} // namespace db
} // namespace revguard
