// REVGUARD - Ledger Store
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Persists the pool and engine state on the key-value database:
//   'U' + account                 -> underwriter triple
//   'A' + venue id                -> venue assignment
//   'S' + venue id + account      -> venue stake
//   'E' + venue id                -> engine state (without reports)
//   'R' + venue id + month        -> monthly report
// Records are only ever overwritten, never deleted.

#ifndef REVGUARD_STORE_LEDGER_STORE_H
#define REVGUARD_STORE_LEDGER_STORE_H

#include "revguard/db/database.h"
#include "revguard/guarantee/engine.h"
#include "revguard/guarantee/pool.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace revguard {
namespace store {

/// Record layout version written under 'M' + "version"
constexpr uint32_t LEDGER_STORE_VERSION = 1;

/// Record keys. Integers are big-endian so keys sort numerically.
namespace key {

constexpr char UNDERWRITER = 'U';
constexpr char ASSIGNMENT = 'A';
constexpr char VENUE_STAKE = 'S';
constexpr char ENGINE = 'E';
constexpr char REPORT = 'R';
constexpr char META = 'M';

/// `prefix` + venue id
std::string Venue(char prefix, VenueId venueId);
std::string Underwriter(const AccountId& id);
std::string Stake(VenueId venueId, const AccountId& id);
std::string Report(VenueId venueId, uint32_t month);
std::string Version();

} // namespace key

class LedgerStore {
public:
    /// Wrap an open database
    explicit LedgerStore(std::unique_ptr<db::Database> db);

    /// Open or create a LevelDB-backed store at `path`
    static std::pair<db::Status, std::unique_ptr<LedgerStore>> Open(
        const std::filesystem::path& path,
        const db::Options& options = db::Options());

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    // ========================================================================
    // Whole-component state (atomic batches)
    // ========================================================================

    db::Status SavePool(const guarantee::PoolSnapshot& snapshot);

    /// Missing records yield an empty snapshot
    db::Status LoadPool(guarantee::PoolSnapshot& snapshot) const;

    db::Status SaveEngine(const guarantee::EngineSnapshot& snapshot);

    /// NotFound if no engine state was saved for the venue
    db::Status LoadEngine(VenueId venueId, guarantee::EngineSnapshot& snapshot) const;

    /// Venues with saved engine state, ascending
    std::vector<VenueId> ListEngines() const;

    // ========================================================================
    // Single records
    // ========================================================================

    db::Status ReadUnderwriter(const AccountId& id, guarantee::Underwriter& out) const;

    db::Status ReadAssignment(VenueId venueId, guarantee::VenueAssignment& out) const;

    db::Status ReadReport(VenueId venueId, uint32_t month, guarantee::MonthlyReport& out) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t GetWriteCount() const { return nWrites_; }

    db::Database& GetDatabase() { return *db_; }

private:
    db::Status CommitBatch(db::WriteBatch& batch);

    /// Check or stamp the layout version
    db::Status CheckVersion();

    template<typename T>
    db::Status ReadRecord(const std::string& key, T& out) const;

    std::unique_ptr<db::Database> db_;
    std::atomic<uint64_t> nWrites_{0};
};

} // namespace store
} // namespace revguard

#endif // REVGUARD_STORE_LEDGER_STORE_H
