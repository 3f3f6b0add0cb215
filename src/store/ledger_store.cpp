// REVGUARD - Ledger Store Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/store/ledger_store.h"
#include "revguard/core/serialize.h"
#include "revguard/util/logging.h"

namespace revguard {

// ============================================================================
// Record Serialization
// ============================================================================

namespace guarantee {

void Encode(RecordWriter& s, const Underwriter& u) {
    s << u.totalStake << u.availableStake << u.lockedStake;
}

void Decode(RecordReader& s, Underwriter& u) {
    s >> u.totalStake >> u.availableStake >> u.lockedStake;
}

void Encode(RecordWriter& s, const VenueStake& v) {
    s << v.stake << v.liabilityPaid << v.feeClaimed;
}

void Decode(RecordReader& s, VenueStake& v) {
    s >> v.stake >> v.liabilityPaid >> v.feeClaimed;
}

void Encode(RecordWriter& s, const VenueAssignment& a) {
    s << a.venueId << a.roster << a.totalStakeCommitted << a.fee << a.promisedRevenue
      << a.endDate << a.active << a.totalLiabilitySettled << a.settlementResidual
      << a.claimsPaid;
}

void Decode(RecordReader& s, VenueAssignment& a) {
    s >> a.venueId >> a.roster >> a.totalStakeCommitted >> a.fee >> a.promisedRevenue
      >> a.endDate >> a.active >> a.totalLiabilitySettled >> a.settlementResidual
      >> a.claimsPaid;
}

void Encode(RecordWriter& s, const MonthlyReport& r) {
    s << r.month << r.expectedRevenue << r.actualRevenue << r.missingRevenue
      << r.liabilityPaid << r.timestamp;
}

void Decode(RecordReader& s, MonthlyReport& r) {
    s >> r.month >> r.expectedRevenue >> r.actualRevenue >> r.missingRevenue
      >> r.liabilityPaid >> r.timestamp;
}

void Encode(RecordWriter& s, const EngineUnderwriter& m) {
    s << m.address << m.stake << m.approved << m.feeClaimed;
}

void Decode(RecordReader& s, EngineUnderwriter& m) {
    s >> m.address >> m.stake >> m.approved >> m.feeClaimed;
}

/// Engine state without its reports, which are stored one record per month
void Encode(RecordWriter& s, const EngineSnapshot& e) {
    s << e.venueId << e.currentMonth << e.startTime
      << e.totalExpected << e.totalCollected << e.totalLiabilityPaid
      << e.roster << e.totalStake
      << e.feeAmount << e.feeDeposited << e.escrowDeposited << e.escrowBalance
      << e.feesDistributed << e.totalOwnerDeposits;
    WriteCount(s, e.ownerDeposits.size());
    for (const auto& [month, amount] : e.ownerDeposits) {
        s << month << amount;
    }
    s << e.operators;
}

void Decode(RecordReader& s, EngineSnapshot& e) {
    s >> e.venueId >> e.currentMonth >> e.startTime
      >> e.totalExpected >> e.totalCollected >> e.totalLiabilityPaid
      >> e.roster >> e.totalStake
      >> e.feeAmount >> e.feeDeposited >> e.escrowDeposited >> e.escrowBalance
      >> e.feesDistributed >> e.totalOwnerDeposits;
    e.ownerDeposits.clear();
    uint32_t count = ReadCount(s);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t month = 0;
        Amount amount = 0;
        s >> month >> amount;
        e.ownerDeposits[month] = amount;
    }
    s >> e.operators;
}

} // namespace guarantee

namespace store {

namespace LogCategory = util::LogCategory;

// ============================================================================
// Keys
// ============================================================================

namespace key {

namespace {

template<typename UInt>
void AppendBigEndian(std::string& key, UInt value) {
    for (size_t i = sizeof(UInt); i-- > 0;) {
        key.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void AppendAccount(std::string& key, const AccountId& id) {
    key.append(reinterpret_cast<const char*>(id.data()), AccountId::SIZE);
}

} // namespace

std::string Venue(char prefix, VenueId venueId) {
    std::string key(1, prefix);
    AppendBigEndian(key, venueId);
    return key;
}

std::string Version() {
    return std::string(1, META) + "version";
}

std::string Underwriter(const AccountId& id) {
    std::string key(1, UNDERWRITER);
    AppendAccount(key, id);
    return key;
}

std::string Stake(VenueId venueId, const AccountId& id) {
    std::string key = Venue(VENUE_STAKE, venueId);
    AppendAccount(key, id);
    return key;
}

std::string Report(VenueId venueId, uint32_t month) {
    std::string key = Venue(REPORT, venueId);
    AppendBigEndian(key, month);
    return key;
}

} // namespace key

namespace {

constexpr size_t VENUE_KEY_SIZE = 1 + sizeof(VenueId);
constexpr size_t ACCOUNT_KEY_SIZE = 1 + AccountId::SIZE;
constexpr size_t STAKE_KEY_SIZE = VENUE_KEY_SIZE + AccountId::SIZE;
constexpr size_t REPORT_KEY_SIZE = VENUE_KEY_SIZE + sizeof(uint32_t);

VenueId ReadVenueId(const std::string& key) {
    VenueId venueId = 0;
    for (size_t i = 1; i < VENUE_KEY_SIZE; ++i) {
        venueId = (venueId << 8) | static_cast<uint8_t>(key[i]);
    }
    return venueId;
}

AccountId ReadAccount(const std::string& key, size_t offset) {
    return AccountId(reinterpret_cast<const Byte*>(key.data() + offset), AccountId::SIZE);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

LedgerStore::LedgerStore(std::unique_ptr<db::Database> db) : db_(std::move(db)) {}

std::pair<db::Status, std::unique_ptr<LedgerStore>> LedgerStore::Open(
    const std::filesystem::path& path, const db::Options& options) {
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        LOG_ERROR(LogCategory::STORE) << "cannot open ledger at " << path.string()
                                      << ": " << status.ToString();
        return {status, nullptr};
    }

    auto store = std::make_unique<LedgerStore>(std::move(database));
    db::Status s = store->CheckVersion();
    if (!s.ok()) {
        LOG_ERROR(LogCategory::STORE) << "ledger at " << path.string() << ": " << s.ToString();
        return {s, nullptr};
    }
    LOG_INFO(LogCategory::STORE) << "ledger opened at " << path.string();
    return {db::Status::Ok(), std::move(store)};
}

db::Status LedgerStore::CheckVersion() {
    std::string value;
    db::Status s = db_->Get(key::Version(), &value);
    if (s.IsNotFound()) {
        return db_->Put(key::Version(), ToBytes(LEDGER_STORE_VERSION));
    }
    if (!s.ok()) {
        return s;
    }
    uint32_t version = 0;
    if (!FromBytes(value, version)) {
        return db::Status::Corruption("unreadable ledger version");
    }
    if (version != LEDGER_STORE_VERSION) {
        return db::Status::NotSupported("ledger version " + std::to_string(version));
    }
    return db::Status::Ok();
}

db::Status LedgerStore::CommitBatch(db::WriteBatch& batch) {
    batch.Put(key::Version(), ToBytes(LEDGER_STORE_VERSION));
    db::Status s = db_->Write(batch, true);
    if (!s.ok()) {
        LOG_ERROR(LogCategory::STORE) << "batch write failed: " << s.ToString();
        return s;
    }
    nWrites_ += batch.Count();
    return s;
}

template<typename T>
db::Status LedgerStore::ReadRecord(const std::string& key, T& out) const {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (!s.ok()) {
        return s;
    }
    if (!FromBytes(value, out)) {
        return db::Status::Corruption("malformed record");
    }
    return db::Status::Ok();
}

// ============================================================================
// Pool
// ============================================================================

db::Status LedgerStore::SavePool(const guarantee::PoolSnapshot& snapshot) {
    db::WriteBatch batch;
    for (const auto& [id, u] : snapshot.underwriters) {
        batch.Put(key::Underwriter(id), ToBytes(u));
    }
    for (const auto& [venueId, a] : snapshot.assignments) {
        batch.Put(key::Venue(key::ASSIGNMENT, venueId), ToBytes(a));
    }
    for (const auto& [ids, vs] : snapshot.venueStakes) {
        batch.Put(key::Stake(ids.first, ids.second), ToBytes(vs));
    }
    db::Status s = CommitBatch(batch);
    if (s.ok()) {
        LOG_DEBUG(LogCategory::STORE) << "saved pool: " << snapshot.underwriters.size()
                                      << " underwriters, " << snapshot.assignments.size()
                                      << " assignments";
    }
    return s;
}

db::Status LedgerStore::LoadPool(guarantee::PoolSnapshot& snapshot) const {
    guarantee::PoolSnapshot loaded;

    db::Status s = db_->Scan(std::string(1, key::UNDERWRITER),
        [&](const std::string& k, const std::string& value) {
            guarantee::Underwriter u;
            if (k.size() != ACCOUNT_KEY_SIZE || !FromBytes(value, u) || !u.IsConsistent()) {
                return db::Status::Corruption("bad underwriter record");
            }
            loaded.underwriters[ReadAccount(k, 1)] = u;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    s = db_->Scan(std::string(1, key::ASSIGNMENT),
        [&](const std::string& k, const std::string& value) {
            guarantee::VenueAssignment a;
            if (k.size() != VENUE_KEY_SIZE || !FromBytes(value, a)) {
                return db::Status::Corruption("bad assignment record");
            }
            loaded.assignments[ReadVenueId(k)] = a;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    s = db_->Scan(std::string(1, key::VENUE_STAKE),
        [&](const std::string& k, const std::string& value) {
            guarantee::VenueStake vs;
            if (k.size() != STAKE_KEY_SIZE || !FromBytes(value, vs)) {
                return db::Status::Corruption("bad venue stake record");
            }
            loaded.venueStakes[{ReadVenueId(k), ReadAccount(k, VENUE_KEY_SIZE)}] = vs;
            return db::Status::Ok();
        });
    if (!s.ok()) return s;

    snapshot = std::move(loaded);
    return db::Status::Ok();
}

// ============================================================================
// Engines
// ============================================================================

db::Status LedgerStore::SaveEngine(const guarantee::EngineSnapshot& snapshot) {
    db::WriteBatch batch;
    batch.Put(key::Venue(key::ENGINE, snapshot.venueId), ToBytes(snapshot));
    for (const auto& [month, report] : snapshot.reports) {
        batch.Put(key::Report(snapshot.venueId, month), ToBytes(report));
    }
    db::Status s = CommitBatch(batch);
    if (s.ok()) {
        LOG_DEBUG(LogCategory::STORE) << "saved engine of venue " << snapshot.venueId
                                      << " with " << snapshot.reports.size() << " reports";
    }
    return s;
}

db::Status LedgerStore::LoadEngine(VenueId venueId, guarantee::EngineSnapshot& snapshot) const {
    guarantee::EngineSnapshot loaded;
    db::Status s = ReadRecord(key::Venue(key::ENGINE, venueId), loaded);
    if (!s.ok()) {
        return s;
    }
    if (loaded.venueId != venueId) {
        return db::Status::Corruption("engine record of venue " + std::to_string(loaded.venueId) +
                                      " stored under venue " + std::to_string(venueId));
    }

    s = db_->Scan(key::Venue(key::REPORT, venueId),
        [&](const std::string& k, const std::string& value) {
            guarantee::MonthlyReport report;
            if (k.size() != REPORT_KEY_SIZE || !FromBytes(value, report)) {
                return db::Status::Corruption("bad report record");
            }
            loaded.reports[report.month] = report;
            return db::Status::Ok();
        });
    if (!s.ok()) {
        return s;
    }

    snapshot = std::move(loaded);
    return db::Status::Ok();
}

std::vector<VenueId> LedgerStore::ListEngines() const {
    std::vector<VenueId> venues;
    db::Status s = db_->Scan(std::string(1, key::ENGINE),
        [&](const std::string& k, const std::string&) {
            if (k.size() == VENUE_KEY_SIZE) {
                venues.push_back(ReadVenueId(k));
            }
            return db::Status::Ok();
        });
    if (!s.ok()) {
        LOG_WARN(LogCategory::STORE) << "engine listing incomplete: " << s.ToString();
    }
    return venues;
}

// ============================================================================
// Single records
// ============================================================================

db::Status LedgerStore::ReadUnderwriter(const AccountId& id, guarantee::Underwriter& out) const {
    return ReadRecord(key::Underwriter(id), out);
}

db::Status LedgerStore::ReadAssignment(VenueId venueId, guarantee::VenueAssignment& out) const {
    return ReadRecord(key::Venue(key::ASSIGNMENT, venueId), out);
}

db::Status LedgerStore::ReadReport(VenueId venueId, uint32_t month,
                                   guarantee::MonthlyReport& out) const {
    return ReadRecord(key::Report(venueId, month), out);
}

} // namespace store
} // namespace revguard
