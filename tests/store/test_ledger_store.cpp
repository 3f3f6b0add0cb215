// REVGUARD - Ledger Store Tests
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include "revguard/core/serialize.h"
#include "revguard/db/database.h"
#include "revguard/db/leveldb.h"
#include "revguard/store/ledger_store.h"

#include <filesystem>
#include <random>

using namespace revguard;
using namespace revguard::store;
using guarantee::EngineSnapshot;
using guarantee::EngineUnderwriter;
using guarantee::MonthlyReport;
using guarantee::PoolSnapshot;
using guarantee::Underwriter;
using guarantee::VenueAssignment;
using guarantee::VenueStake;

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<LedgerStore>(std::make_unique<db::MemoryDatabase>());
    }

    PoolSnapshot SamplePool() const {
        PoolSnapshot s;
        s.underwriters[alice_] = Underwriter{940, 400, 540};
        s.underwriters[bob_] = Underwriter{270, 0, 270};

        VenueAssignment a;
        a.venueId = 1;
        a.roster = {alice_, bob_};
        a.totalStakeCommitted = 900;
        a.fee = 90;
        a.promisedRevenue = 900;
        a.endDate = 1707776000;
        a.active = true;
        a.totalLiabilitySettled = 90;
        a.settlementResidual = 1;
        s.assignments[1] = a;

        s.venueStakes[{1, alice_}] = VenueStake{600, 60, false};
        s.venueStakes[{1, bob_}] = VenueStake{300, 30, true};
        return s;
    }

    EngineSnapshot SampleEngine(VenueId venueId) const {
        EngineSnapshot s;
        s.venueId = venueId;
        s.currentMonth = 3;
        s.startTime = 1700000000;
        s.totalExpected = 1800;
        s.totalCollected = 1710;
        s.totalLiabilityPaid = 90;
        s.roster = {EngineUnderwriter{alice_, 600, true, false},
                    EngineUnderwriter{bob_, 400, false, false}};
        s.totalStake = 1000;
        s.feeAmount = 100;
        s.feeDeposited = true;
        s.escrowDeposited = 100;
        s.escrowBalance = 100;
        s.totalOwnerDeposits = 50;
        s.ownerDeposits[2] = 50;
        s.operators = {AccountIdFromLabel("operator")};

        MonthlyReport r1{1, 900, 900, 0, false, 1700000000};
        MonthlyReport r2{2, 900, 810, 90, true, 1702592000};
        s.reports[1] = r1;
        s.reports[2] = r2;
        return s;
    }

    std::unique_ptr<LedgerStore> store_;
    AccountId alice_{AccountIdFromLabel("alice")};
    AccountId bob_{AccountIdFromLabel("bob")};
};

// ============================================================================
// Pool
// ============================================================================

TEST_F(LedgerStoreTest, PoolRoundTrip) {
    PoolSnapshot saved = SamplePool();
    ASSERT_TRUE(store_->SavePool(saved).ok());

    PoolSnapshot loaded;
    ASSERT_TRUE(store_->LoadPool(loaded).ok());
    EXPECT_TRUE(loaded.underwriters == saved.underwriters);
    EXPECT_TRUE(loaded.assignments == saved.assignments);
    EXPECT_TRUE(loaded.venueStakes == saved.venueStakes);
    EXPECT_GT(store_->GetWriteCount(), 0u);
}

TEST_F(LedgerStoreTest, EmptyStoreLoadsEmptyPool) {
    PoolSnapshot loaded;
    ASSERT_TRUE(store_->LoadPool(loaded).ok());
    EXPECT_TRUE(loaded.underwriters.empty());
    EXPECT_TRUE(loaded.assignments.empty());
}

TEST_F(LedgerStoreTest, ReadSingleRecords) {
    ASSERT_TRUE(store_->SavePool(SamplePool()).ok());

    Underwriter u;
    ASSERT_TRUE(store_->ReadUnderwriter(alice_, u).ok());
    EXPECT_EQ(u.lockedStake, 540);
    EXPECT_TRUE(u.IsConsistent());

    VenueAssignment a;
    ASSERT_TRUE(store_->ReadAssignment(1, a).ok());
    EXPECT_EQ(a.roster.size(), 2u);
    EXPECT_EQ(a.settlementResidual, 1);

    EXPECT_TRUE(store_->ReadUnderwriter(AccountIdFromLabel("carol"), u).IsNotFound());
    EXPECT_TRUE(store_->ReadAssignment(2, a).IsNotFound());
}

TEST_F(LedgerStoreTest, SaveOverwrites) {
    PoolSnapshot s = SamplePool();
    ASSERT_TRUE(store_->SavePool(s).ok());
    s.underwriters[alice_] = Underwriter{1000, 1000, 0};
    ASSERT_TRUE(store_->SavePool(s).ok());

    Underwriter u;
    ASSERT_TRUE(store_->ReadUnderwriter(alice_, u).ok());
    EXPECT_EQ(u.availableStake, 1000);
}

TEST_F(LedgerStoreTest, MalformedRecordIsCorruption) {
    ASSERT_TRUE(store_->GetDatabase().Put(key::Venue(key::ASSIGNMENT, 7), "junk").ok());

    VenueAssignment a;
    EXPECT_TRUE(store_->ReadAssignment(7, a).IsCorruption());

    PoolSnapshot loaded;
    EXPECT_FALSE(store_->LoadPool(loaded).ok());
}

TEST_F(LedgerStoreTest, KeysSortNumerically) {
    EXPECT_LT(key::Venue(key::ENGINE, 255), key::Venue(key::ENGINE, 256));
    EXPECT_LT(key::Report(1, 255), key::Report(1, 256));
    EXPECT_LT(key::Report(1, 0xFFFFFFFF), key::Venue(key::REPORT, 2));
    EXPECT_EQ(key::Venue(key::ASSIGNMENT, 1).size(), 9u);
    EXPECT_EQ(key::Stake(1, alice_).size(), 9u + AccountId::SIZE);
}

// ============================================================================
// Engines
// ============================================================================

TEST_F(LedgerStoreTest, EngineRoundTrip) {
    EngineSnapshot saved = SampleEngine(1);
    ASSERT_TRUE(store_->SaveEngine(saved).ok());

    EngineSnapshot loaded;
    ASSERT_TRUE(store_->LoadEngine(1, loaded).ok());
    EXPECT_EQ(loaded.venueId, 1u);
    EXPECT_EQ(loaded.currentMonth, 3u);
    EXPECT_EQ(loaded.startTime, saved.startTime);
    EXPECT_TRUE(loaded.roster == saved.roster);
    EXPECT_EQ(loaded.escrowBalance, 100);
    EXPECT_TRUE(loaded.feeDeposited);
    EXPECT_EQ(loaded.ownerDeposits, saved.ownerDeposits);
    EXPECT_EQ(loaded.operators, saved.operators);
    EXPECT_TRUE(loaded.reports == saved.reports);

    MonthlyReport r;
    ASSERT_TRUE(store_->ReadReport(1, 2, r).ok());
    EXPECT_EQ(r.missingRevenue, 90);
    EXPECT_TRUE(r.liabilityPaid);
    EXPECT_TRUE(store_->ReadReport(1, 3, r).IsNotFound());
}

TEST_F(LedgerStoreTest, EngineNotFound) {
    EngineSnapshot loaded;
    EXPECT_TRUE(store_->LoadEngine(5, loaded).IsNotFound());
}

TEST_F(LedgerStoreTest, ReportsStayWithTheirVenue) {
    ASSERT_TRUE(store_->SaveEngine(SampleEngine(1)).ok());
    EngineSnapshot other = SampleEngine(2);
    other.reports.erase(2);
    ASSERT_TRUE(store_->SaveEngine(other).ok());

    EngineSnapshot loaded;
    ASSERT_TRUE(store_->LoadEngine(2, loaded).ok());
    EXPECT_EQ(loaded.reports.size(), 1u);
    ASSERT_TRUE(store_->LoadEngine(1, loaded).ok());
    EXPECT_EQ(loaded.reports.size(), 2u);
}

TEST_F(LedgerStoreTest, ListEngines) {
    EXPECT_TRUE(store_->ListEngines().empty());
    ASSERT_TRUE(store_->SaveEngine(SampleEngine(3)).ok());
    ASSERT_TRUE(store_->SaveEngine(SampleEngine(1)).ok());
    ASSERT_TRUE(store_->SavePool(SamplePool()).ok());

    EXPECT_EQ(store_->ListEngines(), (std::vector<VenueId>{1, 3}));
}

// ============================================================================
// On-disk Store
// ============================================================================

class LedgerStoreDiskTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        dir_ = std::filesystem::temp_directory_path() /
               ("revguard_ledger_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(LedgerStoreDiskTest, ReopenKeepsState) {
    PoolSnapshot saved;
    saved.underwriters[AccountIdFromLabel("alice")] = Underwriter{10, 10, 0};
    {
        auto [status, store] = LedgerStore::Open(dir_);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(store->SavePool(saved).ok());
    }

    auto [status, store] = LedgerStore::Open(dir_);
    ASSERT_TRUE(status.ok()) << status.ToString();
    PoolSnapshot loaded;
    ASSERT_TRUE(store->LoadPool(loaded).ok());
    EXPECT_TRUE(loaded.underwriters == saved.underwriters);
}

TEST_F(LedgerStoreDiskTest, RejectsUnknownVersion) {
    {
        auto [status, database] = db::OpenDatabase(dir_);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(database->Put(key::Version(), ToBytes(uint32_t{LEDGER_STORE_VERSION + 1})).ok());
    }

    auto [status, store] = LedgerStore::Open(dir_);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(store, nullptr);
}
