// REVGUARD - Guarantee Engine Tests
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include <gtest/gtest.h>
#include <revguard/guarantee/collateral.h>
#include <revguard/guarantee/engine.h>
#include <revguard/guarantee/pool.h>
#include <revguard/guarantee/registry.h>
#include <revguard/util/time.h>

#include <memory>

using namespace revguard;
using namespace revguard::guarantee;

// ============================================================================
// Test Fixture
// ============================================================================

class EngineTest : public ::testing::Test {
protected:
    static constexpr Timestamp START_TIME = 1700000000;
    static constexpr uint32_t MONTHS = 3;

    void SetUp() override {
        util::SetMockTime(START_TIME);
        util::EnableMockTime();

        pool_ = std::make_unique<UnderwriterPool>(poolAddr_, registry_, token_, journal_, params_);
        vault_ = std::make_shared<RevenueVault>(vaultAddr_, 900, MONTHS, journal_);
        venueId_ = registry_.RegisterVenue(owner_, vault_, engineAddr_);
        roles_ = std::make_unique<RoleConfig>(admin_);
        engine_ = CreateEngine(*roles_);
    }

    void TearDown() override {
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    std::unique_ptr<GuaranteeEngine> CreateEngine(RoleConfig& roles) {
        return std::make_unique<GuaranteeEngine>(venueId_, engineAddr_, roles, registry_,
                                                 *pool_, token_, journal_, params_);
    }

    void Fund(const AccountId& who, Amount amount, const AccountId& spender) {
        token_.Mint(who, amount);
        token_.Approve(who, spender, token_.Allowance(who, spender) + amount);
    }

    void RegisterInPool(const AccountId& who, Amount amount) {
        Fund(who, amount, poolAddr_);
        pool_->Register(who, amount);
    }

    /// alice 600 / bob 400 on the engine roster
    void BuildRoster() {
        RegisterInPool(alice_, 1000);
        RegisterInPool(bob_, 1000);
        engine_->AddUnderwriter(admin_, alice_, 600);
        engine_->AddUnderwriter(admin_, bob_, 400);
    }

    void FundEscrow(Amount fee) {
        engine_->SetFeeAmount(owner_, fee);
        Fund(owner_, fee, engineAddr_);
        engine_->DepositFee(owner_);
    }

    /// Pool assignment alice 600 / bob 300 backing the venue's promise of 900
    void AssignPool() {
        RegisterInPool(alice_, 1000);
        RegisterInPool(bob_, 300);
        pool_->AssignToVenue(owner_, venueId_, {{alice_, 600}, {bob_, 300}}, 0);
    }

    void ExpectStake(const AccountId& who, Amount total, Amount available, Amount locked) {
        auto u = pool_->GetUnderwriter(who);
        ASSERT_TRUE(u.has_value());
        EXPECT_EQ(u->totalStake, total);
        EXPECT_EQ(u->availableStake, available);
        EXPECT_EQ(u->lockedStake, locked);
    }

    void Mature() {
        util::AdvanceMockTime(util::Seconds(params_.Duration(MONTHS)));
    }

    ProtocolParams params_;
    Journal journal_;
    CollateralToken token_{journal_};
    VenueRegistry registry_;
    std::unique_ptr<UnderwriterPool> pool_;
    std::shared_ptr<RevenueVault> vault_;
    VenueId venueId_{0};
    std::unique_ptr<RoleConfig> roles_;
    std::unique_ptr<GuaranteeEngine> engine_;

    AccountId admin_{AccountIdFromLabel("admin")};
    AccountId operator_{AccountIdFromLabel("operator")};
    AccountId owner_{AccountIdFromLabel("owner")};
    AccountId poolAddr_{AccountIdFromLabel("pool")};
    AccountId engineAddr_{AccountIdFromLabel("venue-1/engine")};
    AccountId vaultAddr_{AccountIdFromLabel("venue-1/vault")};
    AccountId alice_{AccountIdFromLabel("alice")};
    AccountId bob_{AccountIdFromLabel("bob")};
    AccountId carol_{AccountIdFromLabel("carol")};
};

// ============================================================================
// Construction and Roles
// ============================================================================

TEST_F(EngineTest, UnknownVenueRejected) {
    EXPECT_THROW(GuaranteeEngine(42, engineAddr_, *roles_, registry_, *pool_, token_,
                                 journal_, params_),
                 NotFoundError);
}

TEST_F(EngineTest, AdminIsOperator) {
    EXPECT_TRUE(engine_->IsOperator(admin_));
    EXPECT_FALSE(engine_->IsOperator(operator_));
    EXPECT_EQ(engine_->GetVenueId(), venueId_);
    EXPECT_EQ(engine_->GetCurrentMonth(), 1u);
}

TEST_F(EngineTest, OperatorManagement) {
    EXPECT_THROW(engine_->AddOperator(operator_, operator_), AuthorizationError);

    engine_->AddOperator(admin_, operator_);
    EXPECT_TRUE(engine_->IsOperator(operator_));
    EXPECT_THROW(engine_->AddOperator(admin_, operator_), StateError);
    EXPECT_EQ(engine_->SubmitMonthlyReport(operator_, 900), 1u);

    EXPECT_THROW(engine_->RemoveOperator(operator_, operator_), AuthorizationError);
    EXPECT_THROW(engine_->RemoveOperator(admin_, admin_), ValidationError);
    engine_->RemoveOperator(admin_, operator_);
    EXPECT_FALSE(engine_->IsOperator(operator_));
    EXPECT_THROW(engine_->RemoveOperator(admin_, operator_), NotFoundError);
    EXPECT_THROW(engine_->SubmitMonthlyReport(operator_, 900), AuthorizationError);
}

// ============================================================================
// Fee Escrow
// ============================================================================

TEST_F(EngineTest, SetFeeAmountOwnerOnly) {
    EXPECT_THROW(engine_->SetFeeAmount(admin_, 100), NotVenueOwnerError);
    EXPECT_THROW(engine_->SetFeeAmount(owner_, -1), ValidationError);
    engine_->SetFeeAmount(owner_, 100);
    EXPECT_EQ(engine_->GetFeeAmount(), 100);
}

TEST_F(EngineTest, DepositFeePreconditions) {
    EXPECT_THROW(engine_->DepositFee(owner_), ValidationError);

    engine_->SetFeeAmount(owner_, 100);
    EXPECT_THROW(engine_->DepositFee(owner_), StateError);  // empty roster

    BuildRoster();
    EXPECT_THROW(engine_->DepositFee(owner_), TransferError);  // no allowance
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);

    Fund(owner_, 100, engineAddr_);
    EXPECT_THROW(engine_->DepositFee(alice_), NotVenueOwnerError);
    engine_->DepositFee(owner_);
    EXPECT_EQ(engine_->GetEscrowBalance(), 100);
    EXPECT_EQ(token_.BalanceOf(engineAddr_), 100);
    EXPECT_EQ(token_.BalanceOf(owner_), 0);

    EXPECT_THROW(engine_->DepositFee(owner_), StateError);
    EXPECT_THROW(engine_->SetFeeAmount(owner_, 200), StateError);
}

// ============================================================================
// Roster
// ============================================================================

TEST_F(EngineTest, AddUnderwriterRules) {
    RegisterInPool(alice_, 1000);

    EXPECT_THROW(engine_->AddUnderwriter(alice_, alice_, 600), AuthorizationError);
    EXPECT_THROW(engine_->AddUnderwriter(admin_, carol_, 600), AuthorizationError);
    EXPECT_THROW(engine_->AddUnderwriter(admin_, alice_, 0), ValidationError);

    engine_->AddUnderwriter(admin_, alice_, 600);
    EXPECT_THROW(engine_->AddUnderwriter(admin_, alice_, 100), StateError);

    auto member = engine_->GetUnderwriter(alice_);
    ASSERT_TRUE(member.has_value());
    EXPECT_EQ(member->stake, 600);
    EXPECT_TRUE(member->approved);
    EXPECT_FALSE(member->feeClaimed);
    EXPECT_EQ(engine_->GetRoster().size(), 1u);
}

TEST_F(EngineTest, SetUnderwriterApproval) {
    BuildRoster();
    EXPECT_THROW(engine_->SetUnderwriterApproval(admin_, carol_, false), NotFoundError);
    EXPECT_THROW(engine_->SetUnderwriterApproval(bob_, alice_, false), AuthorizationError);

    engine_->SetUnderwriterApproval(admin_, bob_, false);
    EXPECT_FALSE(engine_->GetUnderwriter(bob_)->approved);
    engine_->SetUnderwriterApproval(admin_, bob_, true);
    EXPECT_TRUE(engine_->GetUnderwriter(bob_)->approved);
}

// ============================================================================
// Reporting
// ============================================================================

TEST_F(EngineTest, ReportsAdvanceMonths) {
    EXPECT_EQ(engine_->SubmitMonthlyReport(admin_, 900), 1u);
    EXPECT_EQ(engine_->SubmitMonthlyReport(admin_, 810), 2u);
    EXPECT_EQ(engine_->SubmitMonthlyReport(admin_, 1000), 3u);
    EXPECT_EQ(engine_->GetCurrentMonth(), 4u);

    auto m2 = engine_->GetReport(2);
    ASSERT_TRUE(m2.has_value());
    EXPECT_EQ(m2->expectedRevenue, 900);
    EXPECT_EQ(m2->actualRevenue, 810);
    EXPECT_EQ(m2->missingRevenue, 90);
    EXPECT_EQ(m2->timestamp, START_TIME);
    EXPECT_FALSE(m2->liabilityPaid);

    // Over-performance is not a negative shortfall
    EXPECT_EQ(engine_->GetReport(3)->missingRevenue, 0);

    PerformanceSummary s = engine_->GetPerformanceSummary();
    EXPECT_EQ(s.totalExpected, 2700);
    EXPECT_EQ(s.totalCollected, 2710);
    EXPECT_EQ(s.totalShortfall, -10);
    EXPECT_EQ(s.totalLiabilityPaid, 0);

    EXPECT_EQ(engine_->GetReports().size(), 3u);
    EXPECT_FALSE(engine_->GetReport(4).has_value());
}

TEST_F(EngineTest, ReportRejectsNegativeRevenue) {
    EXPECT_THROW(engine_->SubmitMonthlyReport(admin_, -1), ValidationError);
    EXPECT_EQ(engine_->GetCurrentMonth(), 1u);
}

// ============================================================================
// Liability Settlement
// ============================================================================

TEST_F(EngineTest, ProcessLiabilitySettlesThroughPool) {
    AssignPool();
    engine_->SubmitMonthlyReport(admin_, 900);
    engine_->SubmitMonthlyReport(admin_, 810);

    SettlementResult r = engine_->ProcessLiability(admin_, 2);

    EXPECT_EQ(r.distributed, 90);
    ExpectStake(alice_, 940, 400, 540);
    ExpectStake(bob_, 270, 0, 270);
    EXPECT_EQ(token_.BalanceOf(vaultAddr_), 90);
    EXPECT_TRUE(engine_->GetReport(2)->liabilityPaid);
    EXPECT_EQ(engine_->GetPerformanceSummary().totalLiabilityPaid, 90);
}

TEST_F(EngineTest, ProcessLiabilityErrorOrder) {
    AssignPool();
    engine_->SubmitMonthlyReport(admin_, 900);
    engine_->SubmitMonthlyReport(admin_, 810);

    EXPECT_THROW(engine_->ProcessLiability(admin_, 5), NotFoundError);
    EXPECT_THROW(engine_->ProcessLiability(admin_, 1), NoShortfallError);
    EXPECT_THROW(engine_->ProcessLiability(alice_, 2), AuthorizationError);

    engine_->ProcessLiability(admin_, 2);
    EXPECT_THROW(engine_->ProcessLiability(admin_, 2), StateError);
    ExpectStake(alice_, 940, 400, 540);
}

TEST_F(EngineTest, FailedSettlementLeavesReportUnpaid) {
    // No pool assignment: the pool rejects the settlement
    engine_->SubmitMonthlyReport(admin_, 810);

    EXPECT_THROW(engine_->ProcessLiability(admin_, 1), NotFoundError);

    EXPECT_FALSE(engine_->GetReport(1)->liabilityPaid);
    EXPECT_EQ(engine_->GetPerformanceSummary().totalLiabilityPaid, 0);
    EXPECT_EQ(journal_.PendingCount(), 0u);
}

TEST_F(EngineTest, SettlementFromWrongEngineIdentityRejected) {
    AssignPool();
    RoleConfig roles(admin_);
    GuaranteeEngine impostor(venueId_, AccountIdFromLabel("impostor"), roles, registry_,
                             *pool_, token_, journal_, params_);
    impostor.SubmitMonthlyReport(admin_, 810);

    EXPECT_THROW(impostor.ProcessLiability(admin_, 1), AuthorizationError);
    EXPECT_FALSE(impostor.GetReport(1)->liabilityPaid);
    ExpectStake(alice_, 1000, 400, 600);
}

// ============================================================================
// Owner Deposits
// ============================================================================

TEST_F(EngineTest, OwnerDepositReachesVault) {
    Fund(owner_, 500, engineAddr_);

    EXPECT_THROW(engine_->OwnerDepositRevenue(admin_, 1, 100), NotVenueOwnerError);
    EXPECT_THROW(engine_->OwnerDepositRevenue(owner_, 0, 100), ValidationError);
    EXPECT_THROW(engine_->OwnerDepositRevenue(owner_, 1, 0), ValidationError);

    engine_->OwnerDepositRevenue(owner_, 1, 300);
    engine_->OwnerDepositRevenue(owner_, 1, 100);
    engine_->OwnerDepositRevenue(owner_, 2, 100);

    EXPECT_EQ(token_.BalanceOf(vaultAddr_), 500);
    EXPECT_EQ(vault_->GetDeposits(1), 400);
    EXPECT_EQ(vault_->GetTotalDeposits(), 500);
    EXPECT_EQ(engine_->GetOwnerDeposits(1), 400);
    EXPECT_EQ(engine_->GetOwnerDeposits(3), 0);
    EXPECT_EQ(engine_->GetTotalOwnerDeposits(), 500);

    // Deposits do not touch the reported figures
    EXPECT_EQ(engine_->GetPerformanceSummary().totalCollected, 0);
}

TEST_F(EngineTest, OwnerDepositWithoutFundsRollsBack) {
    EXPECT_THROW(engine_->OwnerDepositRevenue(owner_, 1, 100), TransferError);
    EXPECT_EQ(vault_->GetTotalDeposits(), 0);
    EXPECT_EQ(engine_->GetTotalOwnerDeposits(), 0);
}

// ============================================================================
// Fee Distribution
// ============================================================================

TEST_F(EngineTest, DistributeFeesProportionally) {
    BuildRoster();
    FundEscrow(100);

    EXPECT_THROW(engine_->DistributeFees(alice_), AuthorizationError);
    engine_->DistributeFees(admin_);

    EXPECT_EQ(token_.BalanceOf(alice_), 54);
    EXPECT_EQ(token_.BalanceOf(bob_), 36);
    EXPECT_EQ(token_.BalanceOf(params_.treasury), 10);
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);
    EXPECT_TRUE(engine_->GetUnderwriter(alice_)->feeClaimed);
    EXPECT_TRUE(engine_->FeesDistributed());
    EXPECT_EQ(engine_->GetState(), EngineState::FeesDistributed);

    EXPECT_THROW(engine_->DistributeFees(admin_), StateError);
    EXPECT_EQ(token_.BalanceOf(alice_), 54);
}

TEST_F(EngineTest, DistributeSkipsUnapproved) {
    BuildRoster();
    FundEscrow(100);
    engine_->SetUnderwriterApproval(admin_, bob_, false);

    engine_->DistributeFees(admin_);

    EXPECT_EQ(token_.BalanceOf(alice_), 54);
    EXPECT_EQ(token_.BalanceOf(bob_), 0);
    EXPECT_EQ(engine_->GetEscrowBalance(), 40);
    EXPECT_FALSE(engine_->GetUnderwriter(bob_)->feeClaimed);
}

TEST_F(EngineTest, DistributeRequiresEscrow) {
    BuildRoster();
    EXPECT_THROW(engine_->DistributeFees(admin_), InsufficientResourceError);
    EXPECT_FALSE(engine_->FeesDistributed());
}

TEST_F(EngineTest, ClaimFeeAfterMaturity) {
    BuildRoster();
    FundEscrow(100);

    EXPECT_THROW(engine_->ClaimFee(alice_), StateError);
    EXPECT_THROW(engine_->ClaimFee(carol_), AuthorizationError);

    Mature();
    FeePayout payout = engine_->ClaimFee(alice_);
    EXPECT_EQ(payout.gross, 60);
    EXPECT_EQ(payout.protocolCut, 6);
    EXPECT_EQ(payout.net, 54);
    EXPECT_EQ(token_.BalanceOf(alice_), 54);
    EXPECT_FALSE(engine_->FeesDistributed());

    EXPECT_THROW(engine_->ClaimFee(alice_), StateError);
    EXPECT_THROW(engine_->SetUnderwriterApproval(admin_, alice_, false), StateError);

    engine_->ClaimFee(bob_);
    EXPECT_TRUE(engine_->FeesDistributed());
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);
}

TEST_F(EngineTest, UnapprovedMemberCannotClaim) {
    BuildRoster();
    FundEscrow(100);
    engine_->SetUnderwriterApproval(admin_, bob_, false);
    Mature();

    EXPECT_THROW(engine_->ClaimFee(bob_), AuthorizationError);
    engine_->ClaimFee(alice_);
    // Every approved member has been paid
    EXPECT_TRUE(engine_->FeesDistributed());
}

TEST_F(EngineTest, ClaimRequiresFundedEscrow) {
    BuildRoster();
    Mature();

    EXPECT_THROW(engine_->ClaimFee(alice_), InsufficientResourceError);
    EXPECT_THROW(engine_->ClaimFee(bob_), InsufficientResourceError);
    EXPECT_FALSE(engine_->GetUnderwriter(alice_)->feeClaimed);
    EXPECT_FALSE(engine_->FeesDistributed());

    // A late deposit is still paid out in full
    FundEscrow(100);
    engine_->DistributeFees(admin_);
    EXPECT_EQ(token_.BalanceOf(alice_), 54);
    EXPECT_EQ(token_.BalanceOf(bob_), 36);
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);
}

TEST_F(EngineTest, RosterClosedOnceFeeDeposited) {
    BuildRoster();
    FundEscrow(100);
    RegisterInPool(carol_, 1000);

    EXPECT_THROW(engine_->AddUnderwriter(admin_, carol_, 1000), StateError);
    EXPECT_FALSE(engine_->GetUnderwriter(carol_).has_value());

    Mature();
    EXPECT_EQ(engine_->ClaimFee(alice_).gross, 60);
    EXPECT_EQ(engine_->ClaimFee(bob_).gross, 40);
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);
    EXPECT_TRUE(engine_->FeesDistributed());
}

TEST_F(EngineTest, SkippedMemberClaimsAfterReapproval) {
    BuildRoster();
    FundEscrow(100);
    engine_->SetUnderwriterApproval(admin_, bob_, false);
    engine_->DistributeFees(admin_);
    EXPECT_EQ(engine_->GetEscrowBalance(), 40);

    engine_->SetUnderwriterApproval(admin_, bob_, true);
    EXPECT_THROW(engine_->ClaimFee(bob_), StateError);  // not matured

    Mature();
    FeePayout payout = engine_->ClaimFee(bob_);
    EXPECT_EQ(payout.gross, 40);
    EXPECT_EQ(payout.net, 36);
    EXPECT_EQ(token_.BalanceOf(bob_), 36);
    EXPECT_EQ(token_.BalanceOf(params_.treasury), 10);
    EXPECT_EQ(engine_->GetEscrowBalance(), 0);
    EXPECT_EQ(engine_->GetState(), EngineState::FeesDistributed);
}

TEST_F(EngineTest, TerminalStateBlocksChanges) {
    BuildRoster();
    FundEscrow(100);
    engine_->SubmitMonthlyReport(admin_, 810);
    engine_->DistributeFees(admin_);

    EXPECT_THROW(engine_->SubmitMonthlyReport(admin_, 900), StateError);
    EXPECT_THROW(engine_->ProcessLiability(admin_, 1), StateError);
    EXPECT_THROW(engine_->AddUnderwriter(admin_, carol_, 10), StateError);
    EXPECT_THROW(engine_->SetUnderwriterApproval(admin_, alice_, true), StateError);
    EXPECT_EQ(engine_->GetCurrentMonth(), 2u);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(EngineTest, StateTransitions) {
    EXPECT_EQ(engine_->GetState(), EngineState::Assembling);
    EXPECT_EQ(engine_->GetMaturityTime(), START_TIME + params_.Duration(MONTHS));

    BuildRoster();
    EXPECT_EQ(engine_->GetState(), EngineState::Assembling);
    FundEscrow(100);
    EXPECT_EQ(engine_->GetState(), EngineState::Reporting);

    util::AdvanceMockTime(util::Seconds(params_.Duration(MONTHS) - 1));
    EXPECT_FALSE(engine_->IsMatured());
    util::AdvanceMockTime(util::Seconds(1));
    EXPECT_TRUE(engine_->IsMatured());
    EXPECT_EQ(engine_->GetState(), EngineState::Matured);

    engine_->DistributeFees(admin_);
    EXPECT_EQ(engine_->GetState(), EngineState::FeesDistributed);
}

TEST_F(EngineTest, FirstReportStartsReporting) {
    engine_->SubmitMonthlyReport(admin_, 900);
    EXPECT_EQ(engine_->GetState(), EngineState::Reporting);
}

TEST_F(EngineTest, StateNames) {
    EXPECT_STREQ(EngineStateToString(EngineState::Assembling), "Assembling");
    EXPECT_STREQ(EngineStateToString(EngineState::Reporting), "Reporting");
    EXPECT_STREQ(EngineStateToString(EngineState::Matured), "Matured");
    EXPECT_STREQ(EngineStateToString(EngineState::FeesDistributed), "FeesDistributed");
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(EngineTest, ExportImportRoundTrip) {
    BuildRoster();
    FundEscrow(100);
    engine_->AddOperator(admin_, operator_);
    engine_->SubmitMonthlyReport(operator_, 810);
    Fund(owner_, 50, engineAddr_);
    engine_->OwnerDepositRevenue(owner_, 1, 50);

    EngineSnapshot snapshot = engine_->ExportState();
    EXPECT_EQ(snapshot.operators.size(), 1u);

    RoleConfig roles(admin_);
    auto restored = CreateEngine(roles);
    restored->ImportState(snapshot);

    EXPECT_TRUE(restored->IsOperator(operator_));
    EXPECT_EQ(restored->GetCurrentMonth(), 2u);
    EXPECT_TRUE(restored->GetReport(1) == engine_->GetReport(1));
    EXPECT_TRUE(restored->GetRoster() == engine_->GetRoster());
    EXPECT_EQ(restored->GetEscrowBalance(), 100);
    EXPECT_EQ(restored->GetOwnerDeposits(1), 50);
    EXPECT_EQ(restored->GetMaturityTime(), engine_->GetMaturityTime());
    EXPECT_EQ(restored->GetState(), engine_->GetState());
}

TEST_F(EngineTest, ImportRejectsOtherVenue) {
    EngineSnapshot snapshot = engine_->ExportState();
    snapshot.venueId = 99;
    EXPECT_THROW(engine_->ImportState(snapshot), ValidationError);
}
