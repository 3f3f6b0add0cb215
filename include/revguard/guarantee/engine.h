// REVGUARD - Venue Guarantee Engine
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Per-venue state machine of the guarantee protocol:
// - Monthly revenue reports and shortfall computation
// - Liability settlement through the underwriter pool
// - Fee escrow, proportional distribution and individual claims
// - Owner revenue deposits into the venue vault
//
// States: Assembling -> Reporting -> Matured -> FeesDistributed (terminal).

#ifndef REVGUARD_GUARANTEE_ENGINE_H
#define REVGUARD_GUARANTEE_ENGINE_H

#include "revguard/core/types.h"
#include "revguard/guarantee/errors.h"
#include "revguard/guarantee/interfaces.h"
#include "revguard/guarantee/journal.h"
#include "revguard/guarantee/params.h"
#include "revguard/guarantee/pool.h"

#include <map>
#include <optional>
#include <vector>

namespace revguard {
namespace guarantee {

// ============================================================================
// Engine Types
// ============================================================================

/// Lifecycle of a venue guarantee
enum class EngineState {
    /// Roster and fee escrow being put together, no report yet
    Assembling,

    /// Reports being submitted
    Reporting,

    /// All periods elapsed; fees may be claimed
    Matured,

    /// Every fee share paid out
    FeesDistributed
};

/// Convert state to string
const char* EngineStateToString(EngineState state);

/// Revenue report of one period
struct MonthlyReport {
    uint32_t month{0};
    Amount expectedRevenue{0};
    Amount actualRevenue{0};
    Amount missingRevenue{0};
    bool liabilityPaid{false};
    Timestamp timestamp{0};

    bool HasShortfall() const { return missingRevenue > 0; }

    bool operator==(const MonthlyReport& other) const {
        return month == other.month && expectedRevenue == other.expectedRevenue &&
               actualRevenue == other.actualRevenue &&
               missingRevenue == other.missingRevenue &&
               liabilityPaid == other.liabilityPaid && timestamp == other.timestamp;
    }
};

/// Entry of the engine's local roster
struct EngineUnderwriter {
    AccountId address;
    Amount stake{0};
    bool approved{false};
    bool feeClaimed{false};

    bool operator==(const EngineUnderwriter& other) const {
        return address == other.address && stake == other.stake &&
               approved == other.approved && feeClaimed == other.feeClaimed;
    }
};

struct PerformanceSummary {
    Amount totalExpected{0};
    Amount totalCollected{0};
    /// totalExpected - totalCollected
    Amount totalShortfall{0};
    Amount totalLiabilityPaid{0};
};

/// Persisted form of an engine
struct EngineSnapshot {
    VenueId venueId{0};
    uint32_t currentMonth{1};
    Timestamp startTime{0};

    Amount totalExpected{0};
    Amount totalCollected{0};
    Amount totalLiabilityPaid{0};

    std::vector<EngineUnderwriter> roster;
    Amount totalStake{0};

    Amount feeAmount{0};
    bool feeDeposited{false};
    Amount escrowDeposited{0};
    Amount escrowBalance{0};
    bool feesDistributed{false};

    Amount totalOwnerDeposits{0};
    std::map<uint32_t, Amount> ownerDeposits;

    std::vector<AccountId> operators;
    std::map<uint32_t, MonthlyReport> reports;
};

// ============================================================================
// Guarantee Engine
// ============================================================================

/**
 * Guarantee state machine of one venue.
 *
 * Role checks are made against the explicit caller: the admin and operators
 * come from the RoleConfig, the venue owner from the registry.
 */
class GuaranteeEngine {
public:
    GuaranteeEngine(VenueId venueId,
                    const AccountId& address,
                    RoleConfig& roles,
                    IVenueRegistry& registry,
                    UnderwriterPool& pool,
                    ICollateralAsset& asset,
                    Journal& journal,
                    const ProtocolParams& params);

    GuaranteeEngine(const GuaranteeEngine&) = delete;
    GuaranteeEngine& operator=(const GuaranteeEngine&) = delete;

    VenueId GetVenueId() const { return venueId_; }

    /// Identity the registry knows this engine by; also holds the fee escrow
    const AccountId& Address() const { return address_; }

    // ========================================================================
    // Role management (admin)
    // ========================================================================

    void AddOperator(const AccountId& caller, const AccountId& account);

    /// The admin itself cannot be removed
    void RemoveOperator(const AccountId& caller, const AccountId& account);

    // ========================================================================
    // Fee escrow (owner)
    // ========================================================================

    /// Configure the fee; only before it is deposited
    void SetFeeAmount(const AccountId& caller, Amount amount);

    /// Pull the configured fee from the owner into escrow, once
    void DepositFee(const AccountId& caller);

    // ========================================================================
    // Roster (operators)
    // ========================================================================

    /// Append a pool-registered underwriter to the local roster, approved.
    /// The roster closes when the fee is deposited.
    void AddUnderwriter(const AccountId& caller, const AccountId& account, Amount stake);

    /// Toggle whether a member shares in the fee escrow; allowed until its fee is paid
    void SetUnderwriterApproval(const AccountId& caller, const AccountId& account,
                                bool approved);

    // ========================================================================
    // Reporting and settlement (operators)
    // ========================================================================

    /// Record the revenue of the current period; returns its month number
    uint32_t SubmitMonthlyReport(const AccountId& caller, Amount actualRevenue);

    /// Settle the shortfall of a reported month through the pool, once
    SettlementResult ProcessLiability(const AccountId& caller, uint32_t month);

    /// Owner moves revenue for `month` into the vault
    void OwnerDepositRevenue(const AccountId& caller, uint32_t month, Amount amount);

    // ========================================================================
    // Fee distribution
    // ========================================================================

    /// Pay every approved, unclaimed member its share of the escrow, once
    void DistributeFees(const AccountId& caller);

    /// Pay the caller its share of a funded escrow after maturity
    FeePayout ClaimFee(const AccountId& caller);

    // ========================================================================
    // Queries
    // ========================================================================

    PerformanceSummary GetPerformanceSummary() const;

    std::optional<MonthlyReport> GetReport(uint32_t month) const;

    /// All reports in month order
    std::vector<MonthlyReport> GetReports() const;

    const std::vector<EngineUnderwriter>& GetRoster() const { return roster_; }

    std::optional<EngineUnderwriter> GetUnderwriter(const AccountId& account) const;

    EngineState GetState() const;

    /// now >= startTime + totalMonths * periodLength
    bool IsMatured() const;

    Timestamp GetMaturityTime() const;

    Amount GetEscrowBalance() const { return escrowBalance_; }

    bool IsOperator(const AccountId& account) const { return roles_.IsOperator(account); }

    uint32_t GetCurrentMonth() const { return currentMonth_; }

    Amount GetFeeAmount() const { return feeAmount_; }

    bool FeesDistributed() const { return feesDistributed_; }

    Amount GetTotalOwnerDeposits() const { return totalOwnerDeposits_; }

    /// Owner deposits recorded for a month (0 if none)
    Amount GetOwnerDeposits(uint32_t month) const;

    // ========================================================================
    // Persistence
    // ========================================================================

    EngineSnapshot ExportState() const;

    /// Replace the engine state; the venue id must match
    void ImportState(const EngineSnapshot& snapshot);

private:
    template<typename Fn>
    auto Execute(const char* operation, Fn&& fn) -> decltype(fn());

    void RequireAdmin(const AccountId& caller) const;
    void RequireOperator(const AccountId& caller) const;
    void RequireOwner(const AccountId& caller) const;
    void RequireActive(const char* what) const;

    std::vector<EngineUnderwriter>::iterator FindMember(const AccountId& account);

    /// Gross share of the escrow for `stake`, split into net and protocol cut
    FeePayout ComputeFeeShare(Amount stake) const;

    /// Move a fee share out of escrow to `member` and the treasury
    void PayFeeShare(const AccountId& member, const FeePayout& payout);

    bool AllApprovedClaimed() const;

    VenueId venueId_;
    AccountId address_;
    RoleConfig& roles_;
    IVenueRegistry& registry_;
    UnderwriterPool& pool_;
    ICollateralAsset& asset_;
    Journal& journal_;
    const ProtocolParams& params_;

    uint32_t currentMonth_{1};
    Timestamp startTime_{0};
    std::map<uint32_t, MonthlyReport> reports_;

    Amount totalExpected_{0};
    Amount totalCollected_{0};
    Amount totalLiabilityPaid_{0};

    std::vector<EngineUnderwriter> roster_;
    Amount totalStake_{0};

    Amount feeAmount_{0};
    bool feeDeposited_{false};
    Amount escrowDeposited_{0};
    Amount escrowBalance_{0};
    bool feesDistributed_{false};

    Amount totalOwnerDeposits_{0};
    std::map<uint32_t, Amount> ownerDeposits_;

    bool entered_{false};
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_ENGINE_H
