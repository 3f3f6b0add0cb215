// REVGUARD - Underwriter Pool Ledger
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Global collateral ledger of the guarantee protocol:
// - Underwriter registration, top-up and withdrawal
// - Per-venue underwriting assignments with frozen rosters
// - Proportional liability settlement into the venue vault
// - Assignment fee payout and stake release at maturity
//
// Every collateral number changes here and nowhere else.

#ifndef REVGUARD_GUARANTEE_POOL_H
#define REVGUARD_GUARANTEE_POOL_H

#include "revguard/core/types.h"
#include "revguard/guarantee/errors.h"
#include "revguard/guarantee/interfaces.h"
#include "revguard/guarantee/journal.h"
#include "revguard/guarantee/params.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace revguard {
namespace guarantee {

// ============================================================================
// Pool Types
// ============================================================================

/**
 * Collateral of one underwriter across all venues.
 * Invariant: totalStake == availableStake + lockedStake, all non-negative.
 */
struct Underwriter {
    Amount totalStake{0};
    Amount availableStake{0};
    Amount lockedStake{0};

    bool IsConsistent() const {
        return availableStake >= 0 && lockedStake >= 0 &&
               totalStake == availableStake + lockedStake;
    }

    bool operator==(const Underwriter& other) const {
        return totalStake == other.totalStake &&
               availableStake == other.availableStake &&
               lockedStake == other.lockedStake;
    }
};

/**
 * Commitment of one underwriter to one venue.
 * `stake` is the amount committed at assignment and never changes; it stays the
 * weight of the member's settlement and fee shares. The live commitment is
 * Remaining(), which a fee claim zeroes.
 */
struct VenueStake {
    /// Stake committed at assignment time
    Amount stake{0};

    /// Stake already forfeited to the venue vault
    Amount liabilityPaid{0};

    /// Assignment fee share collected (commitment released)
    bool feeClaimed{false};

    /// Stake still backing the venue; 0 once the fee is claimed
    Amount Remaining() const { return feeClaimed ? 0 : stake - liabilityPaid; }

    bool operator==(const VenueStake& other) const {
        return stake == other.stake && liabilityPaid == other.liabilityPaid &&
               feeClaimed == other.feeClaimed;
    }
};

/// Underwriting assignment of a venue. The roster never changes once created.
struct VenueAssignment {
    VenueId venueId{0};
    std::vector<AccountId> roster;
    Amount totalStakeCommitted{0};
    Amount fee{0};
    Amount promisedRevenue{0};
    Timestamp endDate{0};
    bool active{false};

    /// Sum of forfeited shares moved to the vault
    Amount totalLiabilitySettled{0};

    /// Rounding remainders of all settlements, never redistributed
    Amount settlementResidual{0};

    /// Roster members that collected their fee share
    uint32_t claimsPaid{0};

    bool operator==(const VenueAssignment& other) const {
        return venueId == other.venueId && roster == other.roster &&
               totalStakeCommitted == other.totalStakeCommitted &&
               fee == other.fee && promisedRevenue == other.promisedRevenue &&
               endDate == other.endDate && active == other.active &&
               totalLiabilitySettled == other.totalLiabilitySettled &&
               settlementResidual == other.settlementResidual &&
               claimsPaid == other.claimsPaid;
    }
};

/// One (underwriter, amount) entry of an assignment request
struct StakeCommitment {
    AccountId underwriter;
    Amount amount{0};
};

/// Outcome of a liability settlement
struct SettlementResult {
    VenueId venueId{0};
    Amount missingAmount{0};
    std::vector<std::pair<AccountId, Amount>> shares;
    Amount distributed{0};
    Amount residual{0};
};

/// Outcome of a fee claim
struct FeePayout {
    Amount gross{0};
    Amount protocolCut{0};
    Amount net{0};
    /// Commitment moved back to available stake
    Amount released{0};
};

using VenueStakeKey = std::pair<VenueId, AccountId>;

/// Persisted form of the whole pool
struct PoolSnapshot {
    std::map<AccountId, Underwriter> underwriters;
    std::map<VenueId, VenueAssignment> assignments;
    std::map<VenueStakeKey, VenueStake> venueStakes;
};

// ============================================================================
// Underwriter Pool
// ============================================================================

/**
 * Global underwriter collateral ledger.
 *
 * Every operation takes the calling identity first, runs inside one
 * Journal::Scope and either completes or leaves no trace.
 */
class UnderwriterPool {
public:
    UnderwriterPool(const AccountId& address,
                    IVenueRegistry& registry,
                    ICollateralAsset& asset,
                    Journal& journal,
                    const ProtocolParams& params);

    UnderwriterPool(const UnderwriterPool&) = delete;
    UnderwriterPool& operator=(const UnderwriterPool&) = delete;

    /// Custody account holding stake and assignment fees
    const AccountId& Address() const { return address_; }

    // ========================================================================
    // Operations
    // ========================================================================

    /// Deposit collateral; creates the underwriter on first call
    void Register(const AccountId& caller, Amount amount);

    /**
     * Lock stakes of at least two registered underwriters for a venue.
     * Only the venue owner may assign, once per venue. A nonzero fee is
     * pulled from the owner into pool custody.
     */
    void AssignToVenue(const AccountId& caller, VenueId venueId,
                       const std::vector<StakeCommitment>& commitments,
                       Amount fee);

    /**
     * Forfeit floor(missing * stake / totalStakeCommitted) of every roster
     * member to the venue vault. Only the venue's guarantee engine may call.
     */
    SettlementResult SettleLiability(const AccountId& caller, VenueId venueId,
                                     Amount missingAmount);

    /// Release the caller's remaining commitment and pay its fee share after maturity
    FeePayout ClaimFee(const AccountId& caller, VenueId venueId);

    /// Pay out available stake
    void Withdraw(const AccountId& caller, Amount amount);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Underwriter> GetUnderwriter(const AccountId& id) const;

    bool IsRegistered(const AccountId& id) const;

    std::optional<VenueStake> GetVenueStake(VenueId venueId, const AccountId& id) const;

    /// Empty if the venue has no assignment
    std::vector<AccountId> GetRoster(VenueId venueId) const;

    std::optional<VenueAssignment> GetAssignment(VenueId venueId) const;

    /// True once the assignment end date has passed
    bool IsVenueMatured(VenueId venueId) const;

    size_t GetUnderwriterCount() const { return underwriters_.size(); }

    /// Sum of locked stake over all underwriters
    Amount GetTotalLocked() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    PoolSnapshot ExportState() const;

    /// Replace the whole ledger; rejected while an operation is running
    void ImportState(const PoolSnapshot& snapshot);

private:
    template<typename Fn>
    auto Execute(const char* operation, Fn&& fn) -> decltype(fn());

    Underwriter& RequireUnderwriter(const AccountId& id, const char* what);
    VenueAssignment& RequireAssignment(VenueId venueId);

    /// Throw TransferError if the asset refused a movement
    void CheckTransfer(bool ok, const char* what) const;

    AccountId address_;
    IVenueRegistry& registry_;
    ICollateralAsset& asset_;
    Journal& journal_;
    const ProtocolParams& params_;

    std::map<AccountId, Underwriter> underwriters_;
    std::map<VenueId, VenueAssignment> assignments_;
    std::map<VenueStakeKey, VenueStake> venueStakes_;

    bool entered_{false};
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_POOL_H
