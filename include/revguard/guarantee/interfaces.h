// REVGUARD - External Collaborator Interfaces
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// The pool and the engine see the venue registry, revenue vaults and the
// collateral asset only through these interfaces.

#ifndef REVGUARD_GUARANTEE_INTERFACES_H
#define REVGUARD_GUARANTEE_INTERFACES_H

#include "revguard/core/types.h"

#include <cstdint>

namespace revguard {
namespace guarantee {

// ============================================================================
// Revenue Vault
// ============================================================================

/// Receives owner revenue and forfeited stake for one venue
class IRevenueVault {
public:
    virtual ~IRevenueVault() = default;

    /// Custody account of the vault
    virtual AccountId Address() const = 0;

    /// Revenue promised to investors for each period
    virtual Amount PromisedRevenue() const = 0;

    /// Number of periods the guarantee runs for
    virtual uint32_t TotalMonths() const = 0;

    /// Notification that the owner moved `amount` into the vault for `month`
    virtual void OnOwnerDeposit(const AccountId& from, uint32_t month, Amount amount) = 0;

    /// Notification that forfeited stake of `from` was moved into the vault
    virtual void OnLiabilityPayment(const AccountId& from, Amount amount) = 0;
};

// ============================================================================
// Venue Registry
// ============================================================================

class IVenueRegistry {
public:
    virtual ~IVenueRegistry() = default;

    virtual bool VenueExists(VenueId venueId) const = 0;

    /// Owner of the venue; throws NotFoundError for an unknown venue
    virtual AccountId OwnerOf(VenueId venueId) const = 0;

    /// Vault of the venue; throws NotFoundError for an unknown venue
    virtual IRevenueVault& VaultOf(VenueId venueId) const = 0;

    /// Identity of the guarantee engine allowed to settle liabilities
    virtual AccountId GuaranteeOf(VenueId venueId) const = 0;
};

// ============================================================================
// Collateral Asset
// ============================================================================

/// Fungible collateral. A false return means nothing moved.
class ICollateralAsset {
public:
    virtual ~ICollateralAsset() = default;

    /// Move `amount` from `from` to `to` using the allowance granted to `spender`
    virtual bool TransferFrom(const AccountId& spender, const AccountId& from,
                              const AccountId& to, Amount amount) = 0;

    /// Move `amount` held by `from` to `to`
    virtual bool Transfer(const AccountId& from, const AccountId& to, Amount amount) = 0;

    virtual Amount BalanceOf(const AccountId& account) const = 0;
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_INTERFACES_H
