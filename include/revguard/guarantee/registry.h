// REVGUARD - Venue Registry and Revenue Vault
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// In-process implementations of the registry and vault collaborators. The
// vault only keeps the books of what it received; investor mechanics live
// elsewhere.

#ifndef REVGUARD_GUARANTEE_REGISTRY_H
#define REVGUARD_GUARANTEE_REGISTRY_H

#include "revguard/core/types.h"
#include "revguard/guarantee/interfaces.h"
#include "revguard/guarantee/journal.h"

#include <map>
#include <memory>

namespace revguard {
namespace guarantee {

// ============================================================================
// Revenue Vault
// ============================================================================

class RevenueVault : public IRevenueVault {
public:
    RevenueVault(const AccountId& address, Amount promisedRevenue, uint32_t totalMonths,
                 Journal& journal);

    AccountId Address() const override { return address_; }
    Amount PromisedRevenue() const override { return promisedRevenue_; }
    uint32_t TotalMonths() const override { return totalMonths_; }

    void OnOwnerDeposit(const AccountId& from, uint32_t month, Amount amount) override;
    void OnLiabilityPayment(const AccountId& from, Amount amount) override;

    /// Owner revenue received for a month
    Amount GetDeposits(uint32_t month) const;

    Amount GetTotalDeposits() const { return totalDeposits_; }

    /// Forfeited stake received from one underwriter
    Amount GetLiabilityFrom(const AccountId& underwriter) const;

    Amount GetTotalLiabilityReceived() const { return totalLiability_; }

private:
    AccountId address_;
    Amount promisedRevenue_;
    uint32_t totalMonths_;
    Journal& journal_;

    std::map<uint32_t, Amount> deposits_;
    Amount totalDeposits_{0};
    std::map<AccountId, Amount> liabilityByPayer_;
    Amount totalLiability_{0};
};

// ============================================================================
// Venue Registry
// ============================================================================

class VenueRegistry : public IVenueRegistry {
public:
    VenueRegistry() = default;

    /**
     * Register a venue. Ids are assigned sequentially from 1.
     * @param owner     Account allowed to assign underwriters and deposit
     * @param vault     Revenue vault of the venue
     * @param guarantee Identity of the venue's guarantee engine
     */
    VenueId RegisterVenue(const AccountId& owner, std::shared_ptr<IRevenueVault> vault,
                          const AccountId& guarantee);

    bool VenueExists(VenueId venueId) const override;
    AccountId OwnerOf(VenueId venueId) const override;
    IRevenueVault& VaultOf(VenueId venueId) const override;
    AccountId GuaranteeOf(VenueId venueId) const override;

    size_t VenueCount() const { return venues_.size(); }

private:
    struct VenueEntry {
        AccountId owner;
        std::shared_ptr<IRevenueVault> vault;
        AccountId guarantee;
    };

    const VenueEntry& Require(VenueId venueId) const;

    std::map<VenueId, VenueEntry> venues_;
    VenueId nextId_{1};
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_REGISTRY_H
