// REVGUARD - Venue Registry and Revenue Vault
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/registry.h"
#include "revguard/guarantee/errors.h"
#include "revguard/util/logging.h"

#include <string>

namespace revguard {
namespace guarantee {

namespace LogCategory = util::LogCategory;

// ============================================================================
// RevenueVault
// ============================================================================

RevenueVault::RevenueVault(const AccountId& address, Amount promisedRevenue,
                           uint32_t totalMonths, Journal& journal)
    : address_(address)
    , promisedRevenue_(promisedRevenue)
    , totalMonths_(totalMonths)
    , journal_(journal) {
    if (promisedRevenue_ < 0) {
        throw ValidationError("promised revenue must not be negative");
    }
}

void RevenueVault::OnOwnerDeposit(const AccountId& from, uint32_t month, Amount amount) {
    journal_.SaveEntry(deposits_, month);
    deposits_[month] += amount;
    journal_.Assign(totalDeposits_, totalDeposits_ + amount);
    LOG_DEBUG(LogCategory::VAULT) << "vault " << address_.ToShortHex() << ": "
                                  << from.ToShortHex() << " deposited " << amount
                                  << " for month " << month;
}

void RevenueVault::OnLiabilityPayment(const AccountId& from, Amount amount) {
    journal_.SaveEntry(liabilityByPayer_, from);
    liabilityByPayer_[from] += amount;
    journal_.Assign(totalLiability_, totalLiability_ + amount);
    LOG_DEBUG(LogCategory::VAULT) << "vault " << address_.ToShortHex() << ": received "
                                  << amount << " forfeited by " << from.ToShortHex();
}

Amount RevenueVault::GetDeposits(uint32_t month) const {
    auto it = deposits_.find(month);
    return it == deposits_.end() ? 0 : it->second;
}

Amount RevenueVault::GetLiabilityFrom(const AccountId& underwriter) const {
    auto it = liabilityByPayer_.find(underwriter);
    return it == liabilityByPayer_.end() ? 0 : it->second;
}

// ============================================================================
// VenueRegistry
// ============================================================================

VenueId VenueRegistry::RegisterVenue(const AccountId& owner,
                                     std::shared_ptr<IRevenueVault> vault,
                                     const AccountId& guarantee) {
    if (!vault) {
        throw ValidationError("venue needs a revenue vault");
    }
    VenueId id = nextId_++;
    venues_[id] = VenueEntry{owner, std::move(vault), guarantee};
    LOG_INFO(LogCategory::DEFAULT) << "venue " << id << " registered by " << owner.ToShortHex();
    return id;
}

const VenueRegistry::VenueEntry& VenueRegistry::Require(VenueId venueId) const {
    auto it = venues_.find(venueId);
    if (it == venues_.end()) {
        throw NotFoundError("unknown venue " + std::to_string(venueId));
    }
    return it->second;
}

bool VenueRegistry::VenueExists(VenueId venueId) const {
    return venues_.count(venueId) > 0;
}

AccountId VenueRegistry::OwnerOf(VenueId venueId) const {
    return Require(venueId).owner;
}

IRevenueVault& VenueRegistry::VaultOf(VenueId venueId) const {
    return *Require(venueId).vault;
}

AccountId VenueRegistry::GuaranteeOf(VenueId venueId) const {
    return Require(venueId).guarantee;
}

} // namespace guarantee
} // namespace revguard
