// REVGUARD - Underwriter Pool Ledger Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/pool.h"
#include "revguard/util/logging.h"
#include "revguard/util/time.h"

#include <set>
#include <string>
#include <type_traits>

namespace revguard {
namespace guarantee {

namespace LogCategory = util::LogCategory;

/// Minimum number of underwriters backing a venue
static constexpr size_t MIN_ROSTER_SIZE = 2;

// ============================================================================
// Construction and helpers
// ============================================================================

UnderwriterPool::UnderwriterPool(const AccountId& address,
                                 IVenueRegistry& registry,
                                 ICollateralAsset& asset,
                                 Journal& journal,
                                 const ProtocolParams& params)
    : address_(address)
    , registry_(registry)
    , asset_(asset)
    , journal_(journal)
    , params_(params) {}

template<typename Fn>
auto UnderwriterPool::Execute(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        ReentrancyGuard guard(entered_, "UnderwriterPool");
        Journal::Scope scope(journal_);
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            scope.Commit();
        } else {
            auto result = fn();
            scope.Commit();
            return result;
        }
    } catch (const GuaranteeError& e) {
        LOG_DEBUG(LogCategory::POOL) << operation << " rejected ["
                                     << ErrorKindToString(e.Kind()) << "]: " << e.what();
        throw;
    }
}

Underwriter& UnderwriterPool::RequireUnderwriter(const AccountId& id, const char* what) {
    auto it = underwriters_.find(id);
    if (it == underwriters_.end()) {
        throw AuthorizationError(std::string(what) + " " + id.ToShortHex() +
                                 " is not a registered underwriter");
    }
    return it->second;
}

VenueAssignment& UnderwriterPool::RequireAssignment(VenueId venueId) {
    auto it = assignments_.find(venueId);
    if (it == assignments_.end()) {
        throw NotFoundError("venue " + std::to_string(venueId) + " has no assignment");
    }
    return it->second;
}

void UnderwriterPool::CheckTransfer(bool ok, const char* what) const {
    if (!ok) {
        throw TransferError(std::string("collateral transfer failed: ") + what);
    }
}

// ============================================================================
// Operations
// ============================================================================

void UnderwriterPool::Register(const AccountId& caller, Amount amount) {
    Execute("Register", [&]() {
        if (amount <= 0) {
            throw ValidationError("stake amount must be positive");
        }

        auto it = underwriters_.find(caller);
        Amount current = (it == underwriters_.end()) ? 0 : it->second.totalStake;
        if (!MoneyRange(amount) || !MoneyRange(current + amount)) {
            throw ValidationError("stake amount out of range");
        }

        CheckTransfer(asset_.TransferFrom(address_, caller, address_, amount), "stake deposit");

        journal_.SaveEntry(underwriters_, caller);
        Underwriter& u = underwriters_[caller];
        u.totalStake += amount;
        u.availableStake += amount;

        LOG_INFO(LogCategory::POOL) << "underwriter " << caller.ToShortHex()
                                    << " staked " << amount << " (total=" << u.totalStake
                                    << " available=" << u.availableStake << ")";
    });
}

void UnderwriterPool::AssignToVenue(const AccountId& caller, VenueId venueId,
                                    const std::vector<StakeCommitment>& commitments,
                                    Amount fee) {
    Execute("AssignToVenue", [&]() {
        if (!registry_.VenueExists(venueId)) {
            throw NotFoundError("unknown venue " + std::to_string(venueId));
        }
        if (registry_.OwnerOf(venueId) != caller) {
            throw NotVenueOwnerError("caller does not own venue " + std::to_string(venueId));
        }
        if (assignments_.count(venueId) > 0) {
            throw StateError("venue " + std::to_string(venueId) + " is already assigned");
        }

        // Shape of the request
        if (commitments.size() < MIN_ROSTER_SIZE) {
            throw ValidationError("at least " + std::to_string(MIN_ROSTER_SIZE) +
                                  " underwriters required");
        }
        if (fee < 0 || !MoneyRange(fee)) {
            throw ValidationError("fee out of range");
        }
        std::set<AccountId> seen;
        for (const auto& c : commitments) {
            if (!seen.insert(c.underwriter).second) {
                throw ValidationError("duplicate underwriter " + c.underwriter.ToShortHex());
            }
            if (c.amount <= 0) {
                throw ValidationError("stake commitment must be positive");
            }
        }

        for (const auto& c : commitments) {
            RequireUnderwriter(c.underwriter, "underwriter");
        }

        Amount aggregate = 0;
        for (const auto& c : commitments) {
            const Underwriter& u = underwriters_.at(c.underwriter);
            if (c.amount > u.availableStake) {
                throw InsufficientResourceError(
                    "underwriter " + c.underwriter.ToShortHex() + " has " +
                    std::to_string(u.availableStake) + " available, " +
                    std::to_string(c.amount) + " requested");
            }
            aggregate += c.amount;
            if (!MoneyRange(aggregate)) {
                throw ValidationError("aggregate stake out of range");
            }
        }

        IRevenueVault& vault = registry_.VaultOf(venueId);
        Amount promised = vault.PromisedRevenue();
        if (aggregate < promised) {
            throw InsufficientResourceError(
                "aggregate stake " + std::to_string(aggregate) +
                " below promised revenue " + std::to_string(promised));
        }
        uint32_t months = vault.TotalMonths();
        if (months == 0) {
            throw ValidationError("vault of venue " + std::to_string(venueId) +
                                  " has no guarantee periods");
        }

        // Lock stake and freeze the roster
        journal_.SaveEntry(assignments_, venueId);
        VenueAssignment& a = assignments_[venueId];
        a.venueId = venueId;
        a.fee = fee;
        a.promisedRevenue = promised;
        a.endDate = util::GetTime() + params_.Duration(months);
        a.active = true;

        for (const auto& c : commitments) {
            journal_.SaveEntry(underwriters_, c.underwriter);
            Underwriter& u = underwriters_[c.underwriter];
            u.availableStake -= c.amount;
            u.lockedStake += c.amount;

            VenueStakeKey key{venueId, c.underwriter};
            journal_.SaveEntry(venueStakes_, key);
            venueStakes_[key] = VenueStake{c.amount, 0, false};

            a.roster.push_back(c.underwriter);
            a.totalStakeCommitted += c.amount;
        }

        if (fee > 0) {
            CheckTransfer(asset_.TransferFrom(address_, caller, address_, fee), "assignment fee");
        }

        LOG_INFO(LogCategory::POOL) << "venue " << venueId << " assigned to "
                                    << a.roster.size() << " underwriters, committed="
                                    << a.totalStakeCommitted << " fee=" << fee
                                    << " ends " << util::FormatTimestamp(a.endDate);
    });
}

SettlementResult UnderwriterPool::SettleLiability(const AccountId& caller, VenueId venueId,
                                                  Amount missingAmount) {
    return Execute("SettleLiability", [&]() {
        if (!registry_.VenueExists(venueId) || registry_.GuaranteeOf(venueId) != caller) {
            throw AuthorizationError("caller is not the guarantee engine of venue " +
                                     std::to_string(venueId));
        }
        auto it = assignments_.find(venueId);
        if (it == assignments_.end() || !it->second.active) {
            throw NotFoundError("venue " + std::to_string(venueId) + " has no active assignment");
        }
        if (missingAmount <= 0) {
            throw ValidationError("missing amount must be positive");
        }

        const VenueAssignment& assignment = it->second;
        SettlementResult result;
        result.venueId = venueId;
        result.missingAmount = missingAmount;

        // Compute every share before touching any balance
        for (const AccountId& member : assignment.roster) {
            const VenueStake& vs = venueStakes_.at({venueId, member});
            Amount share = MulDiv(missingAmount, vs.stake, assignment.totalStakeCommitted);
            const Underwriter& u = underwriters_.at(member);
            if (share > vs.Remaining() || share > u.lockedStake) {
                throw InsufficientResourceError(
                    "underwriter " + member.ToShortHex() + " cannot cover share " +
                    std::to_string(share) + " (remaining commitment " +
                    std::to_string(vs.Remaining()) + ")");
            }
            result.shares.emplace_back(member, share);
            result.distributed += share;
        }
        result.residual = missingAmount - result.distributed;

        IRevenueVault& vault = registry_.VaultOf(venueId);
        const AccountId vaultAddress = vault.Address();

        for (const auto& [member, share] : result.shares) {
            if (share == 0) {
                continue;
            }
            journal_.SaveEntry(underwriters_, member);
            Underwriter& u = underwriters_[member];
            u.lockedStake -= share;
            u.totalStake -= share;

            VenueStakeKey key{venueId, member};
            journal_.SaveEntry(venueStakes_, key);
            venueStakes_[key].liabilityPaid += share;

            CheckTransfer(asset_.Transfer(address_, vaultAddress, share), "liability payment");
            vault.OnLiabilityPayment(member, share);

            LOG_DEBUG(LogCategory::POOL) << "venue " << venueId << ": "
                                         << member.ToShortHex() << " forfeits " << share;
        }

        journal_.SaveEntry(assignments_, venueId);
        VenueAssignment& a = assignments_[venueId];
        a.totalLiabilitySettled += result.distributed;
        a.settlementResidual += result.residual;

        LOG_INFO(LogCategory::POOL) << "venue " << venueId << " settled liability "
                                    << missingAmount << ": distributed=" << result.distributed
                                    << " residual=" << result.residual;
        return result;
    });
}

FeePayout UnderwriterPool::ClaimFee(const AccountId& caller, VenueId venueId) {
    return Execute("ClaimFee", [&]() {
        const VenueAssignment& assignment = RequireAssignment(venueId);

        VenueStakeKey key{venueId, caller};
        auto vsIt = venueStakes_.find(key);
        if (vsIt == venueStakes_.end()) {
            throw AuthorizationError("caller is not on the roster of venue " +
                                     std::to_string(venueId));
        }
        if (util::GetTime() < assignment.endDate) {
            throw StateError("venue " + std::to_string(venueId) + " has not matured");
        }
        if (vsIt->second.feeClaimed) {
            throw StateError("fee of venue " + std::to_string(venueId) + " already claimed");
        }

        const VenueStake& vs = vsIt->second;
        FeePayout payout;
        payout.released = vs.Remaining();
        payout.gross = MulDiv(assignment.fee, vs.stake, assignment.totalStakeCommitted);
        payout.protocolCut = params_.ProtocolCut(payout.gross);
        payout.net = payout.gross - payout.protocolCut;

        Underwriter& current = RequireUnderwriter(caller, "claimant");
        if (payout.released > current.lockedStake) {
            throw InsufficientResourceError("locked stake below remaining commitment");
        }

        journal_.SaveEntry(underwriters_, caller);
        Underwriter& u = underwriters_[caller];
        u.lockedStake -= payout.released;
        u.availableStake += payout.released;

        journal_.SaveEntry(venueStakes_, key);
        venueStakes_[key].feeClaimed = true;

        journal_.SaveEntry(assignments_, venueId);
        VenueAssignment& a = assignments_[venueId];
        ++a.claimsPaid;
        if (a.claimsPaid == a.roster.size()) {
            a.active = false;
        }

        if (payout.net > 0) {
            CheckTransfer(asset_.Transfer(address_, caller, payout.net), "fee payout");
        }
        if (payout.protocolCut > 0) {
            CheckTransfer(asset_.Transfer(address_, params_.treasury, payout.protocolCut),
                          "protocol cut");
        }

        LOG_INFO(LogCategory::POOL) << "venue " << venueId << ": " << caller.ToShortHex()
                                    << " claimed fee " << payout.net << " (cut "
                                    << payout.protocolCut << "), released " << payout.released;
        return payout;
    });
}

void UnderwriterPool::Withdraw(const AccountId& caller, Amount amount) {
    Execute("Withdraw", [&]() {
        if (amount <= 0) {
            throw ValidationError("withdrawal amount must be positive");
        }
        const Underwriter& current = RequireUnderwriter(caller, "caller");
        if (amount > current.availableStake) {
            throw InsufficientResourceError(
                "withdrawal of " + std::to_string(amount) + " exceeds available " +
                std::to_string(current.availableStake));
        }

        journal_.SaveEntry(underwriters_, caller);
        Underwriter& u = underwriters_[caller];
        u.totalStake -= amount;
        u.availableStake -= amount;

        CheckTransfer(asset_.Transfer(address_, caller, amount), "withdrawal");

        LOG_INFO(LogCategory::POOL) << "underwriter " << caller.ToShortHex()
                                    << " withdrew " << amount << " (total=" << u.totalStake << ")";
    });
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Underwriter> UnderwriterPool::GetUnderwriter(const AccountId& id) const {
    auto it = underwriters_.find(id);
    if (it == underwriters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UnderwriterPool::IsRegistered(const AccountId& id) const {
    return underwriters_.count(id) > 0;
}

std::optional<VenueStake> UnderwriterPool::GetVenueStake(VenueId venueId,
                                                         const AccountId& id) const {
    auto it = venueStakes_.find({venueId, id});
    if (it == venueStakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AccountId> UnderwriterPool::GetRoster(VenueId venueId) const {
    auto it = assignments_.find(venueId);
    if (it == assignments_.end()) {
        return {};
    }
    return it->second.roster;
}

std::optional<VenueAssignment> UnderwriterPool::GetAssignment(VenueId venueId) const {
    auto it = assignments_.find(venueId);
    if (it == assignments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UnderwriterPool::IsVenueMatured(VenueId venueId) const {
    auto it = assignments_.find(venueId);
    return it != assignments_.end() && util::GetTime() >= it->second.endDate;
}

Amount UnderwriterPool::GetTotalLocked() const {
    Amount total = 0;
    for (const auto& [id, u] : underwriters_) {
        total += u.lockedStake;
    }
    return total;
}

// ============================================================================
// Persistence
// ============================================================================

PoolSnapshot UnderwriterPool::ExportState() const {
    PoolSnapshot snapshot;
    snapshot.underwriters = underwriters_;
    snapshot.assignments = assignments_;
    snapshot.venueStakes = venueStakes_;
    return snapshot;
}

void UnderwriterPool::ImportState(const PoolSnapshot& snapshot) {
    if (entered_ || journal_.InScope()) {
        throw StateError("cannot import pool state during an operation");
    }
    underwriters_ = snapshot.underwriters;
    assignments_ = snapshot.assignments;
    venueStakes_ = snapshot.venueStakes;
    LOG_INFO(LogCategory::POOL) << "imported " << underwriters_.size() << " underwriters, "
                                << assignments_.size() << " assignments";
}

} // namespace guarantee
} // namespace revguard
