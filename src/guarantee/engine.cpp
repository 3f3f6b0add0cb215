// REVGUARD - Venue Guarantee Engine Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/engine.h"
#include "revguard/util/logging.h"
#include "revguard/util/time.h"

#include <algorithm>
#include <string>
#include <type_traits>

namespace revguard {
namespace guarantee {

namespace LogCategory = util::LogCategory;

const char* EngineStateToString(EngineState state) {
    switch (state) {
        case EngineState::Assembling:      return "Assembling";
        case EngineState::Reporting:       return "Reporting";
        case EngineState::Matured:         return "Matured";
        case EngineState::FeesDistributed: return "FeesDistributed";
        default:                           return "Unknown";
    }
}

// ============================================================================
// Construction and helpers
// ============================================================================

GuaranteeEngine::GuaranteeEngine(VenueId venueId,
                                 const AccountId& address,
                                 RoleConfig& roles,
                                 IVenueRegistry& registry,
                                 UnderwriterPool& pool,
                                 ICollateralAsset& asset,
                                 Journal& journal,
                                 const ProtocolParams& params)
    : venueId_(venueId)
    , address_(address)
    , roles_(roles)
    , registry_(registry)
    , pool_(pool)
    , asset_(asset)
    , journal_(journal)
    , params_(params)
    , startTime_(util::GetTime()) {
    if (!registry_.VenueExists(venueId_)) {
        throw NotFoundError("unknown venue " + std::to_string(venueId_));
    }
    LOG_INFO(LogCategory::ENGINE) << "guarantee engine " << address_.ToShortHex()
                                  << " created for venue " << venueId_;
}

template<typename Fn>
auto GuaranteeEngine::Execute(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        ReentrancyGuard guard(entered_, "GuaranteeEngine");
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
        LOG_DEBUG(LogCategory::ENGINE) << "venue " << venueId_ << " " << operation
                                       << " rejected [" << ErrorKindToString(e.Kind())
                                       << "]: " << e.what();
        throw;
    }
}

void GuaranteeEngine::RequireAdmin(const AccountId& caller) const {
    if (!roles_.IsAdmin(caller)) {
        throw AuthorizationError("caller is not the admin");
    }
}

void GuaranteeEngine::RequireOperator(const AccountId& caller) const {
    if (!roles_.IsOperator(caller)) {
        throw AuthorizationError("caller is not an operator");
    }
}

void GuaranteeEngine::RequireOwner(const AccountId& caller) const {
    if (registry_.OwnerOf(venueId_) != caller) {
        throw NotVenueOwnerError("caller does not own venue " + std::to_string(venueId_));
    }
}

void GuaranteeEngine::RequireActive(const char* what) const {
    if (feesDistributed_) {
        throw StateError(std::string(what) + " after fees were distributed");
    }
}

std::vector<EngineUnderwriter>::iterator GuaranteeEngine::FindMember(const AccountId& account) {
    return std::find_if(roster_.begin(), roster_.end(),
                        [&account](const EngineUnderwriter& m) { return m.address == account; });
}

FeePayout GuaranteeEngine::ComputeFeeShare(Amount stake) const {
    FeePayout payout;
    if (totalStake_ > 0) {
        payout.gross = MulDiv(escrowDeposited_, stake, totalStake_);
    }
    payout.protocolCut = params_.ProtocolCut(payout.gross);
    payout.net = payout.gross - payout.protocolCut;
    return payout;
}

void GuaranteeEngine::PayFeeShare(const AccountId& member, const FeePayout& payout) {
    if (payout.gross > escrowBalance_) {
        throw InsufficientResourceError("fee share exceeds escrow balance");
    }
    if (payout.net > 0 && !asset_.Transfer(address_, member, payout.net)) {
        throw TransferError("collateral transfer failed: fee payout");
    }
    if (payout.protocolCut > 0 &&
        !asset_.Transfer(address_, params_.treasury, payout.protocolCut)) {
        throw TransferError("collateral transfer failed: protocol cut");
    }
    journal_.Assign(escrowBalance_, escrowBalance_ - payout.gross);
}

bool GuaranteeEngine::AllApprovedClaimed() const {
    return std::all_of(roster_.begin(), roster_.end(), [](const EngineUnderwriter& m) {
        return !m.approved || m.feeClaimed;
    });
}

// ============================================================================
// Role management
// ============================================================================

void GuaranteeEngine::AddOperator(const AccountId& caller, const AccountId& account) {
    Execute("AddOperator", [&]() {
        RequireAdmin(caller);
        if (!roles_.AddOperator(account)) {
            throw StateError("account " + account.ToShortHex() + " is already an operator");
        }
        journal_.Record([this, account]() { roles_.RemoveOperator(account); });
        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": operator "
                                      << account.ToShortHex() << " added";
    });
}

void GuaranteeEngine::RemoveOperator(const AccountId& caller, const AccountId& account) {
    Execute("RemoveOperator", [&]() {
        RequireAdmin(caller);
        if (roles_.IsAdmin(account)) {
            throw ValidationError("the admin cannot be removed from the operators");
        }
        if (!roles_.RemoveOperator(account)) {
            throw NotFoundError("account " + account.ToShortHex() + " is not an operator");
        }
        journal_.Record([this, account]() { roles_.AddOperator(account); });
        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": operator "
                                      << account.ToShortHex() << " removed";
    });
}

// ============================================================================
// Fee escrow
// ============================================================================

void GuaranteeEngine::SetFeeAmount(const AccountId& caller, Amount amount) {
    Execute("SetFeeAmount", [&]() {
        RequireOwner(caller);
        if (feeDeposited_) {
            throw StateError("fee already deposited");
        }
        if (amount < 0 || !MoneyRange(amount)) {
            throw ValidationError("fee amount out of range");
        }
        journal_.Assign(feeAmount_, amount);
        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": fee set to " << amount;
    });
}

void GuaranteeEngine::DepositFee(const AccountId& caller) {
    Execute("DepositFee", [&]() {
        RequireOwner(caller);
        RequireActive("fee deposit");
        if (feeAmount_ <= 0) {
            throw ValidationError("no fee configured");
        }
        if (roster_.empty()) {
            throw StateError("roster is empty");
        }
        if (feeDeposited_) {
            throw StateError("fee already deposited");
        }

        if (!asset_.TransferFrom(address_, caller, address_, feeAmount_)) {
            throw TransferError("collateral transfer failed: fee deposit");
        }
        journal_.Assign(feeDeposited_, true);
        journal_.Assign(escrowDeposited_, feeAmount_);
        journal_.Assign(escrowBalance_, escrowBalance_ + feeAmount_);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": fee escrow funded with "
                                      << feeAmount_;
    });
}

// ============================================================================
// Roster
// ============================================================================

void GuaranteeEngine::AddUnderwriter(const AccountId& caller, const AccountId& account,
                                     Amount stake) {
    Execute("AddUnderwriter", [&]() {
        RequireOperator(caller);
        RequireActive("roster change");
        // Fee shares are computed against totalStake_; it is fixed once the escrow is funded
        if (feeDeposited_) {
            throw StateError("roster is closed once the fee is deposited");
        }
        if (!pool_.IsRegistered(account)) {
            throw AuthorizationError("account " + account.ToShortHex() +
                                     " is not registered in the pool");
        }
        if (FindMember(account) != roster_.end()) {
            throw StateError("account " + account.ToShortHex() + " is already on the roster");
        }
        if (stake <= 0 || !MoneyRange(stake) || !MoneyRange(totalStake_ + stake)) {
            throw ValidationError("stake must be positive and in range");
        }

        journal_.Record([this, old = roster_]() { roster_ = old; });
        roster_.push_back(EngineUnderwriter{account, stake, true, false});
        journal_.Assign(totalStake_, totalStake_ + stake);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": underwriter "
                                      << account.ToShortHex() << " added with stake " << stake
                                      << " (total " << totalStake_ << ")";
    });
}

void GuaranteeEngine::SetUnderwriterApproval(const AccountId& caller, const AccountId& account,
                                             bool approved) {
    Execute("SetUnderwriterApproval", [&]() {
        RequireOperator(caller);
        // Still allowed after distribution so a skipped member can be approved and claim
        auto it = FindMember(account);
        if (it == roster_.end()) {
            throw NotFoundError("account " + account.ToShortHex() + " is not on the roster");
        }
        if (it->feeClaimed) {
            throw StateError("fee of " + account.ToShortHex() + " already paid");
        }

        journal_.Record([this, old = roster_]() { roster_ = old; });
        it->approved = approved;

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": underwriter "
                                      << account.ToShortHex()
                                      << (approved ? " approved" : " unapproved");
    });
}

// ============================================================================
// Reporting and settlement
// ============================================================================

uint32_t GuaranteeEngine::SubmitMonthlyReport(const AccountId& caller, Amount actualRevenue) {
    return Execute("SubmitMonthlyReport", [&]() {
        RequireOperator(caller);
        RequireActive("report");
        if (actualRevenue < 0 || !MoneyRange(actualRevenue)) {
            throw ValidationError("actual revenue out of range");
        }

        const Amount expected = registry_.VaultOf(venueId_).PromisedRevenue();

        MonthlyReport report;
        report.month = currentMonth_;
        report.expectedRevenue = expected;
        report.actualRevenue = actualRevenue;
        report.missingRevenue = std::max<Amount>(0, expected - actualRevenue);
        report.timestamp = util::GetTime();

        journal_.SaveEntry(reports_, report.month);
        reports_[report.month] = report;
        journal_.Assign(totalExpected_, totalExpected_ + expected);
        journal_.Assign(totalCollected_, totalCollected_ + actualRevenue);
        journal_.Assign(currentMonth_, currentMonth_ + 1);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << " month " << report.month
                                      << ": expected=" << expected << " actual=" << actualRevenue
                                      << " missing=" << report.missingRevenue;
        return report.month;
    });
}

SettlementResult GuaranteeEngine::ProcessLiability(const AccountId& caller, uint32_t month) {
    return Execute("ProcessLiability", [&]() {
        RequireOperator(caller);
        RequireActive("liability settlement");

        auto it = reports_.find(month);
        if (it == reports_.end()) {
            throw NotFoundError("no report for month " + std::to_string(month));
        }
        if (!it->second.HasShortfall()) {
            throw NoShortfallError("month " + std::to_string(month) + " has no shortfall");
        }
        if (it->second.liabilityPaid) {
            throw StateError("liability of month " + std::to_string(month) + " already paid");
        }

        const Amount missing = it->second.missingRevenue;
        journal_.SaveEntry(reports_, month);
        reports_[month].liabilityPaid = true;
        journal_.Assign(totalLiabilityPaid_, totalLiabilityPaid_ + missing);

        SettlementResult result = pool_.SettleLiability(address_, venueId_, missing);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << " month " << month
                                      << ": liability " << missing << " settled";
        return result;
    });
}

void GuaranteeEngine::OwnerDepositRevenue(const AccountId& caller, uint32_t month,
                                          Amount amount) {
    Execute("OwnerDepositRevenue", [&]() {
        RequireOwner(caller);
        if (month == 0) {
            throw ValidationError("month numbers start at 1");
        }
        if (amount <= 0 || !MoneyRange(amount)) {
            throw ValidationError("deposit amount must be positive");
        }

        IRevenueVault& vault = registry_.VaultOf(venueId_);
        if (!asset_.TransferFrom(address_, caller, vault.Address(), amount)) {
            throw TransferError("collateral transfer failed: owner deposit");
        }
        vault.OnOwnerDeposit(caller, month, amount);

        journal_.SaveEntry(ownerDeposits_, month);
        ownerDeposits_[month] += amount;
        journal_.Assign(totalOwnerDeposits_, totalOwnerDeposits_ + amount);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << " month " << month
                                      << ": owner deposited " << amount;
    });
}

// ============================================================================
// Fee distribution
// ============================================================================

void GuaranteeEngine::DistributeFees(const AccountId& caller) {
    Execute("DistributeFees", [&]() {
        RequireOperator(caller);
        if (feesDistributed_) {
            throw StateError("fees already distributed");
        }
        if (escrowBalance_ <= 0) {
            throw InsufficientResourceError("fee escrow is empty");
        }

        journal_.Record([this, old = roster_]() { roster_ = old; });
        Amount paid = 0;
        for (auto& member : roster_) {
            if (!member.approved || member.feeClaimed) {
                continue;
            }
            FeePayout payout = ComputeFeeShare(member.stake);
            PayFeeShare(member.address, payout);
            member.feeClaimed = true;
            paid += payout.gross;
            LOG_DEBUG(LogCategory::ENGINE) << "venue " << venueId_ << ": paid "
                                           << member.address.ToShortHex() << " " << payout.net
                                           << " (cut " << payout.protocolCut << ")";
        }
        journal_.Assign(feesDistributed_, true);

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": distributed " << paid
                                      << " of escrow, " << escrowBalance_ << " left";
    });
}

FeePayout GuaranteeEngine::ClaimFee(const AccountId& caller) {
    return Execute("ClaimFee", [&]() {
        auto it = FindMember(caller);
        if (it == roster_.end() || !it->approved) {
            throw AuthorizationError("caller is not an approved underwriter");
        }
        if (it->feeClaimed) {
            throw StateError("fee already claimed");
        }
        if (!IsMatured()) {
            throw StateError("guarantee of venue " + std::to_string(venueId_) +
                             " has not matured");
        }
        if (!feeDeposited_ || escrowBalance_ <= 0) {
            throw InsufficientResourceError("fee escrow is empty");
        }

        FeePayout payout = ComputeFeeShare(it->stake);
        PayFeeShare(caller, payout);

        journal_.Record([this, old = roster_]() { roster_ = old; });
        FindMember(caller)->feeClaimed = true;

        if (AllApprovedClaimed()) {
            journal_.Assign(feesDistributed_, true);
        }

        LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": "
                                      << caller.ToShortHex() << " claimed " << payout.net
                                      << " (cut " << payout.protocolCut << ")";
        return payout;
    });
}

// ============================================================================
// Queries
// ============================================================================

PerformanceSummary GuaranteeEngine::GetPerformanceSummary() const {
    PerformanceSummary summary;
    summary.totalExpected = totalExpected_;
    summary.totalCollected = totalCollected_;
    summary.totalShortfall = totalExpected_ - totalCollected_;
    summary.totalLiabilityPaid = totalLiabilityPaid_;
    return summary;
}

std::optional<MonthlyReport> GuaranteeEngine::GetReport(uint32_t month) const {
    auto it = reports_.find(month);
    if (it == reports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MonthlyReport> GuaranteeEngine::GetReports() const {
    std::vector<MonthlyReport> result;
    result.reserve(reports_.size());
    for (const auto& [month, report] : reports_) {
        result.push_back(report);
    }
    return result;
}

std::optional<EngineUnderwriter> GuaranteeEngine::GetUnderwriter(const AccountId& account) const {
    for (const auto& member : roster_) {
        if (member.address == account) {
            return member;
        }
    }
    return std::nullopt;
}

EngineState GuaranteeEngine::GetState() const {
    if (feesDistributed_) {
        return EngineState::FeesDistributed;
    }
    if (IsMatured()) {
        return EngineState::Matured;
    }
    if (currentMonth_ > 1 || feeDeposited_) {
        return EngineState::Reporting;
    }
    return EngineState::Assembling;
}

Timestamp GuaranteeEngine::GetMaturityTime() const {
    return startTime_ + params_.Duration(registry_.VaultOf(venueId_).TotalMonths());
}

bool GuaranteeEngine::IsMatured() const {
    return util::GetTime() >= GetMaturityTime();
}

Amount GuaranteeEngine::GetOwnerDeposits(uint32_t month) const {
    auto it = ownerDeposits_.find(month);
    return it == ownerDeposits_.end() ? 0 : it->second;
}

// ============================================================================
// Persistence
// ============================================================================

EngineSnapshot GuaranteeEngine::ExportState() const {
    EngineSnapshot s;
    s.venueId = venueId_;
    s.currentMonth = currentMonth_;
    s.startTime = startTime_;
    s.totalExpected = totalExpected_;
    s.totalCollected = totalCollected_;
    s.totalLiabilityPaid = totalLiabilityPaid_;
    s.roster = roster_;
    s.totalStake = totalStake_;
    s.feeAmount = feeAmount_;
    s.feeDeposited = feeDeposited_;
    s.escrowDeposited = escrowDeposited_;
    s.escrowBalance = escrowBalance_;
    s.feesDistributed = feesDistributed_;
    s.totalOwnerDeposits = totalOwnerDeposits_;
    s.ownerDeposits = ownerDeposits_;
    for (const auto& op : roles_.Operators()) {
        if (!roles_.IsAdmin(op)) {
            s.operators.push_back(op);
        }
    }
    s.reports = reports_;
    return s;
}

void GuaranteeEngine::ImportState(const EngineSnapshot& s) {
    if (entered_ || journal_.InScope()) {
        throw StateError("cannot import engine state during an operation");
    }
    if (s.venueId != venueId_) {
        throw ValidationError("snapshot belongs to venue " + std::to_string(s.venueId));
    }
    currentMonth_ = s.currentMonth;
    startTime_ = s.startTime;
    totalExpected_ = s.totalExpected;
    totalCollected_ = s.totalCollected;
    totalLiabilityPaid_ = s.totalLiabilityPaid;
    roster_ = s.roster;
    totalStake_ = s.totalStake;
    feeAmount_ = s.feeAmount;
    feeDeposited_ = s.feeDeposited;
    escrowDeposited_ = s.escrowDeposited;
    escrowBalance_ = s.escrowBalance;
    feesDistributed_ = s.feesDistributed;
    totalOwnerDeposits_ = s.totalOwnerDeposits;
    ownerDeposits_ = s.ownerDeposits;
    for (const auto& op : s.operators) {
        roles_.AddOperator(op);
    }
    reports_ = s.reports;
    LOG_INFO(LogCategory::ENGINE) << "venue " << venueId_ << ": imported state at month "
                                  << currentMonth_ << " (" << reports_.size() << " reports)";
}

} // namespace guarantee
} // namespace revguard
