// REVGUARD - Scenario Runner
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/sim/scenario.h"
#include "revguard/guarantee/errors.h"
#include "revguard/util/logging.h"
#include "revguard/util/time.h"

#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>

namespace revguard {
namespace sim {

namespace LogCategory = util::LogCategory;
using namespace guarantee;

namespace {

/// Label of the pool's custody account
const char* const POOL_LABEL = "revguard-pool";

std::vector<std::string> Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        if (token[0] == '#') {
            break;
        }
        tokens.push_back(token);
    }
    return tokens;
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() != count) {
        throw ScenarioError(std::string("usage: ") + usage);
    }
}

ErrorKind ParseErrorKind(const std::string& text) {
    static const ErrorKind kinds[] = {
        ErrorKind::Authorization, ErrorKind::NotVenueOwner, ErrorKind::NotFound,
        ErrorKind::State, ErrorKind::InsufficientResource, ErrorKind::Transfer,
        ErrorKind::Validation, ErrorKind::NoShortfall,
    };
    for (ErrorKind kind : kinds) {
        if (text == ErrorKindToString(kind)) {
            return kind;
        }
    }
    throw ScenarioError("unknown error kind '" + text + "'");
}

uint32_t ParseMonth(const std::string& text) {
    Amount value = ParseAmount(text);
    if (value > static_cast<Amount>(UINT32_MAX)) {
        throw ScenarioError("month out of range: " + text);
    }
    return static_cast<uint32_t>(value);
}

bool ParseFlag(const std::string& text) {
    if (text == "1" || text == "true") return true;
    if (text == "0" || text == "false") return false;
    throw ScenarioError("expected 0 or 1, got '" + text + "'");
}

} // namespace

Amount ParseAmount(const std::string& text) {
    if (text.empty() || text.size() > 18) {
        throw ScenarioError("invalid amount '" + text + "'");
    }
    Amount value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ScenarioError("invalid amount '" + text + "'");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

// ============================================================================
// Scenario
// ============================================================================

Scenario::Scenario(const ProtocolParams& params, const std::string& adminLabel,
                   std::ostream& out)
    : params_(params)
    , admin_(AccountIdFromLabel(adminLabel))
    , out_(out)
    , token_(journal_) {
    labels_[admin_] = adminLabel;
    labels_[params_.treasury] = "treasury";
    AccountId poolAddress = AccountIdFromLabel(POOL_LABEL);
    labels_[poolAddress] = "pool";
    pool_ = std::make_unique<UnderwriterPool>(poolAddress, registry_, token_, journal_, params_);
}

GuaranteeEngine& Scenario::Engine(VenueId venueId) {
    auto it = venues_.find(venueId);
    if (it == venues_.end()) {
        throw ScenarioError("no engine for venue " + std::to_string(venueId));
    }
    return *it->second.engine;
}

std::vector<VenueId> Scenario::Venues() const {
    std::vector<VenueId> ids;
    ids.reserve(venues_.size());
    for (const auto& [id, ctx] : venues_) {
        ids.push_back(id);
    }
    return ids;
}

AccountId Scenario::Account(const std::string& label) {
    AccountId id = AccountIdFromLabel(label);
    labels_.emplace(id, label);
    return id;
}

void Scenario::Allow(const AccountId& owner, const AccountId& spender, Amount amount) {
    if (amount <= 0) {
        return;
    }
    token_.Approve(owner, spender, token_.Allowance(owner, spender) + amount);
}

VenueId Scenario::CreateVenue(const AccountId& owner, Amount promised, uint32_t months) {
    std::string prefix = "venue-" + std::to_string(venues_.size() + 1);
    AccountId engineAddress = Account(prefix + "/engine");
    AccountId vaultAddress = Account(prefix + "/vault");

    VenueContext ctx;
    ctx.vault = std::make_shared<RevenueVault>(vaultAddress, promised, months, journal_);
    VenueId id = registry_.RegisterVenue(owner, ctx.vault, engineAddress);
    ctx.roles = std::make_unique<RoleConfig>(admin_);
    ctx.engine = std::make_unique<GuaranteeEngine>(id, engineAddress, *ctx.roles, registry_,
                                                   *pool_, token_, journal_, params_);
    venues_.emplace(id, std::move(ctx));
    return id;
}

void Scenario::Execute(const std::string& line) {
    std::vector<std::string> args = Tokenize(line);
    if (args.empty()) {
        return;
    }
    Journal::Scope scope(journal_);
    Dispatch(args);
    scope.Commit();
}

ScriptResult Scenario::Run(std::istream& in) {
    ScriptResult result;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (Tokenize(line).empty()) {
            continue;
        }
        try {
            Execute(line);
        } catch (const ScenarioError& e) {
            result.success = false;
            result.failedLine = lineNo;
            result.error = e.what();
        } catch (const GuaranteeError& e) {
            result.success = false;
            result.failedLine = lineNo;
            result.error = std::string(ErrorKindToString(e.Kind())) + ": " + e.what();
        }
        if (!result.success) {
            LOG_ERROR(LogCategory::SIM) << "line " << lineNo << ": " << result.error;
            return result;
        }
        ++result.commands;
    }
    return result;
}

void Scenario::Dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    LOG_DEBUG(LogCategory::SIM) << "> " << cmd;

    // ------------------------------------------------------------------------
    // Setup
    // ------------------------------------------------------------------------
    if (cmd == "mint") {
        RequireArgs(args, 3, "mint <account> <amount>");
        token_.Mint(Account(args[1]), ParseAmount(args[2]));
    } else if (cmd == "venue") {
        RequireArgs(args, 4, "venue <owner> <promised-revenue> <months>");
        VenueId id = CreateVenue(Account(args[1]), ParseAmount(args[2]), ParseMonth(args[3]));
        out_ << "venue " << id << "\n";
    } else if (cmd == "advance") {
        RequireArgs(args, 2, "advance <seconds | Nd>");
        if (!util::IsMockTimeEnabled()) {
            throw ScenarioError("advance needs mock time");
        }
        std::string text = args[1];
        int64_t multiplier = 1;
        if (!text.empty() && text.back() == 'd') {
            text.pop_back();
            multiplier = util::SECONDS_PER_DAY;
        }
        util::AdvanceMockTime(util::Seconds(ParseAmount(text) * multiplier));

    // ------------------------------------------------------------------------
    // Pool
    // ------------------------------------------------------------------------
    } else if (cmd == "register") {
        RequireArgs(args, 3, "register <account> <amount>");
        AccountId account = Account(args[1]);
        Amount amount = ParseAmount(args[2]);
        Allow(account, AccountIdFromLabel(POOL_LABEL), amount);
        pool_->Register(account, amount);
    } else if (cmd == "assign") {
        if (args.size() < 4) {
            throw ScenarioError("usage: assign <owner> <venue> <fee> <account>:<amount>...");
        }
        AccountId owner = Account(args[1]);
        VenueId venueId = static_cast<VenueId>(ParseAmount(args[2]));
        Amount fee = ParseAmount(args[3]);
        std::vector<StakeCommitment> commitments;
        for (size_t i = 4; i < args.size(); ++i) {
            size_t colon = args[i].find(':');
            if (colon == std::string::npos) {
                throw ScenarioError("expected <account>:<amount>, got '" + args[i] + "'");
            }
            commitments.push_back(StakeCommitment{Account(args[i].substr(0, colon)),
                                                  ParseAmount(args[i].substr(colon + 1))});
        }
        Allow(owner, AccountIdFromLabel(POOL_LABEL), fee);
        pool_->AssignToVenue(owner, venueId, commitments, fee);
    } else if (cmd == "withdraw") {
        RequireArgs(args, 3, "withdraw <account> <amount>");
        pool_->Withdraw(Account(args[1]), ParseAmount(args[2]));
    } else if (cmd == "pool-claim") {
        RequireArgs(args, 3, "pool-claim <venue> <account>");
        FeePayout payout = pool_->ClaimFee(Account(args[2]),
                                           static_cast<VenueId>(ParseAmount(args[1])));
        out_ << "released " << payout.released << " fee " << payout.net << "\n";

    // ------------------------------------------------------------------------
    // Engine
    // ------------------------------------------------------------------------
    } else if (cmd == "add-operator" || cmd == "remove-operator") {
        RequireArgs(args, 4, "add-operator|remove-operator <venue> <admin> <account>");
        GuaranteeEngine& engine = Engine(static_cast<VenueId>(ParseAmount(args[1])));
        if (cmd == "add-operator") {
            engine.AddOperator(Account(args[2]), Account(args[3]));
        } else {
            engine.RemoveOperator(Account(args[2]), Account(args[3]));
        }
    } else if (cmd == "set-fee") {
        RequireArgs(args, 4, "set-fee <venue> <owner> <amount>");
        Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .SetFeeAmount(Account(args[2]), ParseAmount(args[3]));
    } else if (cmd == "deposit-fee") {
        RequireArgs(args, 3, "deposit-fee <venue> <owner>");
        VenueId venueId = static_cast<VenueId>(ParseAmount(args[1]));
        GuaranteeEngine& engine = Engine(venueId);
        AccountId owner = Account(args[2]);
        Allow(owner, registry_.GuaranteeOf(venueId), engine.GetFeeAmount());
        engine.DepositFee(owner);
    } else if (cmd == "add-underwriter") {
        RequireArgs(args, 5, "add-underwriter <venue> <operator> <account> <stake>");
        Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .AddUnderwriter(Account(args[2]), Account(args[3]), ParseAmount(args[4]));
    } else if (cmd == "approve-underwriter") {
        RequireArgs(args, 5, "approve-underwriter <venue> <operator> <account> <0|1>");
        Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .SetUnderwriterApproval(Account(args[2]), Account(args[3]), ParseFlag(args[4]));
    } else if (cmd == "report") {
        RequireArgs(args, 4, "report <venue> <operator> <actual-revenue>");
        uint32_t month = Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .SubmitMonthlyReport(Account(args[2]), ParseAmount(args[3]));
        out_ << "month " << month << " reported\n";
    } else if (cmd == "liability") {
        RequireArgs(args, 4, "liability <venue> <operator> <month>");
        SettlementResult result = Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .ProcessLiability(Account(args[2]), ParseMonth(args[3]));
        out_ << "settled " << result.distributed << " of " << result.missingAmount
             << " residual " << result.residual << "\n";
    } else if (cmd == "owner-deposit") {
        RequireArgs(args, 5, "owner-deposit <venue> <owner> <month> <amount>");
        VenueId venueId = static_cast<VenueId>(ParseAmount(args[1]));
        AccountId owner = Account(args[2]);
        Amount amount = ParseAmount(args[4]);
        Allow(owner, registry_.GuaranteeOf(venueId), amount);
        Engine(venueId).OwnerDepositRevenue(owner, ParseMonth(args[3]), amount);
    } else if (cmd == "distribute") {
        RequireArgs(args, 3, "distribute <venue> <operator>");
        Engine(static_cast<VenueId>(ParseAmount(args[1]))).DistributeFees(Account(args[2]));
    } else if (cmd == "claim") {
        RequireArgs(args, 3, "claim <venue> <account>");
        FeePayout payout = Engine(static_cast<VenueId>(ParseAmount(args[1])))
            .ClaimFee(Account(args[2]));
        out_ << "claimed " << payout.net << " (cut " << payout.protocolCut << ")\n";

    // ------------------------------------------------------------------------
    // Assertions and listings
    // ------------------------------------------------------------------------
    } else if (cmd == "expect") {
        if (args.size() < 3) {
            throw ScenarioError("usage: expect <ErrorKind> <command...>");
        }
        ErrorKind expected = ParseErrorKind(args[1]);
        bool failed = false;
        try {
            Journal::Scope attempt(journal_);
            Dispatch(std::vector<std::string>(args.begin() + 2, args.end()));
            attempt.Commit();
        } catch (const GuaranteeError& e) {
            if (e.Kind() != expected) {
                throw ScenarioError(std::string("expected ") + ErrorKindToString(expected) +
                                    ", got " + ErrorKindToString(e.Kind()) + ": " + e.what());
            }
            LOG_DEBUG(LogCategory::SIM) << "expected failure: " << e.what();
            failed = true;
        }
        if (!failed) {
            throw ScenarioError(std::string("expected ") + ErrorKindToString(expected) +
                                ", but '" + args[2] + "' succeeded");
        }
    } else if (cmd == "expect-stake") {
        RequireArgs(args, 5, "expect-stake <account> <total> <available> <locked>");
        auto uw = pool_->GetUnderwriter(Account(args[1]));
        Amount total = ParseAmount(args[2]);
        Amount available = ParseAmount(args[3]);
        Amount locked = ParseAmount(args[4]);
        if (!uw || uw->totalStake != total || uw->availableStake != available ||
            uw->lockedStake != locked) {
            std::ostringstream oss;
            oss << args[1] << ": expected " << total << "/" << available << "/" << locked;
            if (uw) {
                oss << ", got " << uw->totalStake << "/" << uw->availableStake << "/"
                    << uw->lockedStake;
            } else {
                oss << ", not registered";
            }
            throw ScenarioError(oss.str());
        }
    } else if (cmd == "expect-balance") {
        RequireArgs(args, 3, "expect-balance <account> <amount>");
        Amount expected = ParseAmount(args[2]);
        Amount actual = token_.BalanceOf(Account(args[1]));
        if (actual != expected) {
            throw ScenarioError(args[1] + ": expected balance " + std::to_string(expected) +
                                ", got " + std::to_string(actual));
        }
    } else if (cmd == "summary") {
        RequireArgs(args, 2, "summary <venue>");
        PrintSummary(static_cast<VenueId>(ParseAmount(args[1])));
    } else if (cmd == "stakes") {
        RequireArgs(args, 1, "stakes");
        PrintStakes();
    } else {
        throw ScenarioError("unknown command '" + cmd + "'");
    }
}

void Scenario::PrintSummary(VenueId venueId) {
    GuaranteeEngine& engine = Engine(venueId);
    PerformanceSummary summary = engine.GetPerformanceSummary();
    out_ << "venue " << venueId
         << " state=" << EngineStateToString(engine.GetState())
         << " month=" << engine.GetCurrentMonth()
         << " expected=" << summary.totalExpected
         << " collected=" << summary.totalCollected
         << " shortfall=" << summary.totalShortfall
         << " liability=" << summary.totalLiabilityPaid
         << " escrow=" << engine.GetEscrowBalance()
         << " deposits=" << engine.GetTotalOwnerDeposits() << "\n";
}

void Scenario::PrintStakes() {
    PoolSnapshot snapshot = pool_->ExportState();
    for (const auto& [id, uw] : snapshot.underwriters) {
        auto label = labels_.find(id);
        out_ << (label != labels_.end() ? label->second : id.ToShortHex())
             << " total=" << uw.totalStake
             << " available=" << uw.availableStake
             << " locked=" << uw.lockedStake << "\n";
    }
}

} // namespace sim
} // namespace revguard
