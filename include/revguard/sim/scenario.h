// REVGUARD - Scenario Runner
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Drives the pool and engines from a line-oriented script. Accounts are
// written as labels and mapped with AccountIdFromLabel. Commands:
//
//   mint <account> <amount>
//   venue <owner> <promised-revenue> <months>           (prints the venue id)
//   register <account> <amount>
//   assign <owner> <venue> <fee> <account>:<amount>...
//   withdraw <account> <amount>
//   pool-claim <venue> <account>                        (pool fee claim)
//   add-operator <venue> <admin> <account>
//   remove-operator <venue> <admin> <account>
//   set-fee <venue> <owner> <amount>
//   deposit-fee <venue> <owner>
//   add-underwriter <venue> <operator> <account> <stake>
//   approve-underwriter <venue> <operator> <account> <0|1>
//   report <venue> <operator> <actual-revenue>
//   liability <venue> <operator> <month>
//   owner-deposit <venue> <owner> <month> <amount>
//   distribute <venue> <operator>
//   claim <venue> <account>                             (engine fee claim)
//   advance <seconds | Nd>                              (mock time)
//   expect <ErrorKind> <command...>
//   expect-stake <account> <total> <available> <locked>
//   expect-balance <account> <amount>
//   summary <venue>
//   stakes

#ifndef REVGUARD_SIM_SCENARIO_H
#define REVGUARD_SIM_SCENARIO_H

#include "revguard/guarantee/collateral.h"
#include "revguard/guarantee/engine.h"
#include "revguard/guarantee/journal.h"
#include "revguard/guarantee/params.h"
#include "revguard/guarantee/pool.h"
#include "revguard/guarantee/registry.h"

#include <iosfwd>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace revguard {
namespace sim {

/// Malformed script line or failed expectation
class ScenarioError : public std::runtime_error {
public:
    explicit ScenarioError(const std::string& message) : std::runtime_error(message) {}
};

/// Outcome of running a script
struct ScriptResult {
    bool success{true};
    size_t commands{0};
    int failedLine{0};
    std::string error;
};

class Scenario {
public:
    /**
     * @param params     Protocol parameters shared by the pool and every engine
     * @param adminLabel Label of the admin of every engine
     * @param out        Destination of summary and stake listings
     */
    Scenario(const guarantee::ProtocolParams& params, const std::string& adminLabel,
             std::ostream& out);

    Scenario(const Scenario&) = delete;
    Scenario& operator=(const Scenario&) = delete;

    /// Execute one command; blank lines and # comments are ignored
    void Execute(const std::string& line);

    /// Execute a script, stopping at the first failing line
    ScriptResult Run(std::istream& in);

    guarantee::UnderwriterPool& Pool() { return *pool_; }
    guarantee::CollateralToken& Token() { return token_; }
    guarantee::VenueRegistry& Registry() { return registry_; }

    /// Engine of a venue created by the script; throws ScenarioError if unknown
    guarantee::GuaranteeEngine& Engine(VenueId venueId);

    std::vector<VenueId> Venues() const;

private:
    void Dispatch(const std::vector<std::string>& args);

    VenueId CreateVenue(const AccountId& owner, Amount promised, uint32_t months);

    /// Grant `spender` an additional allowance over `owner`'s balance
    void Allow(const AccountId& owner, const AccountId& spender, Amount amount);

    /// Map a label to its account and remember it for listings
    AccountId Account(const std::string& label);

    void PrintSummary(VenueId venueId);
    void PrintStakes();

    struct VenueContext {
        std::shared_ptr<guarantee::RevenueVault> vault;
        std::unique_ptr<guarantee::RoleConfig> roles;
        std::unique_ptr<guarantee::GuaranteeEngine> engine;
    };

    guarantee::ProtocolParams params_;
    AccountId admin_;
    std::ostream& out_;

    guarantee::Journal journal_;
    guarantee::CollateralToken token_;
    guarantee::VenueRegistry registry_;
    std::unique_ptr<guarantee::UnderwriterPool> pool_;
    std::map<VenueId, VenueContext> venues_;
    std::map<AccountId, std::string> labels_;
};

/// Parse a non-negative decimal amount; throws ScenarioError
Amount ParseAmount(const std::string& text);

} // namespace sim
} // namespace revguard

#endif // REVGUARD_SIM_SCENARIO_H
