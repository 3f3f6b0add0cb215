// REVGUARD - Protocol Parameters
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#ifndef REVGUARD_GUARANTEE_PARAMS_H
#define REVGUARD_GUARANTEE_PARAMS_H

#include "revguard/core/types.h"
#include "revguard/util/config.h"

#include <set>
#include <string>
#include <vector>

namespace revguard {
namespace guarantee {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Length of one reporting period (30 days)
constexpr int64_t DEFAULT_PERIOD_LENGTH = 30 * 24 * 60 * 60;

/// Protocol cut of every fee payout, in basis points (10%)
constexpr int64_t DEFAULT_PROTOCOL_FEE_BPS = 1000;

/// Label the default treasury identity is derived from
constexpr const char* DEFAULT_TREASURY_LABEL = "revguard-treasury";

/// Setting keys of the protocol parameters ([protocol] section)
constexpr const char* PERIOD_LENGTH_KEY = "protocol.periodlength";
constexpr const char* PROTOCOL_FEE_KEY = "protocol.protocolfeebps";
constexpr const char* TREASURY_KEY = "protocol.treasury";

/**
 * Parameters shared by every pool and engine instance.
 */
struct ProtocolParams {
    /// Seconds per reporting period
    int64_t periodLength{DEFAULT_PERIOD_LENGTH};

    /// Protocol cut of fee payouts
    int64_t protocolFeeBps{DEFAULT_PROTOCOL_FEE_BPS};

    /// Receives the protocol cut
    AccountId treasury{AccountIdFromLabel(DEFAULT_TREASURY_LABEL)};

    /// Protocol share of a gross fee payout, rounded down
    Amount ProtocolCut(Amount gross) const {
        return MulDiv(gross, protocolFeeBps, BPS_DENOMINATOR);
    }

    /// Seconds covered by `months` periods
    int64_t Duration(uint32_t months) const {
        return static_cast<int64_t>(months) * periodLength;
    }
};

/**
 * Read the `[protocol]` settings over `params`. On a malformed or
 * out-of-range value `params` is left untouched and the result names
 * where the value came from.
 */
util::ConfigResult LoadProtocolParams(const util::Settings& settings, ProtocolParams& params);

// ============================================================================
// Roles
// ============================================================================

/**
 * Engine roles. The admin is fixed at construction and is always an
 * operator.
 */
class RoleConfig {
public:
    explicit RoleConfig(const AccountId& admin);

    const AccountId& Admin() const { return admin_; }

    bool IsAdmin(const AccountId& account) const { return account == admin_; }

    bool IsOperator(const AccountId& account) const;

    /// Returns false if already an operator
    bool AddOperator(const AccountId& account);

    /// Returns false if not an operator; the admin cannot be removed
    bool RemoveOperator(const AccountId& account);

    std::vector<AccountId> Operators() const;

private:
    AccountId admin_;
    std::set<AccountId> operators_;
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_PARAMS_H
