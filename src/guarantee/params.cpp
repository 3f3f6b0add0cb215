// REVGUARD - Protocol Parameters
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/params.h"
#include "revguard/util/logging.h"

#include <stdexcept>

namespace revguard {
namespace guarantee {

// ============================================================================
// Protocol Parameters
// ============================================================================

util::ConfigResult LoadProtocolParams(const util::Settings& settings, ProtocolParams& params) {
    ProtocolParams loaded = params;

    if (settings.Has(PERIOD_LENGTH_KEY)) {
        auto value = settings.GetInt(PERIOD_LENGTH_KEY);
        if (!value || *value <= 0) {
            return util::ConfigResult::Fail(
                std::string(PERIOD_LENGTH_KEY) + " must be a positive number of seconds",
                settings.Origin(PERIOD_LENGTH_KEY));
        }
        loaded.periodLength = *value;
    }

    if (settings.Has(PROTOCOL_FEE_KEY)) {
        auto value = settings.GetInt(PROTOCOL_FEE_KEY);
        if (!value || *value < 0 || *value > BPS_DENOMINATOR) {
            return util::ConfigResult::Fail(
                std::string(PROTOCOL_FEE_KEY) + " must be between 0 and " +
                    std::to_string(BPS_DENOMINATOR),
                settings.Origin(PROTOCOL_FEE_KEY));
        }
        loaded.protocolFeeBps = *value;
    }

    if (auto treasury = settings.Get(TREASURY_KEY)) {
        if (treasury->empty()) {
            return util::ConfigResult::Fail(std::string(TREASURY_KEY) + " must not be empty",
                                            settings.Origin(TREASURY_KEY));
        }
        // A 40-digit hex string is taken as a raw identity, anything else as a label
        if (treasury->size() == AccountId::SIZE * 2) {
            try {
                loaded.treasury = AccountId::FromHex(*treasury);
            } catch (const std::invalid_argument&) {
                loaded.treasury = AccountIdFromLabel(*treasury);
            }
        } else {
            loaded.treasury = AccountIdFromLabel(*treasury);
        }
    }

    params = loaded;
    LOG_DEBUG(util::LogCategory::CONFIG)
        << "protocol params: periodlength=" << params.periodLength
        << " protocolfeebps=" << params.protocolFeeBps
        << " treasury=" << params.treasury.ToShortHex();
    return util::ConfigResult::Ok();
}

// ============================================================================
// RoleConfig
// ============================================================================

RoleConfig::RoleConfig(const AccountId& admin) : admin_(admin) {
    operators_.insert(admin);
}

bool RoleConfig::IsOperator(const AccountId& account) const {
    return operators_.count(account) > 0;
}

bool RoleConfig::AddOperator(const AccountId& account) {
    return operators_.insert(account).second;
}

bool RoleConfig::RemoveOperator(const AccountId& account) {
    if (account == admin_) {
        return false;
    }
    return operators_.erase(account) > 0;
}

std::vector<AccountId> RoleConfig::Operators() const {
    return std::vector<AccountId>(operators_.begin(), operators_.end());
}

} // namespace guarantee
} // namespace revguard
