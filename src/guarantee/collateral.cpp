// REVGUARD - In-Memory Collateral Token
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/collateral.h"
#include "revguard/guarantee/errors.h"
#include "revguard/util/logging.h"

namespace revguard {
namespace guarantee {

namespace LogCategory = util::LogCategory;

CollateralToken::CollateralToken(Journal& journal) : journal_(journal) {}

void CollateralToken::Mint(const AccountId& to, Amount amount) {
    if (amount <= 0 || !MoneyRange(totalSupply_ + amount)) {
        throw ValidationError("mint amount out of range");
    }
    journal_.SaveEntry(balances_, to);
    balances_[to] += amount;
    journal_.Assign(totalSupply_, totalSupply_ + amount);
    LOG_DEBUG(LogCategory::ASSET) << "minted " << amount << " to " << to.ToShortHex();
}

void CollateralToken::Approve(const AccountId& owner, const AccountId& spender, Amount amount) {
    if (amount < 0) {
        throw ValidationError("allowance must not be negative");
    }
    auto key = std::make_pair(owner, spender);
    journal_.SaveEntry(allowances_, key);
    allowances_[key] = amount;
}

Amount CollateralToken::Allowance(const AccountId& owner, const AccountId& spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

Amount CollateralToken::BalanceOf(const AccountId& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool CollateralToken::Move(const AccountId& from, const AccountId& to, Amount amount) {
    if (amount <= 0 || BalanceOf(from) < amount) {
        LOG_DEBUG(LogCategory::ASSET) << "refused move of " << amount << " from "
                                      << from.ToShortHex() << " (balance " << BalanceOf(from) << ")";
        return false;
    }
    journal_.SaveEntry(balances_, from);
    balances_[from] -= amount;
    journal_.SaveEntry(balances_, to);
    balances_[to] += amount;
    return true;
}

bool CollateralToken::TransferFrom(const AccountId& spender, const AccountId& from,
                                   const AccountId& to, Amount amount) {
    auto key = std::make_pair(from, spender);
    Amount allowed = Allowance(from, spender);
    if (allowed < amount) {
        LOG_DEBUG(LogCategory::ASSET) << "allowance of " << spender.ToShortHex() << " over "
                                      << from.ToShortHex() << " is " << allowed
                                      << ", needs " << amount;
        return false;
    }
    if (!Move(from, to, amount)) {
        return false;
    }
    journal_.SaveEntry(allowances_, key);
    allowances_[key] = allowed - amount;
    return true;
}

bool CollateralToken::Transfer(const AccountId& from, const AccountId& to, Amount amount) {
    return Move(from, to, amount);
}

} // namespace guarantee
} // namespace revguard
