// REVGUARD - In-Memory Collateral Token
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#ifndef REVGUARD_GUARANTEE_COLLATERAL_H
#define REVGUARD_GUARANTEE_COLLATERAL_H

#include "revguard/core/types.h"
#include "revguard/guarantee/interfaces.h"
#include "revguard/guarantee/journal.h"

#include <map>
#include <utility>

namespace revguard {
namespace guarantee {

/**
 * Fungible balance ledger with allowances. Balance changes are journaled so
 * that they roll back with the operation that caused them.
 */
class CollateralToken : public ICollateralAsset {
public:
    explicit CollateralToken(Journal& journal);

    /// Create `amount` new units for `to`
    void Mint(const AccountId& to, Amount amount);

    /// Let `spender` move up to `amount` of `owner`'s balance
    void Approve(const AccountId& owner, const AccountId& spender, Amount amount);

    Amount Allowance(const AccountId& owner, const AccountId& spender) const;

    Amount TotalSupply() const { return totalSupply_; }

    bool TransferFrom(const AccountId& spender, const AccountId& from,
                      const AccountId& to, Amount amount) override;

    bool Transfer(const AccountId& from, const AccountId& to, Amount amount) override;

    Amount BalanceOf(const AccountId& account) const override;

private:
    bool Move(const AccountId& from, const AccountId& to, Amount amount);

    Journal& journal_;
    std::map<AccountId, Amount> balances_;
    std::map<std::pair<AccountId, AccountId>, Amount> allowances_;
    Amount totalSupply_{0};
};

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_COLLATERAL_H
